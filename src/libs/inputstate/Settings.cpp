// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/Settings.hpp"

namespace KeyView::InputState {

using namespace Qt::StringLiterals;

QString capitalizationPolicyName(CapitalizationPolicy policy)
{
    switch (policy) {
        case CapitalizationPolicy::FollowCapsLock: return u"Follow"_s;
        case CapitalizationPolicy::ForceOn: return u"Upper"_s;
        case CapitalizationPolicy::ForceOff: return u"Lower"_s;
    }
    return u"Follow"_s;
}

std::optional<CapitalizationPolicy> capitalizationPolicyFromName(const QString& name)
{
    if (name == u"Follow"_s)
        return CapitalizationPolicy::FollowCapsLock;
    if (name == u"Upper"_s)
        return CapitalizationPolicy::ForceOn;
    if (name == u"Lower"_s)
        return CapitalizationPolicy::ForceOff;
    return std::nullopt;
}

const DisplayInfo* chooseDisplay(const QVector<DisplayInfo>& displays, const DisplayChoice& choice)
{
    if (displays.isEmpty())
        return nullptr;

    const DisplayInfo* primary = nullptr;
    for (const DisplayInfo& d : displays) {
        if (d.id == choice.id)
            return &d;
        if (d.primary && !primary)
            primary = &d;
    }
    return primary ? primary : &displays.front();
}

} // namespace KeyView::InputState
