// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "frame/FrameModel.hpp"

#include <algorithm>

Q_LOGGING_CATEGORY(framelog, "keyview.frame")

namespace KeyView::Frame {

QString editOverlayName(EditOverlay overlay)
{
    switch (overlay) {
        case EditOverlay::None: return QStringLiteral("None");
        case EditOverlay::Hovered: return QStringLiteral("Hovered");
        case EditOverlay::Held: return QStringLiteral("Held");
        case EditOverlay::Selected: return QStringLiteral("Selected");
    }
    return QStringLiteral("None");
}

const DrawInstruction* FrameModel::find(ElementId id) const
{
    const auto it = std::find_if(instructions.cbegin(), instructions.cend(),
                                 [id](const DrawInstruction& d) { return d.elementId == id; });
    return it == instructions.cend() ? nullptr : &*it;
}

} // namespace KeyView::Frame
