// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "frame/StyleResolver.hpp"

namespace KeyView::Frame::StyleResolver {

using namespace LayoutModel;

KeySubStyle keySubStyle(const Style& style, ElementId id, bool pressed)
{
    const KeySubStyle& fallback = pressed ? style.defaultKeyStyle.pressed : style.defaultKeyStyle.loose;
    const KeyStyle* keyStyle = style.keyStyleOverride(id);
    if (!keyStyle) {
        if (style.elementStyle(id))
            qCDebug(framelog) << "Ignoring indicator style override on key element" << id;
        return fallback;
    }

    const std::optional<KeySubStyle>& sub = pressed ? keyStyle->pressed : keyStyle->loose;
    return sub.value_or(fallback);
}

MouseSpeedIndicatorStyle indicatorStyle(const Style& style, ElementId id)
{
    if (const MouseSpeedIndicatorStyle* s = style.indicatorStyleOverride(id))
        return *s;
    if (style.elementStyle(id))
        qCDebug(framelog) << "Ignoring key style override on indicator element" << id;
    return style.defaultMouseSpeedIndicatorStyle;
}

QVector<ElementId> mismatchedOverrides(const Layout& layout, const Style& style)
{
    QVector<ElementId> ids;
    for (const Element& element : layout.elements) {
        const ElementStyle* s = style.elementStyle(element.id());
        if (!s)
            continue;
        const bool wantsIndicator = element.kind() == ElementKind::MouseSpeedIndicator;
        const bool isIndicator = elementStyleKind(*s) == ElementStyleKind::MouseSpeedIndicatorStyle;
        if (wantsIndicator != isIndicator)
            ids.push_back(element.id());
    }
    return ids;
}

} // namespace KeyView::Frame::StyleResolver
