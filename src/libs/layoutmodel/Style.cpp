// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/Style.hpp"

#include <algorithm>
#include <cmath>

namespace KeyView::LayoutModel {

using namespace Qt::StringLiterals;

namespace {

int toChannel(double v)
{
    return static_cast<int>(std::lround(std::clamp(v, 0.0, 255.0)));
}

} // namespace

QColor Rgb::toColor() const
{
    return QColor(toChannel(red), toChannel(green), toChannel(blue));
}

Rgb Rgb::fromColor(const QColor& color)
{
    return Rgb{color.redF() * 255.0, color.greenF() * 255.0, color.blueF() * 255.0};
}

Rgb Rgb::mix(const Rgb& a, const Rgb& b, double t)
{
    const double k = std::clamp(t, 0.0, 1.0);
    return Rgb{a.red + (b.red - a.red) * k,
               a.green + (b.green - a.green) * k,
               a.blue + (b.blue - a.blue) * k};
}

QString elementStyleKindTag(ElementStyleKind kind)
{
    switch (kind) {
        case ElementStyleKind::KeyStyle: return u"KeyStyle"_s;
        case ElementStyleKind::MouseSpeedIndicatorStyle: return u"MouseSpeedIndicatorStyle"_s;
    }
    return u"KeyStyle"_s;
}

std::optional<ElementStyleKind> elementStyleKindFromTag(const QString& tag)
{
    if (tag == u"KeyStyle"_s)
        return ElementStyleKind::KeyStyle;
    if (tag == u"MouseSpeedIndicatorStyle"_s)
        return ElementStyleKind::MouseSpeedIndicatorStyle;
    return std::nullopt;
}

const ElementStyle* Style::elementStyle(ElementId id) const
{
    const auto it = std::find_if(elementStyles.crbegin(), elementStyles.crend(),
                                 [id](const ElementStyleEntry& e) { return e.key == id; });
    return it == elementStyles.crend() ? nullptr : &it->value;
}

const KeyStyle* Style::keyStyleOverride(ElementId id) const
{
    const ElementStyle* s = elementStyle(id);
    return s ? std::get_if<KeyStyle>(s) : nullptr;
}

const MouseSpeedIndicatorStyle* Style::indicatorStyleOverride(ElementId id) const
{
    const ElementStyle* s = elementStyle(id);
    return s ? std::get_if<MouseSpeedIndicatorStyle>(s) : nullptr;
}

Style Style::defaults()
{
    Style style;
    style.backgroundColor = Rgb{0.0, 0.0, 100.0};

    KeySubStyle loose;
    loose.background = Rgb::defaultGray();
    loose.text = Rgb::black();
    loose.outline = Rgb{0.0, 255.0, 0.0};
    loose.showOutline = false;
    loose.outlineWidth = 1;

    KeySubStyle pressed = loose;
    pressed.background = Rgb::white();

    style.defaultKeyStyle = DefaultKeyStyle{loose, pressed};
    style.defaultMouseSpeedIndicatorStyle = MouseSpeedIndicatorStyle{Rgb::defaultGray(), Rgb::white(), 1.0};
    return style;
}

} // namespace KeyView::LayoutModel
