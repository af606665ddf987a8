// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/LayoutModelGlobal.hpp"
#include "layoutmodel/Layout.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtGui/QColor>

#include <optional>
#include <variant>

namespace KeyView::LayoutModel {

// Channels are floats in the 0..255 range by convention; out-of-range values are kept as-is
// and only clamped when converted to a QColor.
struct LAYOUTMODEL_EXPORT Rgb final {
    double red = 0.0;
    double green = 0.0;
    double blue = 0.0;

    QColor toColor() const;
    static Rgb fromColor(const QColor& color);

    // Linear blend, t in [0, 1].
    static Rgb mix(const Rgb& a, const Rgb& b, double t);

    static constexpr Rgb black() { return {0.0, 0.0, 0.0}; }
    static constexpr Rgb white() { return {255.0, 255.0, 255.0}; }
    static constexpr Rgb defaultGray() { return {100.0, 100.0, 100.0}; }

    friend bool operator==(const Rgb&, const Rgb&) = default;
};

enum class FontStyleFlag : quint8 {
    Bold = 0x01,
    Italic = 0x02,
    Underline = 0x04,
    Strikethrough = 0x08
};

inline constexpr quint8 kFontStyleMask = 0x0F;

struct LAYOUTMODEL_EXPORT Font final {
    QString family = QStringLiteral("Courier New");
    double size = 10.0; // pixels
    quint8 style = 0;   // FontStyleFlag bits

    bool has(FontStyleFlag flag) const noexcept { return (style & static_cast<quint8>(flag)) != 0; }

    friend bool operator==(const Font&, const Font&) = default;
};

struct LAYOUTMODEL_EXPORT KeySubStyle final {
    Rgb background;
    Rgb text;
    Rgb outline;
    bool showOutline = false;
    quint32 outlineWidth = 1;
    Font font;
    std::optional<QString> backgroundImageFileName;

    friend bool operator==(const KeySubStyle&, const KeySubStyle&) = default;
};

// Top-level default: both states are required.
struct LAYOUTMODEL_EXPORT DefaultKeyStyle final {
    KeySubStyle loose;
    KeySubStyle pressed;

    friend bool operator==(const DefaultKeyStyle&, const DefaultKeyStyle&) = default;
};

// Per-element override: an absent state inherits the default.
struct LAYOUTMODEL_EXPORT KeyStyle final {
    std::optional<KeySubStyle> loose;
    std::optional<KeySubStyle> pressed;

    friend bool operator==(const KeyStyle&, const KeyStyle&) = default;
};

struct LAYOUTMODEL_EXPORT MouseSpeedIndicatorStyle final {
    Rgb innerColor;
    Rgb outerColor;
    double outlineWidth = 1.0;

    friend bool operator==(const MouseSpeedIndicatorStyle&, const MouseSpeedIndicatorStyle&) = default;
};

enum class ElementStyleKind : quint8 {
    KeyStyle,
    MouseSpeedIndicatorStyle
};

LAYOUTMODEL_EXPORT QString elementStyleKindTag(ElementStyleKind kind);
LAYOUTMODEL_EXPORT std::optional<ElementStyleKind> elementStyleKindFromTag(const QString& tag);

using ElementStyle = std::variant<KeyStyle, MouseSpeedIndicatorStyle>;

inline ElementStyleKind elementStyleKind(const ElementStyle& style)
{
    return static_cast<ElementStyleKind>(style.index());
}

// One `{Key, Value}` pair of the ElementStyles list.
struct LAYOUTMODEL_EXPORT ElementStyleEntry final {
    ElementId key = 0;
    ElementStyle value;

    friend bool operator==(const ElementStyleEntry&, const ElementStyleEntry&) = default;
};

struct LAYOUTMODEL_EXPORT Style final {
    Rgb backgroundColor{0.0, 0.0, 100.0};
    std::optional<QString> backgroundImageFileName;
    DefaultKeyStyle defaultKeyStyle;
    MouseSpeedIndicatorStyle defaultMouseSpeedIndicatorStyle;
    // Kept as a list in file order. Duplicate keys are allowed; the last one wins on lookup.
    QVector<ElementStyleEntry> elementStyles;

    const ElementStyle* elementStyle(ElementId id) const;

    const KeyStyle* keyStyleOverride(ElementId id) const;
    const MouseSpeedIndicatorStyle* indicatorStyleOverride(ElementId id) const;

    // The style used when none is loaded.
    static Style defaults();

    friend bool operator==(const Style&, const Style&) = default;
};

} // namespace KeyView::LayoutModel
