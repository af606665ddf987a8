// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/LayoutModelGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>
#include <variant>

namespace KeyView::LayoutModel {

using ElementId = quint32;
using KeyCode = quint32;

enum class ElementKind : quint8 {
    KeyboardKey,
    MouseKey,
    MouseScroll,
    MouseSpeedIndicator
};

// The `__type` tag used in layout files.
LAYOUTMODEL_EXPORT QString elementKindTag(ElementKind kind);
LAYOUTMODEL_EXPORT std::optional<ElementKind> elementKindFromTag(const QString& tag);

// Fields shared by every element that has keycodes. Positions are window-relative.
struct LAYOUTMODEL_EXPORT CommonKeyDefinition {
    ElementId id = 0;
    QVector<QPointF> boundaries;
    QPointF textPosition;
    QVector<KeyCode> keyCodes;
    QString text;

    friend bool operator==(const CommonKeyDefinition&, const CommonKeyDefinition&) = default;
};

struct LAYOUTMODEL_EXPORT KeyboardKeyDefinition final : CommonKeyDefinition {
    QString shiftText;
    bool changeOnCaps = false;

    friend bool operator==(const KeyboardKeyDefinition&, const KeyboardKeyDefinition&) = default;
};

// MouseKey and MouseScroll have the same shape but stay separate types: the tag is what
// tells a consumer which input domain drives the element.
struct LAYOUTMODEL_EXPORT MouseKeyDefinition final : CommonKeyDefinition {
    friend bool operator==(const MouseKeyDefinition&, const MouseKeyDefinition&) = default;
};

struct LAYOUTMODEL_EXPORT MouseScrollDefinition final : CommonKeyDefinition {
    friend bool operator==(const MouseScrollDefinition&, const MouseScrollDefinition&) = default;
};

struct LAYOUTMODEL_EXPORT MouseSpeedIndicatorDefinition final {
    ElementId id = 0;
    QPointF location;   // center of both circles
    double radius = 0.0; // outer ring

    friend bool operator==(const MouseSpeedIndicatorDefinition&, const MouseSpeedIndicatorDefinition&) = default;
};

// Geometry of one element, detached from its identity. Used for edit snapshots.
struct LAYOUTMODEL_EXPORT ElementGeometry final {
    QVector<QPointF> boundaries;
    QPointF textPosition;
    QPointF location;
    double radius = 0.0;

    friend bool operator==(const ElementGeometry&, const ElementGeometry&) = default;
};

class LAYOUTMODEL_EXPORT Element final
{
public:
    using Definition = std::variant<KeyboardKeyDefinition,
                                    MouseKeyDefinition,
                                    MouseScrollDefinition,
                                    MouseSpeedIndicatorDefinition>;

    Element() = default;
    Element(KeyboardKeyDefinition def) : m_def(std::move(def)) {}
    Element(MouseKeyDefinition def) : m_def(std::move(def)) {}
    Element(MouseScrollDefinition def) : m_def(std::move(def)) {}
    Element(MouseSpeedIndicatorDefinition def) : m_def(std::move(def)) {}

    ElementKind kind() const noexcept { return static_cast<ElementKind>(m_def.index()); }
    QString tag() const { return elementKindTag(kind()); }

    ElementId id() const;
    void setId(ElementId id);

    bool hasKeyCodes() const noexcept { return kind() != ElementKind::MouseSpeedIndicator; }

    // Null for mouse speed indicators.
    const CommonKeyDefinition* common() const;
    CommonKeyDefinition* common();

    const KeyboardKeyDefinition* keyboardKey() const { return std::get_if<KeyboardKeyDefinition>(&m_def); }
    KeyboardKeyDefinition* keyboardKey() { return std::get_if<KeyboardKeyDefinition>(&m_def); }
    const MouseSpeedIndicatorDefinition* indicator() const { return std::get_if<MouseSpeedIndicatorDefinition>(&m_def); }
    MouseSpeedIndicatorDefinition* indicator() { return std::get_if<MouseSpeedIndicatorDefinition>(&m_def); }

    const Definition& definition() const noexcept { return m_def; }
    Definition& definition() noexcept { return m_def; }

    ElementGeometry geometry() const;
    void setGeometry(const ElementGeometry& geometry);

    // Moves the whole element. The text position follows only when moveText is set.
    void translate(const QPointF& delta, bool moveText);

    // Moves the edge from vertex `face` to the next vertex (wrapping to the first).
    bool translateFace(int face, const QPointF& delta);

    bool translateVertex(int vertex, const QPointF& delta);

    // Point-in-element test used for hit testing: circles for indicators, polygons otherwise.
    bool contains(const QPointF& point) const;

    friend bool operator==(const Element&, const Element&) = default;

private:
    Definition m_def{KeyboardKeyDefinition{}};
};

struct LAYOUTMODEL_EXPORT Layout final {
    std::optional<quint8> version; // inert, kept so files re-encode the same way
    double width = 0.0;
    double height = 0.0;
    QVector<Element> elements; // z-order: later elements are on top

    const Element* findElement(ElementId id) const;
    Element* findElement(ElementId id);
    int indexOf(ElementId id) const;

    ElementId nextFreeId() const;

    friend bool operator==(const Layout&, const Layout&) = default;
};

} // namespace KeyView::LayoutModel
