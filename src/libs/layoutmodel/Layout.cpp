// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/Layout.hpp"

#include "layoutmodel/Geometry.hpp"

#include <QtCore/QSet>

#include <algorithm>
#include <limits>
#include <type_traits>
#include <utility>

Q_LOGGING_CATEGORY(layoutmodellog, "keyview.layoutmodel")

namespace KeyView::LayoutModel {

using namespace Qt::StringLiterals;

QString elementKindTag(ElementKind kind)
{
    switch (kind) {
        case ElementKind::KeyboardKey: return u"KeyboardKey"_s;
        case ElementKind::MouseKey: return u"MouseKey"_s;
        case ElementKind::MouseScroll: return u"MouseScroll"_s;
        case ElementKind::MouseSpeedIndicator: return u"MouseSpeedIndicator"_s;
    }
    return u"KeyboardKey"_s;
}

std::optional<ElementKind> elementKindFromTag(const QString& tag)
{
    // Tags are matched exactly; the reference tool writes them verbatim.
    if (tag == u"KeyboardKey"_s)
        return ElementKind::KeyboardKey;
    if (tag == u"MouseKey"_s)
        return ElementKind::MouseKey;
    if (tag == u"MouseScroll"_s)
        return ElementKind::MouseScroll;
    if (tag == u"MouseSpeedIndicator"_s)
        return ElementKind::MouseSpeedIndicator;
    return std::nullopt;
}

ElementId Element::id() const
{
    return std::visit([](const auto& def) { return def.id; }, m_def);
}

void Element::setId(ElementId id)
{
    std::visit([id](auto& def) { def.id = id; }, m_def);
}

const CommonKeyDefinition* Element::common() const
{
    return std::visit([](const auto& def) -> const CommonKeyDefinition* {
        using T = std::decay_t<decltype(def)>;
        if constexpr (std::is_base_of_v<CommonKeyDefinition, T>)
            return &def;
        else
            return nullptr;
    }, m_def);
}

CommonKeyDefinition* Element::common()
{
    return const_cast<CommonKeyDefinition*>(std::as_const(*this).common());
}

ElementGeometry Element::geometry() const
{
    ElementGeometry g;
    if (const auto* c = common()) {
        g.boundaries = c->boundaries;
        g.textPosition = c->textPosition;
    } else if (const auto* ind = indicator()) {
        g.location = ind->location;
        g.radius = ind->radius;
    }
    return g;
}

void Element::setGeometry(const ElementGeometry& geometry)
{
    if (auto* c = common()) {
        c->boundaries = geometry.boundaries;
        c->textPosition = geometry.textPosition;
    } else if (auto* ind = indicator()) {
        ind->location = geometry.location;
        ind->radius = geometry.radius;
    }
}

void Element::translate(const QPointF& delta, bool moveText)
{
    if (auto* ind = indicator()) {
        ind->location += delta;
        return;
    }

    auto* c = common();
    for (QPointF& p : c->boundaries)
        p += delta;
    if (moveText)
        c->textPosition += delta;
}

bool Element::translateFace(int face, const QPointF& delta)
{
    auto* c = common();
    if (!c || face < 0 || face >= c->boundaries.size())
        return false;

    const int next = (face + 1) % c->boundaries.size();
    c->boundaries[face] += delta;
    if (next != face)
        c->boundaries[next] += delta;
    return true;
}

bool Element::translateVertex(int vertex, const QPointF& delta)
{
    auto* c = common();
    if (!c || vertex < 0 || vertex >= c->boundaries.size())
        return false;

    c->boundaries[vertex] += delta;
    return true;
}

bool Element::contains(const QPointF& point) const
{
    if (const auto* ind = indicator())
        return Geometry::pointInCircle(point, ind->location, ind->radius);
    return Geometry::pointInPolygon(point, common()->boundaries);
}

const Element* Layout::findElement(ElementId id) const
{
    const int index = indexOf(id);
    return index < 0 ? nullptr : &elements.at(index);
}

Element* Layout::findElement(ElementId id)
{
    const int index = indexOf(id);
    return index < 0 ? nullptr : &elements[index];
}

int Layout::indexOf(ElementId id) const
{
    for (int i = 0; i < elements.size(); ++i) {
        if (elements.at(i).id() == id)
            return i;
    }
    return -1;
}

ElementId Layout::nextFreeId() const
{
    if (elements.isEmpty())
        return 0;

    ElementId largest = 0;
    for (const Element& e : elements)
        largest = std::max(largest, e.id());
    if (largest < std::numeric_limits<ElementId>::max())
        return largest + 1;

    // The largest id is taken, so fall back to the smallest unused one.
    QSet<ElementId> used;
    for (const Element& e : elements)
        used.insert(e.id());
    ElementId candidate = 0;
    while (used.contains(candidate))
        ++candidate;
    return candidate;
}

} // namespace KeyView::LayoutModel
