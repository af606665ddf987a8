// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editor/HitTester.hpp"

#include "layoutmodel/Geometry.hpp"

#include <cmath>

namespace KeyView::Editor {

using LayoutModel::Element;
using LayoutModel::Layout;

namespace Geometry = LayoutModel::Geometry;

namespace {

// Vertex or edge grab, if any, without the body fallback.
std::optional<Grab> partAt(const Element& element, const QPointF& point, const GrabTolerances& tolerances)
{
    if (const auto* indicator = element.indicator()) {
        const double fromRing = std::abs(Geometry::distance(point, indicator->location) - indicator->radius);
        if (fromRing <= tolerances.edgeTolerance)
            return Grab{indicator->id, GrabKind::Edge, 0};
        return std::nullopt;
    }

    const QVector<QPointF>& boundaries = element.common()->boundaries;
    if (!Geometry::isFillable(boundaries))
        return std::nullopt;

    int nearestVertex = -1;
    double nearestDistance = tolerances.vertexRadius;
    for (int i = 0; i < boundaries.size(); ++i) {
        const double d = Geometry::distance(point, boundaries.at(i));
        if (d <= nearestDistance) {
            nearestDistance = d;
            nearestVertex = i;
        }
    }
    if (nearestVertex >= 0)
        return Grab{element.id(), GrabKind::Vertex, nearestVertex};

    int nearestEdge = -1;
    nearestDistance = tolerances.edgeTolerance;
    for (int i = 0; i < boundaries.size(); ++i) {
        const QPointF& a = boundaries.at(i);
        const QPointF& b = boundaries.at((i + 1) % boundaries.size());
        const double d = Geometry::distanceToSegment(point, a, b);
        if (d <= nearestDistance) {
            nearestDistance = d;
            nearestEdge = i;
        }
    }
    if (nearestEdge >= 0)
        return Grab{element.id(), GrabKind::Edge, nearestEdge};
    return std::nullopt;
}

} // namespace

std::optional<ElementId> HitTester::elementAt(const Layout& layout, const QPointF& point)
{
    for (auto it = layout.elements.crbegin(); it != layout.elements.crend(); ++it) {
        if (it->contains(point))
            return it->id();
    }
    return std::nullopt;
}

std::optional<Grab> HitTester::grabAt(const Layout& layout, const QPointF& point, const GrabTolerances& tolerances)
{
    for (auto it = layout.elements.crbegin(); it != layout.elements.crend(); ++it) {
        if (auto part = partAt(*it, point, tolerances))
            return part;
        if (it->contains(point))
            return Grab{it->id(), GrabKind::Body, -1};
    }
    return std::nullopt;
}

Grab HitTester::grabOn(const Element& element, const QPointF& point, const GrabTolerances& tolerances)
{
    if (auto part = partAt(element, point, tolerances))
        return *part;
    return Grab{element.id(), GrabKind::Body, -1};
}

} // namespace KeyView::Editor
