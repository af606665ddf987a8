// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditorGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QPointF>

#include <optional>

namespace KeyView::Editor {

using LayoutModel::ElementId;

enum class GrabKind : quint8 {
    Body,   // move the whole element
    Vertex, // move one boundary vertex
    Edge    // move the edge from `index` to the next vertex; for indicators, resize the ring
};

struct EDITOR_EXPORT Grab final {
    ElementId elementId = 0;
    GrabKind kind = GrabKind::Body;
    int index = -1;

    friend bool operator==(const Grab&, const Grab&) = default;
};

struct EDITOR_EXPORT GrabTolerances final {
    double vertexRadius = 6.0;
    double edgeTolerance = 4.0;
};

class EDITOR_EXPORT HitTester final
{
public:
    // Topmost (last in list) element containing the point. Degenerate polygons never hit.
    static std::optional<ElementId> elementAt(const LayoutModel::Layout& layout, const QPointF& point);

    // Like elementAt, but also picks up vertices and edges just outside an element, and tells
    // which part of the element was grabbed.
    static std::optional<Grab> grabAt(const LayoutModel::Layout& layout, const QPointF& point,
                                      const GrabTolerances& tolerances);

    // Grab on a known element, e.g. the selected one. Body when no vertex or edge is near.
    static Grab grabOn(const LayoutModel::Element& element, const QPointF& point,
                       const GrabTolerances& tolerances);
};

} // namespace KeyView::Editor
