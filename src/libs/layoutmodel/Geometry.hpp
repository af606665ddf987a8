// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/LayoutModelGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QVector>

namespace KeyView::LayoutModel::Geometry {

// Polygons are implicitly closed: the last vertex connects back to the first.
// Anything with fewer than three vertices contains nothing.
LAYOUTMODEL_EXPORT bool pointInPolygon(const QPointF& point, const QVector<QPointF>& vertices);

LAYOUTMODEL_EXPORT bool pointInCircle(const QPointF& point, const QPointF& center, double radius);

LAYOUTMODEL_EXPORT double distance(const QPointF& a, const QPointF& b);

LAYOUTMODEL_EXPORT double length(const QPointF& v);

// atan2(v.y, v.x); 0 for the zero vector.
LAYOUTMODEL_EXPORT double angleOf(const QPointF& v);

LAYOUTMODEL_EXPORT QPointF polarOffset(const QPointF& origin, double angle, double length);

LAYOUTMODEL_EXPORT double distanceToSegment(const QPointF& point, const QPointF& a, const QPointF& b);

// Empty rect for an empty vertex list.
LAYOUTMODEL_EXPORT QRectF boundingRect(const QVector<QPointF>& vertices);

// Top-left, top-right, bottom-right, bottom-left.
LAYOUTMODEL_EXPORT QVector<QPointF> rectangleVertices(const QRectF& rect);

inline bool isFillable(const QVector<QPointF>& vertices) { return vertices.size() >= 3; }

} // namespace KeyView::LayoutModel::Geometry
