// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/Geometry.hpp"

#include <QtGui/QPolygonF>

#include <algorithm>
#include <cmath>

namespace KeyView::LayoutModel::Geometry {

bool pointInPolygon(const QPointF& point, const QVector<QPointF>& vertices)
{
    if (!isFillable(vertices))
        return false;

    const QPolygonF polygon(vertices);
    return polygon.containsPoint(point, Qt::OddEvenFill);
}

bool pointInCircle(const QPointF& point, const QPointF& center, double radius)
{
    if (radius < 0.0)
        return false;
    return distance(point, center) <= radius;
}

double distance(const QPointF& a, const QPointF& b)
{
    return std::hypot(b.x() - a.x(), b.y() - a.y());
}

double length(const QPointF& v)
{
    return std::hypot(v.x(), v.y());
}

double angleOf(const QPointF& v)
{
    if (v.x() == 0.0 && v.y() == 0.0)
        return 0.0;
    return std::atan2(v.y(), v.x());
}

QPointF polarOffset(const QPointF& origin, double angle, double length)
{
    return QPointF(origin.x() + length * std::cos(angle), origin.y() + length * std::sin(angle));
}

double distanceToSegment(const QPointF& point, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const double lenSq = QPointF::dotProduct(ab, ab);
    if (lenSq <= 0.0)
        return distance(point, a);

    const double t = std::clamp(QPointF::dotProduct(point - a, ab) / lenSq, 0.0, 1.0);
    return distance(point, a + ab * t);
}

QRectF boundingRect(const QVector<QPointF>& vertices)
{
    if (vertices.isEmpty())
        return {};

    double minX = vertices.front().x();
    double maxX = minX;
    double minY = vertices.front().y();
    double maxY = minY;
    for (const QPointF& v : vertices) {
        minX = std::min(minX, v.x());
        maxX = std::max(maxX, v.x());
        minY = std::min(minY, v.y());
        maxY = std::max(maxY, v.y());
    }
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

QVector<QPointF> rectangleVertices(const QRectF& rect)
{
    const QRectF r = rect.normalized();
    return {r.topLeft(), r.topRight(), r.bottomRight(), r.bottomLeft()};
}

} // namespace KeyView::LayoutModel::Geometry
