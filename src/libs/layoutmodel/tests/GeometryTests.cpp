// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "layoutmodel/Geometry.hpp"
#include "layoutmodel/Layout.hpp"

#include <cmath>
#include <limits>

using namespace KeyView::LayoutModel;

namespace {

QVector<QPointF> square()
{
    return {QPointF(0, 0), QPointF(10, 0), QPointF(10, 10), QPointF(0, 10)};
}

} // namespace

TEST(GeometryTests, PolygonContainment)
{
    EXPECT_TRUE(Geometry::pointInPolygon(QPointF(5, 5), square()));
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(15, 5), square()));
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(-1, -1), square()));
}

TEST(GeometryTests, ConcavePolygonUsesOddEvenRule)
{
    // L shape; the notch at the top right is outside.
    const QVector<QPointF> ell{QPointF(0, 0), QPointF(5, 0), QPointF(5, 5),
                               QPointF(10, 5), QPointF(10, 10), QPointF(0, 10)};
    EXPECT_TRUE(Geometry::pointInPolygon(QPointF(2, 2), ell));
    EXPECT_TRUE(Geometry::pointInPolygon(QPointF(8, 8), ell));
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(8, 2), ell));
}

TEST(GeometryTests, DegeneratePolygonContainsNothing)
{
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(0, 0), {}));
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(0, 0), {QPointF(0, 0)}));
    EXPECT_FALSE(Geometry::pointInPolygon(QPointF(1, 0), {QPointF(0, 0), QPointF(2, 0)}));
}

TEST(GeometryTests, CircleContainmentIncludesRim)
{
    EXPECT_TRUE(Geometry::pointInCircle(QPointF(3, 4), QPointF(0, 0), 5.0));
    EXPECT_FALSE(Geometry::pointInCircle(QPointF(3, 4.1), QPointF(0, 0), 5.0));
}

TEST(GeometryTests, AngleOfZeroVectorIsZero)
{
    EXPECT_DOUBLE_EQ(Geometry::angleOf(QPointF(0, 0)), 0.0);
    EXPECT_DOUBLE_EQ(Geometry::angleOf(QPointF(0, 1)), std::atan2(1.0, 0.0));
}

TEST(GeometryTests, PolarOffsetAndSegmentDistance)
{
    const QPointF p = Geometry::polarOffset(QPointF(1, 1), 0.0, 2.0);
    EXPECT_DOUBLE_EQ(p.x(), 3.0);
    EXPECT_DOUBLE_EQ(p.y(), 1.0);

    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(5, 3), QPointF(0, 0), QPointF(10, 0)), 3.0);
    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(13, 4), QPointF(0, 0), QPointF(10, 0)), 5.0);
    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(3, 4), QPointF(0, 0), QPointF(0, 0)), 5.0);
}

TEST(GeometryTests, BoundingRectAndRectangleVertices)
{
    const QVector<QPointF> tri{QPointF(2, 8), QPointF(6, 1), QPointF(9, 5)};
    const QRectF rect = Geometry::boundingRect(tri);
    EXPECT_EQ(rect, QRectF(QPointF(2, 1), QPointF(9, 8)));

    const QVector<QPointF> corners = Geometry::rectangleVertices(rect);
    ASSERT_EQ(corners.size(), 4);
    EXPECT_EQ(corners[0], QPointF(2, 1));
    EXPECT_EQ(corners[2], QPointF(9, 8));

    EXPECT_TRUE(Geometry::boundingRect({}).isNull());
}

TEST(GeometryTests, ElementTranslateFaceWrapsAround)
{
    MouseKeyDefinition def;
    def.id = 3;
    def.boundaries = square();
    Element element(def);

    ASSERT_TRUE(element.translateFace(3, QPointF(-2, 0)));
    const auto& b = element.common()->boundaries;
    EXPECT_EQ(b[3], QPointF(-2, 10));
    EXPECT_EQ(b[0], QPointF(-2, 0));
    EXPECT_EQ(b[1], QPointF(10, 0));

    EXPECT_FALSE(element.translateFace(4, QPointF(1, 1)));
    EXPECT_FALSE(element.translateVertex(-1, QPointF(1, 1)));
}

TEST(GeometryTests, ElementTranslateOptionallyMovesText)
{
    KeyboardKeyDefinition def;
    def.boundaries = square();
    def.textPosition = QPointF(5, 5);
    Element element(def);

    element.translate(QPointF(1, 2), false);
    EXPECT_EQ(element.common()->textPosition, QPointF(5, 5));
    EXPECT_EQ(element.common()->boundaries[0], QPointF(1, 2));

    element.translate(QPointF(1, 2), true);
    EXPECT_EQ(element.common()->textPosition, QPointF(6, 7));
}

TEST(GeometryTests, IndicatorUsesCircleContainment)
{
    MouseSpeedIndicatorDefinition def;
    def.location = QPointF(50, 50);
    def.radius = 10.0;
    const Element element(def);

    EXPECT_TRUE(element.contains(QPointF(57, 57)));
    EXPECT_FALSE(element.contains(QPointF(58, 58)));
    EXPECT_FALSE(element.hasKeyCodes());
    EXPECT_EQ(element.common(), nullptr);
}

TEST(GeometryTests, NextFreeIdFollowsLargestId)
{
    Layout layout;
    EXPECT_EQ(layout.nextFreeId(), 0u);

    MouseKeyDefinition a;
    a.id = 4;
    MouseKeyDefinition b;
    b.id = 9;
    layout.elements = {Element(a), Element(b)};
    EXPECT_EQ(layout.nextFreeId(), 10u);
    EXPECT_EQ(layout.indexOf(9), 1);
    EXPECT_EQ(layout.findElement(5), nullptr);
}

TEST(GeometryTests, NextFreeIdDoesNotWrapPastLargestId)
{
    MouseKeyDefinition zero;
    zero.id = 0;
    MouseKeyDefinition one;
    one.id = 1;
    MouseKeyDefinition last;
    last.id = std::numeric_limits<ElementId>::max();

    Layout layout;
    layout.elements = {Element(zero), Element(one), Element(last)};
    EXPECT_EQ(layout.nextFreeId(), 2u);
    EXPECT_EQ(layout.findElement(layout.nextFreeId()), nullptr);
}
