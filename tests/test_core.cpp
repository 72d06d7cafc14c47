/**
 * @file test_core.cpp
 * @brief Unit tests for points, arcs and curve sets
 */

#include "cyclodrive/core/point.h"
#include "cyclodrive/core/curve.h"
#include "cyclodrive/core/exception.h"
#include "cyclodrive/core/log.h"
#include "cyclodrive/geometry/arcs.h"
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace cyclodrive {
namespace {

constexpr double kPi = 3.14159265358979323846;

bool PointNearEqual(const Point& a, const Point& b, double tol = 1e-9) {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol;
}

// =============================================================================
// Point
// =============================================================================

TEST(PointTest, ArithmeticAndPolar) {
    Point a(3.0, 4.0);
    Point b(1.0, -2.0);

    EXPECT_DOUBLE_EQ(a.length(), 5.0);
    EXPECT_EQ(a + b, Point(4.0, 2.0));
    EXPECT_EQ(a - b, Point(2.0, 6.0));
    EXPECT_EQ(2.0 * b, Point(2.0, -4.0));
    EXPECT_EQ(a / 2.0, Point(1.5, 2.0));
    EXPECT_DOUBLE_EQ(a.distanceTo(b), std::sqrt(4.0 + 36.0));

    EXPECT_TRUE(PointNearEqual(Point::polar(2.0, kPi / 2.0), Point(0.0, 2.0)));
    EXPECT_TRUE(PointNearEqual(Point(1.0, 0.0).rotated(kPi), Point(-1.0, 0.0)));
}

TEST(PointTest, ToStringUsesThreeDecimals) {
    EXPECT_EQ(Point(1.0, -2.5).toString(), "Point(x=1.000, y=-2.500)");
}

TEST(PointTest, DivisionByZeroThrows) {
    EXPECT_THROW(Point(1.0, 1.0) / 0.0, InvalidArgument);
}

// =============================================================================
// Arcs
// =============================================================================

TEST(ArcsTest, ArcHasSegmentsPlusOnePoints) {
    std::vector<Point> arc = arcXY(Point(), 10.0, 0.0, kPi / 2.0, 8);
    ASSERT_EQ(arc.size(), 9u);
    EXPECT_TRUE(PointNearEqual(arc.front(), Point(10.0, 0.0)));
    EXPECT_TRUE(PointNearEqual(arc.back(), Point(0.0, 10.0)));

    EXPECT_TRUE(arcXY(Point(), 10.0, 0.0, kPi, 0).empty());
}

TEST(ArcsTest, CircleIsExactlyClosed) {
    std::vector<Point> circle = circleXY(Point(3.0, -1.0), 2.5, 0.3, 199);
    ASSERT_EQ(circle.size(), 200u);
    EXPECT_EQ(circle.front().x, circle.back().x);
    EXPECT_EQ(circle.front().y, circle.back().y);
    for (const Point& p : circle)
        EXPECT_NEAR(p.distanceTo(Point(3.0, -1.0)), 2.5, 1e-12);
}

TEST(ArcsTest, PinOutlineStartsAtTopAndRunsClockwise) {
    std::vector<Point> outline = pinOutlineXY(Point(), 1.0, 4);
    ASSERT_EQ(outline.size(), 5u);
    EXPECT_TRUE(PointNearEqual(outline[0], Point(0.0, 1.0)));
    EXPECT_TRUE(PointNearEqual(outline[1], Point(1.0, 0.0)));
    EXPECT_TRUE(PointNearEqual(outline[2], Point(0.0, -1.0)));
}

TEST(ArcsTest, PolygonAreaOfSampledCircle) {
    std::vector<Point> circle = circleXY(Point(), 10.0, 0.0, 2000);
    circle.pop_back();
    EXPECT_NEAR(geometry_utils::polygonArea(circle), kPi * 100.0, 0.01);
}

TEST(ArcsTest, NormalizeAngleWraps) {
    EXPECT_NEAR(geometry_utils::normalizeAngle(-kPi / 2.0), 1.5 * kPi, 1e-12);
    EXPECT_NEAR(geometry_utils::normalizeAngle(5.0 * kPi), kPi, 1e-12);
}

// =============================================================================
// Curves
// =============================================================================

TEST(CurveTest, UniquePointsDropsClosingPoint) {
    Curve square({ Point(0, 0), Point(1, 0), Point(1, 1), Point(0, 1), Point(0, 0) }, true, Layer::OutputPins);
    EXPECT_TRUE(square.isClosedLoop());
    EXPECT_EQ(square.uniquePoints().size(), 4u);
    EXPECT_TRUE(PointNearEqual(square.centroid(), Point(0.5, 0.5)));

    Curve open({ Point(0, 0), Point(1, 0) }, false, Layer::OutputPins);
    EXPECT_FALSE(open.isClosedLoop());
    EXPECT_EQ(open.uniquePoints().size(), 2u);
}

TEST(CurveTest, LineStripHasThreeFloatsPerPoint) {
    Curve curve(circleXY(Point(), 1.0, 0.0, 10), true, Layer::CamshaftHole);
    std::vector<float> strip = line_strip_vertices(curve);
    ASSERT_EQ(strip.size(), 33u);
    EXPECT_FLOAT_EQ(strip[0], 1.0f);
    EXPECT_FLOAT_EQ(strip[2], 0.0f);
}

TEST(CurveSetTest, GroupsCurvesByLayer) {
    CurveSet set;
    set.add(Curve(circleXY(Point(), 1.0, 0.0, 10), true, Layer::OutputPins));
    set.add(std::vector<Curve>{ Curve(circleXY(Point(), 2.0, 0.0, 10), true, Layer::OutputPins),
                                Curve(circleXY(Point(), 3.0, 0.0, 20), true, Layer::CamshaftHole) });

    EXPECT_TRUE(set.has(Layer::OutputPins));
    EXPECT_FALSE(set.has(Layer::OuterRing));
    EXPECT_TRUE(set.curves(Layer::OuterRing).empty());
    EXPECT_EQ(set.curves(Layer::OutputPins).size(), 2u);
    EXPECT_EQ(set.curveCount(), 3u);
    EXPECT_EQ(set.pointCount(), 11u + 11u + 21u);
    EXPECT_EQ(set.lineStrips(Layer::CamshaftHole).front().size(), 63u);
}

TEST(LayerTest, DxfLayerNamesAndColours) {
    EXPECT_EQ(layer_name(Layer::CycloidDisk), "CYCLOID_DISK");
    EXPECT_EQ(layer_style(Layer::CycloidDisk).dxf_color, 1);
    EXPECT_EQ(layer_style(Layer::OuterRing).dxf_color, 8);
    EXPECT_EQ(layer_style(Layer::CenterAxis).dxf_color, 4);
    EXPECT_STREQ(layer_style(Layer::ExternalPins).svg_stroke, "#666666");
    EXPECT_EQ(dxf_layers().size(), 8u);
}

// =============================================================================
// Logging
// =============================================================================

TEST(LogTest, LevelNamesAndNumbers) {
    EXPECT_EQ(level_string_to_boost("fatal"), 0u);
    EXPECT_EQ(level_string_to_boost("trace"), 5u);
    EXPECT_EQ(level_string_to_boost("verbose"), 1u);
    EXPECT_EQ(get_string_logging_level(3), "info");

    set_logging_level(4);
    EXPECT_EQ(get_logging_level(), 4u);
    EXPECT_NO_THROW(trace(4, "debug message from the log test"));
    set_logging_level(2);
    EXPECT_EQ(get_logging_level(), 2u);
}

} // namespace
} // namespace cyclodrive
