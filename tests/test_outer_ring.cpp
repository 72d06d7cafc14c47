/**
 * @file test_outer_ring.cpp
 * @brief Unit tests for the housing profile
 */

#include "cyclodrive/geometry/outer_ring.h"
#include "cyclodrive/core/exception.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace cyclodrive {
namespace {

constexpr double kPi = 3.14159265358979323846;

class OuterRingTest : public ::testing::Test {
protected:
    const int pins = 24;
    const double ring_radius = 40.0;
    const double pin_radius = 2.5;
};

TEST_F(OuterRingTest, PocketDepthIsFourFifthsOfThePinRadius) {
    EXPECT_DOUBLE_EQ(housingPocketDepth(2.5), 2.0);
}

TEST_F(OuterRingTest, WallRadiusAtAndBetweenPins) {
    // pocket floor at a pin, full clearance half way between two pins
    EXPECT_NEAR(housingWallRadius(0.0, pins, ring_radius, pin_radius), 38.0, 1e-12);
    EXPECT_NEAR(housingWallRadius(kPi / pins, pins, ring_radius, pin_radius), 38.0 + 4.0, 1e-12);
}

TEST_F(OuterRingTest, BoundaryAtAPinAngle) {
    for (int i = 0; i < pins; i += 5) {
        const double theta = 2.0 * kPi * i / pins;
        EXPECT_NEAR(pinIntersectionRadius(theta, pins, ring_radius, pin_radius), ring_radius - pin_radius, 1e-9);
        EXPECT_NEAR(mergedHousingRadius(theta, pins, ring_radius, pin_radius),
                    std::min(ring_radius - housingPocketDepth(pin_radius), ring_radius - pin_radius), 1e-9);
    }
}

TEST_F(OuterRingTest, RayMissingThePinIsInfinite) {
    const double theta = kPi / pins;
    EXPECT_EQ(pinIntersectionRadius(theta, pins, ring_radius, pin_radius), std::numeric_limits<double>::infinity());
    EXPECT_NEAR(mergedHousingRadius(theta, pins, ring_radius, pin_radius),
                housingWallRadius(theta, pins, ring_radius, pin_radius), 1e-12);
}

TEST_F(OuterRingTest, LastSectorUsesTheFirstPin) {
    const double theta = 2.0 * kPi - 0.01;
    const double before = pinIntersectionRadius(-0.01, pins, ring_radius, pin_radius);
    EXPECT_TRUE(std::isfinite(before));
    EXPECT_NEAR(pinIntersectionRadius(theta, pins, ring_radius, pin_radius), before, 1e-9);
}

TEST_F(OuterRingTest, InnerProfileSampling) {
    Curve inner = outerRingInnerProfile(pins, 2.0 * ring_radius, 2.0 * pin_radius, 30);
    ASSERT_EQ(inner.size(), static_cast<size_t>(pins * 30 + 1));
    EXPECT_EQ(inner.layer, Layer::OuterRing);
    EXPECT_TRUE(inner.closed);
    EXPECT_TRUE(inner.isClosedLoop(0.0));

    for (const Point& p : inner.points) {
        EXPECT_LE(p.length(), ring_radius - housingPocketDepth(pin_radius) + 2.0 * housingPocketDepth(pin_radius) + 1e-9);
        EXPECT_GE(p.length(), ring_radius - pin_radius - 1e-9);
    }
}

TEST_F(OuterRingTest, OuterProfileAndPair) {
    std::vector<Curve> ring = outerRing(pins, 80.0, 5.0, 15.0, 10, 90);
    ASSERT_EQ(ring.size(), 2u);
    EXPECT_EQ(ring[1].size(), 91u);
    for (const Point& p : ring[1].points)
        EXPECT_NEAR(p.length(), 55.0, 1e-9);
}

TEST_F(OuterRingTest, RejectsEmptySampling) {
    EXPECT_THROW(outerRingInnerProfile(0, 80.0, 5.0, 30), InvalidArgument);
    EXPECT_THROW(outerRingInnerProfile(pins, 80.0, 5.0, 0), InvalidArgument);
}

} // namespace
} // namespace cyclodrive
