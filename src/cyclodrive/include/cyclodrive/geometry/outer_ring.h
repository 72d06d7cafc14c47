/**
 * @file outer_ring.h
 * @brief Housing ring that holds the external pins
 */

#ifndef CYCLODRIVE_OUTER_RING_H
#define CYCLODRIVE_OUTER_RING_H

#include "cyclodrive/core/curve.h"
#include <vector>

namespace cyclodrive {

    /**
     * @brief Depth of the pin pockets and of the clearance between pins
     *
     * Both are 0.8 pin radius.
     */
    double housingPocketDepth(double pin_radius);

    /**
     * @brief Smooth pocketed wall radius at angle theta
     *
     * R - p at a pin angle, R + c half way between two pins, blended with
     * cos(num_pins theta). p = c = housingPocketDepth(pin_radius).
     */
    double housingWallRadius(double theta, int num_pins, double ring_radius, double pin_radius);

    /**
     * @brief Distance from the origin to the nearest pin along the ray at theta
     *
     * The nearest pin is found by rounding theta to the closest pin step.
     * Solves |s u - c|^2 = r^2 for the ray direction u and pin centre c and
     * returns the near root. Infinity when the ray misses the pin or the
     * near root is not in front of the origin.
     */
    double pinIntersectionRadius(double theta, int num_pins, double ring_radius, double pin_radius);

    /**
     * @brief min(housingWallRadius, pinIntersectionRadius)
     */
    double mergedHousingRadius(double theta, int num_pins, double ring_radius, double pin_radius);

    /**
     * @brief Inner profile of the housing: union silhouette of the pocketed
     *        wall and the pin bodies
     *
     * num_pins * points_per_pin samples over [0, 2 pi); the first point is
     * repeated at the end to close the polyline. No self intersection check.
     * @return closed curve on Layer::OuterRing
     */
    Curve outerRingInnerProfile(int num_pins, double ring_diameter, double pin_diameter, int points_per_pin = 30);

    /**
     * @brief Outer boundary of the housing, circle of radius ring radius + width
     */
    Curve outerRingOuterProfile(double ring_diameter, double ring_width, int segments = 199);

    /**
     * @brief Inner and outer profile, in that order
     */
    std::vector<Curve> outerRing(int num_pins,
                                 double ring_diameter,
                                 double pin_diameter,
                                 double ring_width,
                                 int points_per_pin = 30,
                                 int segments = 199);

} // namespace cyclodrive

#endif // CYCLODRIVE_OUTER_RING_H
