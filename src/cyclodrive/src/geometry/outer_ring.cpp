/**
 * @file outer_ring.cpp
 * @brief Merged housing silhouette by ray casting against the pins
 */

#include "cyclodrive/geometry/outer_ring.h"
#include "cyclodrive/geometry/arcs.h"
#include "cyclodrive/core/exception.h"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    double housingPocketDepth(double pin_radius) {
        return pin_radius * 0.8;
    }

    double housingWallRadius(double theta, int num_pins, double ring_radius, double pin_radius) {
        const double pocket_depth = housingPocketDepth(pin_radius);
        const double clearance_space = housingPocketDepth(pin_radius);
        const double radius_variation = pocket_depth + clearance_space;

        // 1 at a pin, -1 half way between two pins
        const double pin_factor = std::cos(num_pins * theta);
        return ring_radius - pocket_depth + radius_variation * (1.0 - pin_factor) / 2.0;
    }

    double pinIntersectionRadius(double theta, int num_pins, double ring_radius, double pin_radius) {
        const double step = 2.0 * M_PI / num_pins;
        const long pin_idx = std::lround(geometry_utils::normalizeAngle(theta) / step);
        const double pin_angle = pin_idx * step;

        const double cx = ring_radius * std::cos(pin_angle);
        const double cy = ring_radius * std::sin(pin_angle);

        const double dot_prod = cx * std::cos(theta) + cy * std::sin(theta);
        const double dist_sq = cx * cx + cy * cy;
        const double discriminant = dot_prod * dot_prod - (dist_sq - pin_radius * pin_radius);

        if (discriminant >= 0.0) {
            const double near_root = dot_prod - std::sqrt(discriminant);
            if (near_root > 0.0) {
                return near_root;
            }
        }
        return std::numeric_limits<double>::infinity();
    }

    double mergedHousingRadius(double theta, int num_pins, double ring_radius, double pin_radius) {
        return std::min(housingWallRadius(theta, num_pins, ring_radius, pin_radius),
                        pinIntersectionRadius(theta, num_pins, ring_radius, pin_radius));
    }

    Curve outerRingInnerProfile(int num_pins, double ring_diameter, double pin_diameter, int points_per_pin) {
        if (num_pins < 1 || points_per_pin < 1) {
            throw InvalidArgument("housing profile needs at least one pin and one point per pin");
        }

        const double ring_radius = ring_diameter / 2.0;
        const double pin_radius = pin_diameter / 2.0;

        // Sample count scales with the pins so every pocket gets the same fidelity.
        const int num_samples = num_pins * points_per_pin;
        std::vector<Point> points;
        points.reserve(num_samples + 1);
        for (int i = 0; i < num_samples; ++i) {
            const double theta = 2.0 * M_PI * i / num_samples;
            const double radius = mergedHousingRadius(theta, num_pins, ring_radius, pin_radius);
            points.push_back(Point::polar(radius, theta));
        }
        points.push_back(points.front());

        BOOST_LOG_TRIVIAL(trace) << __FUNCTION__ << ": " << num_samples << " samples for " << num_pins << " pins";
        return Curve(std::move(points), true, Layer::OuterRing);
    }

    Curve outerRingOuterProfile(double ring_diameter, double ring_width, int segments) {
        const double outer_radius = ring_diameter / 2.0 + ring_width;
        return Curve(circleXY(Point(), outer_radius, 0.0, segments), true, Layer::OuterRing);
    }

    std::vector<Curve> outerRing(int num_pins,
                                 double ring_diameter,
                                 double pin_diameter,
                                 double ring_width,
                                 int points_per_pin,
                                 int segments) {
        std::vector<Curve> profiles;
        profiles.push_back(outerRingInnerProfile(num_pins, ring_diameter, pin_diameter, points_per_pin));
        profiles.push_back(outerRingOuterProfile(ring_diameter, ring_width, segments));
        return profiles;
    }

} // namespace cyclodrive
