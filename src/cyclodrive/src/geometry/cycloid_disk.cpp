/**
 * @file cycloid_disk.cpp
 * @brief Offset hypocycloid profile of the cycloidal disk
 */

#include "cyclodrive/geometry/cycloid_disk.h"
#include "cyclodrive/geometry/arcs.h"
#include "cyclodrive/core/parameters.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    std::vector<Point> cycloidProfile(double eccentricity,
                                      int num_external_pins,
                                      double ring_diameter,
                                      double offset_radius,
                                      int points_per_lobe) {
        const int num_lobes = num_external_pins - 1;
        if (num_lobes < 2) {
            throw DegenerateGeometryError((boost::format("cycloid disk needs at least 2 lobes, got %1%") % num_lobes).str());
        }
        if (points_per_lobe < 1) {
            throw InvalidArgument("points_per_lobe must be at least 1");
        }

        const double ring_radius = ring_diameter / 2.0;
        const double rolling = (static_cast<double>(num_lobes) / (num_lobes + 1)) * ring_radius;
        const double stationary = ring_radius / (num_lobes + 1);
        const double pitch = rolling + stationary;
        const double ratio = pitch / stationary;

        const int total_points = points_per_lobe * num_lobes;
        std::vector<Point> points;
        points.reserve(total_points);

        for (int i = 0; i < total_points; ++i) {
            const double t = total_points > 1 ? 2.0 * M_PI * i / (total_points - 1) : 0.0;

            const double xa = pitch * std::cos(t) - eccentricity * std::cos(ratio * t);
            const double ya = pitch * std::sin(t) - eccentricity * std::sin(ratio * t);

            const double dxa = pitch * (-std::sin(t) + (eccentricity / stationary) * std::sin(ratio * t));
            const double dya = pitch * ( std::cos(t) - (eccentricity / stationary) * std::cos(ratio * t));

            const double norm = std::sqrt(dxa * dxa + dya * dya);
            if (!(norm > 0.0)) {
                throw DegenerateGeometryError((boost::format("cycloid derivative vanishes at t = %1% (e = %2%, stationary radius = %3%)")
                    % t % eccentricity % stationary).str());
            }

            points.emplace_back(xa + offset_radius / norm * (-dya),
                                ya + offset_radius / norm * ( dxa));
        }

        return points;
    }

    Curve cycloidDisk(double eccentricity,
                      int num_external_pins,
                      double ring_diameter,
                      double pin_diameter,
                      double phi,
                      double tolerance,
                      int points_per_lobe) {
        const double effective_pin_radius = pin_diameter / 2.0 + tolerance;
        std::vector<Point> points = cycloidProfile(eccentricity, num_external_pins, ring_diameter,
                                                   effective_pin_radius, points_per_lobe);

        const int num_lobes = num_external_pins - 1;
        rotateTranslate(points, -phi / num_lobes, eccentricOffset(eccentricity, phi));

        BOOST_LOG_TRIVIAL(trace) << __FUNCTION__ << boost::format(": %1% lobes, %2% points, phi %3%")
            % num_lobes % points.size() % phi;
        return Curve(std::move(points), true, Layer::CycloidDisk);
    }

} // namespace cyclodrive
