/**
 * @file arcs.cpp
 * @brief Arc and circle point sequences
 */

#include "cyclodrive/geometry/arcs.h"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    std::vector<Point> arcXY(const Point& centre,
                             double radius,
                             double start_angle,
                             double arc_angle,
                             int segments) {
        std::vector<Point> points;

        if (segments <= 0) {
            return points;
        }

        points.reserve(segments + 1);
        for (int i = 0; i <= segments; ++i) {
            double angle = start_angle + arc_angle * i / segments;
            points.emplace_back(centre.x + radius * std::cos(angle),
                                centre.y + radius * std::sin(angle));
        }

        return points;
    }

    std::vector<Point> circleXY(const Point& centre,
                                double radius,
                                double start_angle,
                                int segments,
                                bool cw) {
        const double tau = 2.0 * M_PI;
        double arc_angle = tau * (1.0 - (2.0 * cw));
        std::vector<Point> points = arcXY(centre, radius, start_angle, arc_angle, segments);
        if (!points.empty()) {
            // close exactly, cos/sin of start + 2pi drift in the last bits
            points.back() = points.front();
        }
        return points;
    }

    std::vector<Point> pinOutlineXY(const Point& centre, double radius, int segments) {
        return circleXY(centre, radius, M_PI / 2.0, segments, true);
    }

    void rotateTranslate(std::vector<Point>& points, double angle, const Point& offset) {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        for (Point& p : points) {
            const double x = p.x * c - p.y * s;
            const double y = p.x * s + p.y * c;
            p.x = x + offset.x;
            p.y = y + offset.y;
        }
    }

    namespace geometry_utils {
        double normalizeAngle(double angle) {
            const double tau = 2.0 * M_PI;
            angle = std::fmod(angle, tau);
            if (angle < 0) angle += tau;
            return angle;
        }

        double polygonArea(const std::vector<Point>& points) {
            if (points.size() < 3) {
                return 0.0;
            }
            double twice_area = 0.0;
            for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
                twice_area += points[j].x * points[i].y - points[i].x * points[j].y;
            }
            return std::abs(twice_area) / 2.0;
        }
    }

} // namespace cyclodrive
