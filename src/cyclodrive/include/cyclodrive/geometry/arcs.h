/**
 * @file arcs.h
 * @brief Arc and circle point sequences
 */

#ifndef CYCLODRIVE_ARCS_H
#define CYCLODRIVE_ARCS_H

#include "cyclodrive/core/point.h"
#include <vector>

namespace cyclodrive {

    /**
     * @brief Generate a 2D XY arc
     * @param centre arc centre
     * @param radius radius
     * @param start_angle start angle (radians)
     * @param arc_angle swept angle (radians, negative for clockwise)
     * @param segments number of segments
     * @return segments + 1 points from start to end, empty if segments <= 0
     */
    std::vector<Point> arcXY(const Point& centre,
                             double radius,
                             double start_angle,
                             double arc_angle,
                             int segments);

    /**
     * @brief Generate a closed 2D XY circle
     * @param centre circle centre
     * @param radius radius
     * @param start_angle angle of the first point (radians)
     * @param segments number of segments (default 199, i.e. 200 points)
     * @param cw clockwise direction (default false, counter-clockwise)
     * @return segments + 1 points, the last one equal to the first
     */
    std::vector<Point> circleXY(const Point& centre,
                                double radius,
                                double start_angle = 0.0,
                                int segments = 199,
                                bool cw = false);

    /**
     * @brief Outline of a round pin: starts at the top, runs clockwise
     */
    std::vector<Point> pinOutlineXY(const Point& centre, double radius, int segments = 199);

    /**
     * @brief Rotate every point around the origin, then translate
     * @param points points to transform in place
     * @param angle rotation (radians)
     * @param offset translation applied after the rotation
     */
    void rotateTranslate(std::vector<Point>& points, double angle, const Point& offset);

    namespace geometry_utils {
        /**
         * @brief Normalize an angle to [0, 2pi)
         */
        double normalizeAngle(double angle);

        /**
         * @brief Absolute value of the shoelace area of a polygon
         */
        double polygonArea(const std::vector<Point>& points);
    }

} // namespace cyclodrive

#endif // CYCLODRIVE_ARCS_H
