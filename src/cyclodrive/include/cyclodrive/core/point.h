/**
 * @file point.h
 * @brief 2D point used by every curve generator
 */

#ifndef CYCLODRIVE_POINT_H
#define CYCLODRIVE_POINT_H

#include <cmath>
#include <string>

namespace cyclodrive {

    /**
     * @class Point
     * @brief A point in the drive's XY plane
     *
     * All generators work in the plane of the gearbox; the viewer lifts the
     * points to z = 0 when it builds its line strips.
     */
    class Point {
    public:
        double x = 0.0;  ///< X coordinate
        double y = 0.0;  ///< Y coordinate

        Point() = default;

        /**
         * @brief Constructor
         * @param x_val X coordinate
         * @param y_val Y coordinate
         */
        Point(double x_val, double y_val);

        /**
         * @brief Point on a circle of the given radius around the origin
         * @param radius radius
         * @param angle polar angle (radians)
         */
        static Point polar(double radius, double angle);

        /**
         * @brief Distance to another point
         * @param other the other point
         * @return euclidean distance
         */
        double distanceTo(const Point& other) const;

        /**
         * @brief Distance from the origin
         */
        double length() const;

        /**
         * @brief Rotate around the origin
         * @param angle rotation angle (radians, counter-clockwise)
         * @return the rotated point
         */
        Point rotated(double angle) const;

        Point operator+(const Point& other) const;
        Point operator-(const Point& other) const;
        Point operator*(double scalar) const;

        /**
         * @brief Scalar division
         * @throws cyclodrive::InvalidArgument on a zero divisor
         */
        Point operator/(double scalar) const;

        Point& operator+=(const Point& other);

        /**
         * @brief Equality within 1e-9 on each coordinate
         */
        bool operator==(const Point& other) const;
        bool operator!=(const Point& other) const;

        /**
         * @brief Near-equality with an explicit tolerance
         */
        bool isClose(const Point& other, double tolerance) const;

        std::string toString() const;
    };

    Point operator*(double scalar, const Point& point);

} // namespace cyclodrive

#endif // CYCLODRIVE_POINT_H
