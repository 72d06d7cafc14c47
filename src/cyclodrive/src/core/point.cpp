/**
 * @file point.cpp
 * @brief 2D point implementation
 */

#include "cyclodrive/core/point.h"
#include "cyclodrive/core/exception.h"
#include <sstream>
#include <iomanip>

namespace cyclodrive {

    Point::Point(double x_val, double y_val)
        : x(x_val), y(y_val) {
    }

    Point Point::polar(double radius, double angle) {
        return Point(radius * std::cos(angle), radius * std::sin(angle));
    }

    double Point::distanceTo(const Point& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    double Point::length() const {
        return std::sqrt(x * x + y * y);
    }

    Point Point::rotated(double angle) const {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        return Point(x * c - y * s, x * s + y * c);
    }

    Point Point::operator+(const Point& other) const {
        return Point(x + other.x, y + other.y);
    }

    Point Point::operator-(const Point& other) const {
        return Point(x - other.x, y - other.y);
    }

    Point Point::operator*(double scalar) const {
        return Point(x * scalar, y * scalar);
    }

    Point Point::operator/(double scalar) const {
        if (std::abs(scalar) < 1e-12) {
            throw InvalidArgument("Division by zero");
        }
        return Point(x / scalar, y / scalar);
    }

    Point& Point::operator+=(const Point& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    bool Point::operator==(const Point& other) const {
        return isClose(other, 1e-9);
    }

    bool Point::operator!=(const Point& other) const {
        return !(*this == other);
    }

    bool Point::isClose(const Point& other, double tolerance) const {
        return std::abs(x - other.x) <= tolerance && std::abs(y - other.y) <= tolerance;
    }

    std::string Point::toString() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "Point(x=" << x << ", y=" << y << ")";
        return oss.str();
    }

    Point operator*(double scalar, const Point& point) {
        return point * scalar;
    }

} // namespace cyclodrive
