#include "cyclodrive/geometry/pin_ring.h"
#include "cyclodrive/geometry/arcs.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    std::vector<Point> pinCenters(int num_pins, double ring_diameter) {
        std::vector<Point> centers;
        if (num_pins <= 0) {
            return centers;
        }
        centers.reserve(num_pins);
        for (int i = 0; i < num_pins; ++i) {
            centers.push_back(Point::polar(ring_diameter / 2.0, 2.0 * M_PI * i / num_pins));
        }
        return centers;
    }

    std::vector<Curve> pinRing(int num_pins, double ring_diameter, double pin_diameter, int segments) {
        std::vector<Curve> pins;
        for (const Point& centre : pinCenters(num_pins, ring_diameter)) {
            pins.emplace_back(pinOutlineXY(centre, pin_diameter / 2.0, segments), true, Layer::ExternalPins);
        }
        return pins;
    }

} // namespace cyclodrive
