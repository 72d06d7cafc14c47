#include "cyclodrive/geometry/output_pins.h"
#include "cyclodrive/geometry/arcs.h"
#include "cyclodrive/core/parameters.h"
#include "cyclodrive/core/exception.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    namespace {
        double disk_rotation(int num_external_pins, double phi) {
            const int num_lobes = num_external_pins - 1;
            if (num_lobes < 1) {
                throw DegenerateGeometryError("disk rotation needs at least one lobe");
            }
            return -phi / num_lobes;
        }
    }

    std::vector<Point> outputPinCenters(int num_output_pins,
                                        int num_external_pins,
                                        double output_disk_diameter,
                                        double phi) {
        const double rotation = disk_rotation(num_external_pins, phi);
        std::vector<Point> centers;
        for (int i = 0; i < num_output_pins; ++i) {
            const double angle = 2.0 * M_PI * i / num_output_pins;
            centers.push_back(Point::polar(output_disk_diameter / 2.0, angle).rotated(rotation));
        }
        return centers;
    }

    std::vector<Curve> outputPins(int num_output_pins,
                                  int num_external_pins,
                                  double output_pin_diameter,
                                  double output_disk_diameter,
                                  double phi,
                                  int segments) {
        const double rotation = disk_rotation(num_external_pins, phi);
        std::vector<Curve> pins;
        for (const Point& centre : outputPinCenters(num_output_pins, num_external_pins, output_disk_diameter, phi)) {
            // the outline turns with the pin, so its seam stays put relative to the disk
            std::vector<Point> outline = pinOutlineXY(Point(), output_pin_diameter / 2.0, segments);
            rotateTranslate(outline, rotation, centre);
            pins.emplace_back(std::move(outline), true, Layer::OutputPins);
        }
        return pins;
    }

    std::vector<Curve> outputHoles(double eccentricity,
                                   int num_output_pins,
                                   int num_external_pins,
                                   double output_pin_diameter,
                                   double output_disk_diameter,
                                   double phi,
                                   double tolerance,
                                   int segments) {
        const double rotation = disk_rotation(num_external_pins, phi);
        const double hole_radius = output_pin_diameter / 2.0 + eccentricity + tolerance;
        const Point orbit = eccentricOffset(eccentricity, phi);

        std::vector<Curve> holes;
        for (const Point& centre : outputPinCenters(num_output_pins, num_external_pins, output_disk_diameter, phi)) {
            std::vector<Point> outline = circleXY(Point(), hole_radius, 0.0, segments);
            rotateTranslate(outline, rotation, centre + orbit);
            holes.emplace_back(std::move(outline), true, Layer::OutputHoles);
        }
        return holes;
    }

} // namespace cyclodrive
