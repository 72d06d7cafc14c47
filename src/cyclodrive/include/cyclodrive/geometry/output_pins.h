/**
 * @file output_pins.h
 * @brief Output shaft pins and the clearance holes they run in
 */

#ifndef CYCLODRIVE_OUTPUT_PINS_H
#define CYCLODRIVE_OUTPUT_PINS_H

#include "cyclodrive/core/curve.h"
#include <vector>

namespace cyclodrive {

    /**
     * @brief Centres of the output pins in the output shaft frame
     *
     * Pin i sits at angle 2 pi i / num_output_pins on the output disk circle,
     * then the pattern is rotated by -phi / L with the disk.
     */
    std::vector<Point> outputPinCenters(int num_output_pins,
                                        int num_external_pins,
                                        double output_disk_diameter,
                                        double phi);

    /**
     * @brief Output pins
     *
     * The output shaft is concentric with the ring, so the pins turn with
     * the disk but are not moved by the eccentricity.
     * @return num_output_pins closed curves on Layer::OutputPins
     */
    std::vector<Curve> outputPins(int num_output_pins,
                                  int num_external_pins,
                                  double output_pin_diameter,
                                  double output_disk_diameter,
                                  double phi,
                                  int segments = 199);

    /**
     * @brief Holes cut into the disk for the output pins
     *
     * Radius output_pin_radius + eccentricity + tolerance, so a pin can
     * orbit the full eccentricity inside its hole. The holes live on the
     * disk: same rotation as the pins plus the eccentricity vector.
     * @return num_output_pins closed curves on Layer::OutputHoles
     */
    std::vector<Curve> outputHoles(double eccentricity,
                                   int num_output_pins,
                                   int num_external_pins,
                                   double output_pin_diameter,
                                   double output_disk_diameter,
                                   double phi,
                                   double tolerance,
                                   int segments = 199);

} // namespace cyclodrive

#endif // CYCLODRIVE_OUTPUT_PINS_H
