/**
 * @file pin_ring.h
 * @brief External pins of the fixed ring
 */

#ifndef CYCLODRIVE_PIN_RING_H
#define CYCLODRIVE_PIN_RING_H

#include "cyclodrive/core/curve.h"
#include <vector>

namespace cyclodrive {

    /**
     * @brief Centres of the external pins, pin i at angle 2 pi i / num_pins
     * @param num_pins number of pins
     * @param ring_diameter diameter of the pin circle
     */
    std::vector<Point> pinCenters(int num_pins, double ring_diameter);

    /**
     * @brief Outlines of the external pins
     *
     * The pins are the rigid reference geometry; no clearance is applied.
     * @param num_pins number of pins
     * @param ring_diameter diameter of the pin circle
     * @param pin_diameter pin diameter
     * @param segments segments per pin outline
     * @return num_pins closed curves on Layer::ExternalPins
     */
    std::vector<Curve> pinRing(int num_pins, double ring_diameter, double pin_diameter, int segments = 199);

} // namespace cyclodrive

#endif // CYCLODRIVE_PIN_RING_H
