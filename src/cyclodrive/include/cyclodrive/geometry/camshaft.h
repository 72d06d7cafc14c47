/**
 * @file camshaft.h
 * @brief Camshaft bore and eccentric shaft
 */

#ifndef CYCLODRIVE_CAMSHAFT_H
#define CYCLODRIVE_CAMSHAFT_H

#include "cyclodrive/core/curve.h"

namespace cyclodrive {

    /**
     * @brief Bore for the camshaft, radius camshaft_diameter / 2 + tolerance
     * @return closed curve centred at the origin on Layer::CamshaftHole
     */
    Curve camshaftHole(double camshaft_diameter, double tolerance, int segments = 199);

    /**
     * @brief Radius of the eccentric shaft, (camshaft_diameter - 2 e) / 2
     * @throws cyclodrive::DegenerateGeometryError if the radius is not positive
     */
    double eccentricShaftRadius(double eccentricity, double camshaft_diameter);

    /**
     * @brief Eccentric shaft orbiting inside the bore
     * @return closed curve centred at (e cos phi, e sin phi) on Layer::EccentricCam
     * @throws cyclodrive::DegenerateGeometryError if eccentricity >= camshaft_diameter / 2
     */
    Curve eccentricShaft(double eccentricity, double camshaft_diameter, double phi, int segments = 199);

} // namespace cyclodrive

#endif // CYCLODRIVE_CAMSHAFT_H
