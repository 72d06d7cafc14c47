/**
 * @file gearbox.h
 * @brief Full curve set of a gearbox at one input phase
 */

#ifndef CYCLODRIVE_GEARBOX_H
#define CYCLODRIVE_GEARBOX_H

#include "cyclodrive/core/curve.h"
#include "cyclodrive/core/parameters.h"

namespace cyclodrive {

    /**
     * @class Resolution
     * @brief Sampling density of the generated curves
     *
     * The viewer wants dense curves; CAD exports want few points. Circles
     * are given in segments (points - 1).
     */
    class Resolution {
    public:
        int circle_segments = 199;
        int disk_points_per_lobe = 1500;
        int ring_points_per_pin = 100;

        static Resolution display();
        static Resolution for_export();
    };

    /**
     * @brief Generate every curve family for one (parameters, phase) pair
     *
     * The families are independent and are evaluated in parallel. The
     * housing is only generated when the parameters enable it.
     * @throws cyclodrive::DegenerateGeometryError from any generator
     */
    CurveSet generate_gearbox(const ParameterSet& params, double phi, const Resolution& resolution = Resolution::display());

} // namespace cyclodrive

#endif // CYCLODRIVE_GEARBOX_H
