/**
 * @file parameters.h
 * @brief Design variables of a cycloidal drive
 */

#ifndef CYCLODRIVE_PARAMETERS_H
#define CYCLODRIVE_PARAMETERS_H

#include "cyclodrive/core/point.h"
#include <string>

namespace cyclodrive {

    /**
     * @class ParameterValues
     * @brief Raw parameter values as collected from a user interface or a preset
     *
     * This is the only mutable form of the parameters. The engine never
     * reads it directly; it is turned into a ParameterSet first.
     * All lengths are in millimetres.
     */
    class ParameterValues {
    public:
        double eccentricity = 1.4;          ///< Eccentricity of the disk orbit
        int num_external_pins = 24;         ///< Pins in the fixed ring
        int num_output_pins = 7;            ///< Pins on the output shaft
        double ring_diameter = 80.0;        ///< Diameter of the external pin circle
        double pin_diameter = 5.0;          ///< External pin diameter
        double output_disk_diameter = 50.0; ///< Diameter of the output pin circle
        double output_pin_diameter = 10.0;  ///< Output pin diameter
        double camshaft_diameter = 20.0;    ///< Camshaft bore diameter
        double tolerance = 0.2;             ///< Clearance added between mating parts
        bool show_outer_ring = false;       ///< Generate the housing ring
        double outer_ring_width = 15.0;     ///< Radial width of the housing ring
    };

    /**
     * @class ParameterSet
     * @brief Validated, immutable design of one gearbox
     *
     * Construction is the single place where values are checked and
     * normalized: the external pin count is rounded up to the next even
     * number and out-of-domain values are rejected. To change a parameter,
     * copy values(), edit the copy and build a new ParameterSet.
     */
    class ParameterSet {
    public:
        /**
         * @brief Build from the defaults of ParameterValues
         */
        ParameterSet();

        /**
         * @brief Validate and normalize raw values
         * @param values raw values
         * @throws cyclodrive::InvalidArgument if a value is out of its domain
         */
        explicit ParameterSet(const ParameterValues& values);

        const ParameterValues& values() const { return m_values; }

        double eccentricity() const { return m_values.eccentricity; }
        int numExternalPins() const { return m_values.num_external_pins; }
        int numOutputPins() const { return m_values.num_output_pins; }
        double ringDiameter() const { return m_values.ring_diameter; }
        double pinDiameter() const { return m_values.pin_diameter; }
        double outputDiskDiameter() const { return m_values.output_disk_diameter; }
        double outputPinDiameter() const { return m_values.output_pin_diameter; }
        double camshaftDiameter() const { return m_values.camshaft_diameter; }
        double tolerance() const { return m_values.tolerance; }
        bool showOuterRing() const { return m_values.show_outer_ring; }
        double outerRingWidth() const { return m_values.outer_ring_width; }

        double ringRadius() const { return m_values.ring_diameter / 2.0; }
        double pinRadius() const { return m_values.pin_diameter / 2.0; }

        /**
         * @brief Number of lobes on the cycloid disk (external pins - 1)
         */
        int numLobes() const { return m_values.num_external_pins - 1; }

        /**
         * @brief Radius of the eccentric shaft, (camshaft - 2e) / 2
         *
         * Not checked here; the camshaft generator reports a non-positive
         * result as a degenerate geometry.
         */
        double eccentricShaftRadius() const;

        /**
         * @brief Radius of the clearance holes cut into the disk
         */
        double outputHoleRadius() const;

        /**
         * @brief Radius of the camshaft bore including tolerance
         */
        double camshaftHoleRadius() const;

        /**
         * @brief Centre of the orbiting disk at the given input phase
         */
        Point eccentricOffset(double phi) const;

        std::string toString() const;

    private:
        ParameterValues m_values;
    };

    /**
     * @brief Eccentricity vector (e cos phi, e sin phi)
     *
     * Shared by the disk translation and the eccentric shaft centre so the
     * two always coincide.
     */
    Point eccentricOffset(double eccentricity, double phi);

    /**
     * @brief Derive ring and output disk diameters from the external pins
     *
     * ring = (d N + 1.25 d (N - 1)) / pi and disk = 2/3 ring, both rounded
     * to 0.1 mm.
     * @param params current parameters
     * @return a new ParameterSet with the two diameters replaced
     */
    ParameterSet normalizeToPins(const ParameterSet& params);

} // namespace cyclodrive

#endif // CYCLODRIVE_PARAMETERS_H
