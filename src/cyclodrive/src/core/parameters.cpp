/**
 * @file parameters.cpp
 * @brief Parameter validation and derived quantities
 */

#include "cyclodrive/core/parameters.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cyclodrive {

    namespace {
        void require_positive(double value, const char* name) {
            if (!(value > 0.0)) {
                throw InvalidArgument((boost::format("%1% must be positive, got %2%") % name % value).str());
            }
        }

        double round_to_tenth(double value) {
            return std::round(value * 10.0) / 10.0;
        }
    }

    ParameterSet::ParameterSet()
        : ParameterSet(ParameterValues()) {
    }

    ParameterSet::ParameterSet(const ParameterValues& values)
        : m_values(values) {
        require_positive(m_values.eccentricity, "eccentricity");
        if (m_values.num_external_pins < 3) {
            throw InvalidArgument((boost::format("at least 3 external pins are required, got %1%") % m_values.num_external_pins).str());
        }
        if (m_values.num_output_pins < 3) {
            throw InvalidArgument((boost::format("at least 3 output pins are required, got %1%") % m_values.num_output_pins).str());
        }
        require_positive(m_values.ring_diameter, "ring_diameter");
        require_positive(m_values.pin_diameter, "pin_diameter");
        require_positive(m_values.output_disk_diameter, "output_disk_diameter");
        require_positive(m_values.output_pin_diameter, "output_pin_diameter");
        require_positive(m_values.camshaft_diameter, "camshaft_diameter");
        require_positive(m_values.outer_ring_width, "outer_ring_width");
        if (!(m_values.tolerance >= 0.0)) {
            throw InvalidArgument((boost::format("tolerance must not be negative, got %1%") % m_values.tolerance).str());
        }

        // The ring only works with an even pin count.
        if (m_values.num_external_pins % 2 != 0) {
            if (m_values.num_external_pins == std::numeric_limits<int>::max()) {
                throw InvalidArgument((boost::format("%1% external pins cannot be rounded up to an even count") % m_values.num_external_pins).str());
            }
            BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << ": rounding external pins up from " << m_values.num_external_pins;
            m_values.num_external_pins += 1;
        }
        if (m_values.num_external_pins < 3 || m_values.num_external_pins % 2 != 0) {
            throw LogicError((boost::format("external pin count %1% after rounding") % m_values.num_external_pins).str());
        }
    }

    double ParameterSet::eccentricShaftRadius() const {
        return (m_values.camshaft_diameter - 2.0 * m_values.eccentricity) / 2.0;
    }

    double ParameterSet::outputHoleRadius() const {
        return m_values.output_pin_diameter / 2.0 + m_values.eccentricity + m_values.tolerance;
    }

    double ParameterSet::camshaftHoleRadius() const {
        return m_values.camshaft_diameter / 2.0 + m_values.tolerance;
    }

    Point ParameterSet::eccentricOffset(double phi) const {
        return cyclodrive::eccentricOffset(m_values.eccentricity, phi);
    }

    std::string ParameterSet::toString() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "ParameterSet(e=" << m_values.eccentricity
            << ", external_pins=" << m_values.num_external_pins
            << ", output_pins=" << m_values.num_output_pins
            << ", ring_d=" << m_values.ring_diameter
            << ", pin_d=" << m_values.pin_diameter
            << ", disk_d=" << m_values.output_disk_diameter
            << ", output_pin_d=" << m_values.output_pin_diameter
            << ", camshaft_d=" << m_values.camshaft_diameter
            << ", tolerance=" << m_values.tolerance
            << ", outer_ring=" << (m_values.show_outer_ring ? "on" : "off")
            << ", ring_width=" << m_values.outer_ring_width << ")";
        return oss.str();
    }

    Point eccentricOffset(double eccentricity, double phi) {
        return Point(eccentricity * std::cos(phi), eccentricity * std::sin(phi));
    }

    ParameterSet normalizeToPins(const ParameterSet& params) {
        const int n = params.numExternalPins();
        const double d = params.pinDiameter();

        const double ring_diameter = (d * n + (1.25 * d) * (n - 1)) / M_PI;

        ParameterValues values = params.values();
        values.ring_diameter = round_to_tenth(ring_diameter);
        values.output_disk_diameter = round_to_tenth((2.0 / 3.0) * ring_diameter);

        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": ring diameter %1%, output disk diameter %2%")
            % values.ring_diameter % values.output_disk_diameter;
        return ParameterSet(values);
    }

} // namespace cyclodrive
