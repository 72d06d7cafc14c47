#include "cyclodrive/geometry/camshaft.h"
#include "cyclodrive/geometry/arcs.h"
#include "cyclodrive/core/parameters.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace cyclodrive {

    Curve camshaftHole(double camshaft_diameter, double tolerance, int segments) {
        const double hole_radius = camshaft_diameter / 2.0 + tolerance;
        return Curve(circleXY(Point(), hole_radius, 0.0, segments), true, Layer::CamshaftHole);
    }

    double eccentricShaftRadius(double eccentricity, double camshaft_diameter) {
        const double shaft_radius = (camshaft_diameter - 2.0 * eccentricity) / 2.0;
        if (!(shaft_radius > 0.0)) {
            BOOST_LOG_TRIVIAL(warning) << __FUNCTION__ << ": eccentricity " << eccentricity
                                       << " leaves no shaft inside camshaft diameter " << camshaft_diameter;
            throw DegenerateGeometryError((boost::format("eccentric shaft radius %1% is not positive: eccentricity %2% must stay below half the camshaft diameter %3%")
                % shaft_radius % eccentricity % camshaft_diameter).str());
        }
        return shaft_radius;
    }

    Curve eccentricShaft(double eccentricity, double camshaft_diameter, double phi, int segments) {
        const double shaft_radius = eccentricShaftRadius(eccentricity, camshaft_diameter);
        return Curve(circleXY(eccentricOffset(eccentricity, phi), shaft_radius, 0.0, segments), true, Layer::EccentricCam);
    }

} // namespace cyclodrive
