#include "cyclodrive/geometry/gearbox.h"
#include "cyclodrive/geometry/pin_ring.h"
#include "cyclodrive/geometry/cycloid_disk.h"
#include "cyclodrive/geometry/output_pins.h"
#include "cyclodrive/geometry/camshaft.h"
#include "cyclodrive/geometry/outer_ring.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include <functional>
#include <vector>

namespace cyclodrive {

    Resolution Resolution::display()
    {
        return Resolution();
    }

    Resolution Resolution::for_export()
    {
        Resolution resolution;
        resolution.circle_segments = 120;
        resolution.disk_points_per_lobe = 60;
        resolution.ring_points_per_pin = 30;
        return resolution;
    }

    CurveSet generate_gearbox(const ParameterSet& params, double phi, const Resolution& resolution)
    {
        using Task = std::function<std::vector<Curve>()>;
        const int segments = resolution.circle_segments;

        std::vector<Task> tasks = {
            [&]() {
                return pinRing(params.numExternalPins(), params.ringDiameter(), params.pinDiameter(), segments);
            },
            [&]() {
                return std::vector<Curve>{ cycloidDisk(params.eccentricity(), params.numExternalPins(), params.ringDiameter(),
                                                       params.pinDiameter(), phi, params.tolerance(), resolution.disk_points_per_lobe) };
            },
            [&]() {
                return outputPins(params.numOutputPins(), params.numExternalPins(), params.outputPinDiameter(),
                                  params.outputDiskDiameter(), phi, segments);
            },
            [&]() {
                return outputHoles(params.eccentricity(), params.numOutputPins(), params.numExternalPins(),
                                   params.outputPinDiameter(), params.outputDiskDiameter(), phi, params.tolerance(), segments);
            },
            [&]() {
                return std::vector<Curve>{ camshaftHole(params.camshaftDiameter(), params.tolerance(), segments),
                                           eccentricShaft(params.eccentricity(), params.camshaftDiameter(), phi, segments) };
            },
        };
        if (params.showOuterRing()) {
            tasks.push_back([&]() {
                return outerRing(params.numExternalPins(), params.ringDiameter(), params.pinDiameter(),
                                 params.outerRingWidth(), resolution.ring_points_per_pin, segments);
            });
        }

        // every task owns its slot, no locking needed
        std::vector<std::vector<Curve>> results(tasks.size());
        tbb::parallel_for(tbb::blocked_range<size_t>(0, tasks.size()),
            [&tasks, &results](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); ++i)
                    results[i] = tasks[i]();
            });

        CurveSet curve_set;
        for (std::vector<Curve>& curves : results)
            curve_set.add(std::move(curves));

        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": phi %1%, %2% curves, %3% points")
            % phi % curve_set.curveCount() % curve_set.pointCount();
        return curve_set;
    }

} // namespace cyclodrive
