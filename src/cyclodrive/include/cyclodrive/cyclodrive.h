/**
 * @file cyclodrive.h
 * @brief CycloDrive main header
 * @version 1.0.0
 *
 * CycloDrive generates the 2D geometry of a cycloidal speed reducer
 * (disk, pin ring, output mechanism, housing) for a given input phase
 * and exports it to DXF or SVG.
 */

#ifndef CYCLODRIVE_H
#define CYCLODRIVE_H

// core
#include "core/point.h"
#include "core/curve.h"
#include "core/exception.h"
#include "core/log.h"
#include "core/parameters.h"
#include "core/phase_driver.h"

// geometry
#include "geometry/arcs.h"
#include "geometry/pin_ring.h"
#include "geometry/cycloid_disk.h"
#include "geometry/output_pins.h"
#include "geometry/camshaft.h"
#include "geometry/outer_ring.h"
#include "geometry/gearbox.h"

// presets
#include "config/preset.h"

// export
#include "export/dxf_writer.h"
#include "export/svg_writer.h"
#include "export/exporter.h"

/**
 * @namespace cyclodrive
 * @brief Main namespace of the CycloDrive library
 */
namespace cyclodrive {

    constexpr const char* VERSION = "1.0.0";

    constexpr const char* DESCRIPTION = "CycloDrive - cycloidal drive geometry generator";

} // namespace cyclodrive

#endif // CYCLODRIVE_H
