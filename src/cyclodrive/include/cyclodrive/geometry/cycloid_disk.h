/**
 * @file cycloid_disk.h
 * @brief Profile of the cycloidal disk
 */

#ifndef CYCLODRIVE_CYCLOID_DISK_H
#define CYCLODRIVE_CYCLOID_DISK_H

#include "cyclodrive/core/curve.h"
#include <vector>

namespace cyclodrive {

    /**
     * @brief Disk profile in its own frame (no rotation, no orbit)
     *
     * With L = num_external_pins - 1 lobes, the rolling circle has radius
     * L / (L + 1) * R and the stationary circle R / (L + 1), R being the ring
     * radius. The trace
     *
     *     xa = R cos t - e cos((L + 1) t)
     *     ya = R sin t - e sin((L + 1) t)
     *
     * is offset by offset_radius along the inward normal (-dya, dxa) / |d|.
     * t runs over [0, 2 pi] in L * points_per_lobe samples, both ends
     * included, so the first and last point coincide.
     *
     * @param eccentricity eccentricity e
     * @param num_external_pins number of ring pins
     * @param ring_diameter diameter of the pin circle
     * @param offset_radius pin radius plus tolerance
     * @param points_per_lobe samples per lobe
     * @throws cyclodrive::DegenerateGeometryError if L < 2 or the derivative
     *         of the trace vanishes at a sample
     * @throws cyclodrive::InvalidArgument if points_per_lobe < 1
     */
    std::vector<Point> cycloidProfile(double eccentricity,
                                      int num_external_pins,
                                      double ring_diameter,
                                      double offset_radius,
                                      int points_per_lobe);

    /**
     * @brief Disk outline at input phase phi
     *
     * The profile is offset by pin radius + tolerance, rotated by -phi / L
     * (the disk turns L times slower than the input, in reverse) and moved
     * to the eccentricity vector (e cos phi, e sin phi). The result is one
     * closed loop over all lobes.
     */
    Curve cycloidDisk(double eccentricity,
                      int num_external_pins,
                      double ring_diameter,
                      double pin_diameter,
                      double phi,
                      double tolerance,
                      int points_per_lobe = 1500);

} // namespace cyclodrive

#endif // CYCLODRIVE_CYCLOID_DISK_H
