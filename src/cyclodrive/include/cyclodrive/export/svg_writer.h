/**
 * @file svg_writer.h
 * @brief Flat SVG drawing of a gearbox frame
 */

#ifndef CYCLODRIVE_SVG_WRITER_H
#define CYCLODRIVE_SVG_WRITER_H

#include "cyclodrive/core/curve.h"
#include "cyclodrive/core/parameters.h"
#include <sstream>
#include <string>

namespace cyclodrive {

    /**
     * @class SvgWriter
     * @brief Square, origin-centred SVG with the y axis pointing up
     */
    class SvgWriter {
    public:
        /**
         * @param view_radius half size of the square viewBox in mm
         */
        explicit SvgWriter(double view_radius);

        double viewRadius() const { return m_view_radius; }

        /**
         * @brief Unfilled path "M x,y L ... [Z]" stroked with the layer style
         */
        void addPath(const Curve& curve);

        size_t pathCount() const { return m_path_count; }

        std::string str() const;

    private:
        double m_view_radius;
        std::ostringstream m_paths;
        size_t m_path_count { 0 };
    };

    /**
     * @brief R + housing width + 10 with the housing shown, R + 10 otherwise
     */
    double svg_view_radius(const ParameterSet& params);

    /**
     * @brief Build the SVG drawing: external pins, disk, output pins, holes,
     *        camshaft bore, eccentric shaft and the housing when present
     */
    std::string generate_svg(const CurveSet& curves, const ParameterSet& params);

} // namespace cyclodrive

#endif // CYCLODRIVE_SVG_WRITER_H
