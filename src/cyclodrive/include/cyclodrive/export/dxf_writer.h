/**
 * @file dxf_writer.h
 * @brief Layered DXF document for CAD tools
 */

#ifndef CYCLODRIVE_DXF_WRITER_H
#define CYCLODRIVE_DXF_WRITER_H

#include "cyclodrive/core/curve.h"
#include "cyclodrive/core/parameters.h"
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cyclodrive {

    /**
     * @brief DXF release written into $ACADVER
     *
     * R12 has neither LWPOLYLINE nor SPLINE and is rejected.
     */
    enum class DxfVersion {
        R12,
        R2000,
        R2010,
    };

    const char* dxf_version_code(DxfVersion version);

    /**
     * @class DxfWriter
     * @brief Accumulates layers and entities, then renders the ASCII DXF text
     */
    class DxfWriter {
    public:
        /**
         * @throws cyclodrive::ExportUnavailableError for DxfVersion::R12
         */
        explicit DxfWriter(DxfVersion version = DxfVersion::R2010);

        /**
         * @brief Declare a layer; a name already declared, "0" included, is ignored
         */
        void addLayer(const std::string& name, int color);

        void addPoint(const Point& point, const std::string& layer);

        void addCircle(const Point& centre, double radius, const std::string& layer);

        /**
         * @brief Lightweight polyline; a closed one sets the closed flag
         *        instead of repeating its first vertex
         */
        void addPolyline(const std::vector<Point>& points, bool closed, const std::string& layer);

        /**
         * @brief Cubic spline through the given fit points
         */
        void addSpline(const std::vector<Point>& fit_points, bool closed, const std::string& layer);

        size_t entityCount() const { return m_entity_count; }

        /**
         * @brief Complete document: HEADER, CLASSES, TABLES, BLOCKS, ENTITIES, OBJECTS, EOF
         *
         * Entities are owned by the *Model_Space block record. Layer "0"
         * and the ByBlock, ByLayer and Continuous linetypes are always
         * present.
         */
        std::string str() const;

    private:
        void beginEntity(const char* type, const std::string& layer, const char* subclass);
        unsigned nextHandle() { return m_next_handle++; }

        DxfVersion m_version;
        std::vector<std::pair<std::string, int>> m_layers;
        std::ostringstream m_entities;
        size_t m_entity_count { 0 };
        unsigned m_next_handle { 0x100 };
    };

    /**
     * @brief Build the DXF drawing of a gearbox
     *
     * Origin point on CENTER_AXIS, a point per external pin centre, circles
     * for output pins, holes, camshaft bore and eccentric shaft, the disk as
     * a closed spline through the curve set's disk samples and, when
     * enabled, the housing inner profile as a closed polyline plus its outer
     * circle.
     * @param curves curve set generated at export resolution for phi
     * @param params parameters the curve set was generated from
     * @param phi input phase of the curve set
     * @param version DXF release
     * @throws cyclodrive::ExportUnavailableError for an unsupported release
     * @throws cyclodrive::DegenerateGeometryError for a non-positive eccentric shaft
     */
    std::string generate_dxf(const CurveSet& curves, const ParameterSet& params, double phi,
                             DxfVersion version = DxfVersion::R2010);

} // namespace cyclodrive

#endif // CYCLODRIVE_DXF_WRITER_H
