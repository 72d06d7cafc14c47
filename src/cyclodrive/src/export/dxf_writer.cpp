/**
 * @file dxf_writer.cpp
 * @brief ASCII DXF output
 */

#include "cyclodrive/export/dxf_writer.h"
#include "cyclodrive/geometry/pin_ring.h"
#include "cyclodrive/geometry/output_pins.h"
#include "cyclodrive/geometry/camshaft.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace cyclodrive {

    namespace {
        // fixed handles of the document skeleton; layers and entities start at 0x100
        enum : unsigned {
            BlockRecordTable = 0x1,
            LayerTable = 0x2,
            StyleTable = 0x3,
            LinetypeTable = 0x5,
            ViewTable = 0x6,
            UcsTable = 0x7,
            VportTable = 0x8,
            AppidTable = 0x9,
            DimstyleTable = 0xA,
            RootDictionary = 0xC,
            GroupDictionary = 0xD,
            StandardStyle = 0x11,
            AcadAppid = 0x12,
            ByBlockLinetype = 0x14,
            ByLayerLinetype = 0x15,
            ContinuousLinetype = 0x16,
            PaperSpaceRecord = 0x1B,
            PaperSpaceBlock = 0x1C,
            PaperSpaceBlockEnd = 0x1D,
            ModelSpaceRecord = 0x1F,
            ModelSpaceBlock = 0x20,
            ModelSpaceBlockEnd = 0x21,
            StandardDimstyle = 0x27,
        };

        const char* const continuous = "Continuous";

        // group code / value pairs, one per line each
        void group(std::ostream& out, int code, const std::string& value) {
            out << code << "\n" << value << "\n";
        }

        void group(std::ostream& out, int code, const char* value) {
            out << code << "\n" << value << "\n";
        }

        void group(std::ostream& out, int code, int value) {
            out << code << "\n" << value << "\n";
        }

        void group(std::ostream& out, int code, double value) {
            out << code << "\n" << boost::format("%.6f") % value << "\n";
        }

        void coordinates(std::ostream& out, int code, const Point& p) {
            group(out, code, p.x);
            group(out, code + 10, p.y);
            group(out, code + 20, 0.0);
        }

        std::string handle(unsigned value) {
            return (boost::format("%X") % value).str();
        }

        void beginSection(std::ostream& out, const char* name) {
            group(out, 0, "SECTION");
            group(out, 2, name);
        }

        void endSection(std::ostream& out) {
            group(out, 0, "ENDSEC");
        }

        void beginTable(std::ostream& out, const char* name, unsigned table_handle, int records) {
            group(out, 0, "TABLE");
            group(out, 2, name);
            group(out, 5, handle(table_handle));
            group(out, 330, "0");
            group(out, 100, "AcDbSymbolTable");
            group(out, 70, records);
        }

        void endTable(std::ostream& out) {
            group(out, 0, "ENDTAB");
        }

        void beginRecord(std::ostream& out, const char* type, unsigned record_handle, unsigned table_handle, const char* subclass) {
            group(out, 0, type);
            group(out, 5, handle(record_handle));
            group(out, 330, handle(table_handle));
            group(out, 100, "AcDbSymbolTableRecord");
            group(out, 100, subclass);
        }

        void linetype(std::ostream& out, unsigned record_handle, const char* name, const char* description) {
            beginRecord(out, "LTYPE", record_handle, LinetypeTable, "AcDbLinetypeTableRecord");
            group(out, 2, name);
            group(out, 70, 0);
            group(out, 3, description);
            group(out, 72, 65);
            group(out, 73, 0);
            group(out, 40, 0.0);
        }

        void layoutBlock(std::ostream& out, const char* name, unsigned begin_handle, unsigned end_handle,
                         unsigned record_handle, bool paper_space) {
            group(out, 0, "BLOCK");
            group(out, 5, handle(begin_handle));
            group(out, 330, handle(record_handle));
            group(out, 100, "AcDbEntity");
            if (paper_space)
                group(out, 67, 1);
            group(out, 8, "0");
            group(out, 100, "AcDbBlockBegin");
            group(out, 2, name);
            group(out, 70, 0);
            coordinates(out, 10, Point());
            group(out, 3, name);
            group(out, 1, "");

            group(out, 0, "ENDBLK");
            group(out, 5, handle(end_handle));
            group(out, 330, handle(record_handle));
            group(out, 100, "AcDbEntity");
            if (paper_space)
                group(out, 67, 1);
            group(out, 8, "0");
            group(out, 100, "AcDbBlockEnd");
        }
    }

    const char* dxf_version_code(DxfVersion version) {
        switch (version) {
        case DxfVersion::R12: return "AC1009";
        case DxfVersion::R2000: return "AC1015";
        case DxfVersion::R2010: return "AC1024";
        default: return "AC1024";
        }
    }

    DxfWriter::DxfWriter(DxfVersion version)
        : m_version(version) {
        if (version == DxfVersion::R12) {
            throw ExportUnavailableError("DXF R12 cannot hold LWPOLYLINE and SPLINE entities, use R2000 or newer");
        }
        m_layers.emplace_back("0", 7);
    }

    void DxfWriter::addLayer(const std::string& name, int color) {
        for (const auto& layer : m_layers) {
            if (layer.first == name)
                return;
        }
        m_layers.emplace_back(name, color);
    }

    void DxfWriter::beginEntity(const char* type, const std::string& layer, const char* subclass) {
        group(m_entities, 0, type);
        group(m_entities, 5, handle(nextHandle()));
        group(m_entities, 330, handle(ModelSpaceRecord));
        group(m_entities, 100, "AcDbEntity");
        group(m_entities, 8, layer);
        group(m_entities, 100, subclass);
        ++m_entity_count;
    }

    void DxfWriter::addPoint(const Point& point, const std::string& layer) {
        beginEntity("POINT", layer, "AcDbPoint");
        coordinates(m_entities, 10, point);
    }

    void DxfWriter::addCircle(const Point& centre, double radius, const std::string& layer) {
        beginEntity("CIRCLE", layer, "AcDbCircle");
        coordinates(m_entities, 10, centre);
        group(m_entities, 40, radius);
    }

    void DxfWriter::addPolyline(const std::vector<Point>& points, bool closed, const std::string& layer) {
        beginEntity("LWPOLYLINE", layer, "AcDbPolyline");
        group(m_entities, 90, static_cast<int>(points.size()));
        group(m_entities, 70, closed ? 1 : 0);
        for (const Point& p : points) {
            group(m_entities, 10, p.x);
            group(m_entities, 20, p.y);
        }
    }

    void DxfWriter::addSpline(const std::vector<Point>& fit_points, bool closed, const std::string& layer) {
        // flags: 1 closed, 8 planar
        const int flags = (closed ? 1 : 0) | 8;

        beginEntity("SPLINE", layer, "AcDbSpline");
        group(m_entities, 210, 0.0);
        group(m_entities, 220, 0.0);
        group(m_entities, 230, 1.0);
        group(m_entities, 70, flags);
        group(m_entities, 71, 3);
        group(m_entities, 72, 0);
        group(m_entities, 73, 0);
        group(m_entities, 74, static_cast<int>(fit_points.size()));
        group(m_entities, 44, 1e-10);
        for (const Point& p : fit_points) {
            coordinates(m_entities, 11, p);
        }
    }

    std::string DxfWriter::str() const {
        std::ostringstream out;
        const unsigned first_layer_handle = m_next_handle;
        const unsigned handseed = first_layer_handle + static_cast<unsigned>(m_layers.size());

        beginSection(out, "HEADER");
        group(out, 9, "$ACADVER");
        group(out, 1, dxf_version_code(m_version));
        group(out, 9, "$HANDSEED");
        group(out, 5, handle(handseed));
        // millimetres
        group(out, 9, "$INSUNITS");
        group(out, 70, 4);
        endSection(out);

        beginSection(out, "CLASSES");
        endSection(out);

        beginSection(out, "TABLES");

        beginTable(out, "VPORT", VportTable, 0);
        endTable(out);

        beginTable(out, "LTYPE", LinetypeTable, 3);
        linetype(out, ByBlockLinetype, "ByBlock", "");
        linetype(out, ByLayerLinetype, "ByLayer", "");
        linetype(out, ContinuousLinetype, continuous, "Solid line");
        endTable(out);

        beginTable(out, "LAYER", LayerTable, static_cast<int>(m_layers.size()));
        unsigned layer_handle = first_layer_handle;
        for (const auto& layer : m_layers) {
            beginRecord(out, "LAYER", layer_handle++, LayerTable, "AcDbLayerTableRecord");
            group(out, 2, layer.first);
            group(out, 70, 0);
            group(out, 62, layer.second);
            group(out, 6, continuous);
        }
        endTable(out);

        beginTable(out, "STYLE", StyleTable, 1);
        beginRecord(out, "STYLE", StandardStyle, StyleTable, "AcDbTextStyleTableRecord");
        group(out, 2, "Standard");
        group(out, 70, 0);
        group(out, 40, 0.0);
        group(out, 41, 1.0);
        group(out, 50, 0.0);
        group(out, 71, 0);
        group(out, 42, 2.5);
        group(out, 3, "txt");
        group(out, 4, "");
        endTable(out);

        beginTable(out, "VIEW", ViewTable, 0);
        endTable(out);

        beginTable(out, "UCS", UcsTable, 0);
        endTable(out);

        beginTable(out, "APPID", AppidTable, 1);
        beginRecord(out, "APPID", AcadAppid, AppidTable, "AcDbRegAppTableRecord");
        group(out, 2, "ACAD");
        group(out, 70, 0);
        endTable(out);

        // dimension styles carry their handle in group 105
        beginTable(out, "DIMSTYLE", DimstyleTable, 1);
        group(out, 100, "AcDbDimStyleTable");
        group(out, 71, 0);
        group(out, 0, "DIMSTYLE");
        group(out, 105, handle(StandardDimstyle));
        group(out, 330, handle(DimstyleTable));
        group(out, 100, "AcDbSymbolTableRecord");
        group(out, 100, "AcDbDimStyleTableRecord");
        group(out, 2, "Standard");
        group(out, 70, 0);
        endTable(out);

        beginTable(out, "BLOCK_RECORD", BlockRecordTable, 2);
        beginRecord(out, "BLOCK_RECORD", ModelSpaceRecord, BlockRecordTable, "AcDbBlockTableRecord");
        group(out, 2, "*Model_Space");
        beginRecord(out, "BLOCK_RECORD", PaperSpaceRecord, BlockRecordTable, "AcDbBlockTableRecord");
        group(out, 2, "*Paper_Space");
        endTable(out);

        endSection(out);

        beginSection(out, "BLOCKS");
        layoutBlock(out, "*Model_Space", ModelSpaceBlock, ModelSpaceBlockEnd, ModelSpaceRecord, false);
        layoutBlock(out, "*Paper_Space", PaperSpaceBlock, PaperSpaceBlockEnd, PaperSpaceRecord, true);
        endSection(out);

        beginSection(out, "ENTITIES");
        out << m_entities.str();
        endSection(out);

        beginSection(out, "OBJECTS");
        group(out, 0, "DICTIONARY");
        group(out, 5, handle(RootDictionary));
        group(out, 330, "0");
        group(out, 100, "AcDbDictionary");
        group(out, 281, 1);
        group(out, 3, "ACAD_GROUP");
        group(out, 350, handle(GroupDictionary));
        group(out, 0, "DICTIONARY");
        group(out, 5, handle(GroupDictionary));
        group(out, 330, handle(RootDictionary));
        group(out, 100, "AcDbDictionary");
        group(out, 281, 1);
        endSection(out);

        group(out, 0, "EOF");

        return out.str();
    }

    std::string generate_dxf(const CurveSet& curves, const ParameterSet& params, double phi, DxfVersion version) {
        DxfWriter writer(version);
        for (Layer layer : dxf_layers()) {
            const LayerStyle& style = layer_style(layer);
            writer.addLayer(style.name, style.dxf_color);
        }

        const std::string center_axis = layer_name(Layer::CenterAxis);
        const std::string pin_centers = layer_name(Layer::PinCenters);
        const std::string outer_ring = layer_name(Layer::OuterRing);
        const std::string output_pins = layer_name(Layer::OutputPins);
        const std::string output_holes = layer_name(Layer::OutputHoles);
        const std::string camshaft_hole = layer_name(Layer::CamshaftHole);
        const std::string eccentric_cam = layer_name(Layer::EccentricCam);
        const std::string cycloid_disk = layer_name(Layer::CycloidDisk);

        const Point disk_center = params.eccentricOffset(phi);

        writer.addPoint(Point(), center_axis);

        for (const Point& centre : pinCenters(params.numExternalPins(), params.ringDiameter()))
            writer.addPoint(centre, pin_centers);

        if (params.showOuterRing()) {
            const std::vector<Curve>& housing = curves.curves(Layer::OuterRing);
            if (housing.empty())
                throw LogicError("outer ring is enabled but the curve set has no housing profile");
            writer.addPolyline(housing.front().uniquePoints(), true, outer_ring);
            writer.addCircle(Point(), params.ringRadius() + params.outerRingWidth(), outer_ring);
        }

        const std::vector<Point> pin_positions = outputPinCenters(params.numOutputPins(), params.numExternalPins(),
                                                                  params.outputDiskDiameter(), phi);
        for (const Point& centre : pin_positions)
            writer.addCircle(centre, params.outputPinDiameter() / 2.0, output_pins);

        for (const Point& centre : pin_positions)
            writer.addCircle(centre + disk_center, params.outputHoleRadius(), output_holes);

        writer.addCircle(Point(), params.camshaftHoleRadius(), camshaft_hole);
        writer.addCircle(disk_center, eccentricShaftRadius(params.eccentricity(), params.camshaftDiameter()), eccentric_cam);

        const std::vector<Curve>& disk = curves.curves(Layer::CycloidDisk);
        if (disk.empty())
            throw LogicError("curve set has no cycloid disk");
        writer.addSpline(disk.front().uniquePoints(), true, cycloid_disk);

        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% entities, DXF %2%")
            % writer.entityCount() % dxf_version_code(version);
        return writer.str();
    }

} // namespace cyclodrive
