/**
 * @file test_export.cpp
 * @brief Unit tests for DXF and SVG output and the file exporter
 */

#include "cyclodrive/export/exporter.h"
#include "cyclodrive/export/svg_writer.h"
#include "cyclodrive/geometry/gearbox.h"
#include "cyclodrive/core/exception.h"
#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <boost/nowide/fstream.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cyclodrive {
namespace {

size_t Count(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
        ++n;
    return n;
}

// Group code / value pairs of a DXF document
std::vector<std::pair<int, std::string>> Groups(const std::string& dxf) {
    std::vector<std::pair<int, std::string>> groups;
    std::istringstream in(dxf);
    std::string code, value;
    while (std::getline(in, code) && std::getline(in, value))
        groups.emplace_back(std::stoi(code), value);
    return groups;
}

// Sections, tables, symbols, handles and entity owners of a DXF document
struct DxfOutline {
    std::vector<std::string> sections;
    std::vector<std::string> tables;
    std::set<std::string> linetypes;
    std::set<std::string> layer_linetypes;
    std::set<std::string> layers;
    std::vector<std::string> blocks;
    std::vector<unsigned long> handles;
    unsigned long handseed = 0;
    std::string model_space;
    std::vector<std::string> entity_owners;
    size_t dictionaries = 0;
};

DxfOutline Outline(const std::string& dxf) {
    const auto groups = Groups(dxf);
    DxfOutline outline;
    std::string section, type, record_handle;
    for (size_t i = 0; i < groups.size(); ++i) {
        const int code = groups[i].first;
        const std::string& value = groups[i].second;
        if (code == 0) {
            type = value;
            if (value == "SECTION" && i + 1 < groups.size()) {
                section = groups[i + 1].second;
                outline.sections.push_back(section);
            }
            else if (value == "TABLE" && i + 1 < groups.size())
                outline.tables.push_back(groups[i + 1].second);
            else if (section == "ENTITIES" && value != "ENDSEC")
                outline.entity_owners.emplace_back();
            else if (section == "OBJECTS" && value == "DICTIONARY")
                ++outline.dictionaries;
            continue;
        }
        if (code == 9 && value == "$HANDSEED" && i + 1 < groups.size()) {
            outline.handseed = std::stoul(groups[++i].second, nullptr, 16);
            continue;
        }
        if (code == 5 || code == 105) {
            outline.handles.push_back(std::stoul(value, nullptr, 16));
            record_handle = value;
        }
        if (type == "LTYPE" && code == 2)
            outline.linetypes.insert(value);
        else if (type == "LAYER" && code == 2)
            outline.layers.insert(value);
        else if (type == "LAYER" && code == 6)
            outline.layer_linetypes.insert(value);
        else if (type == "BLOCK_RECORD" && code == 2 && value == "*Model_Space")
            outline.model_space = record_handle;
        else if (type == "BLOCK" && code == 2)
            outline.blocks.push_back(value);
        else if (section == "ENTITIES" && code == 330 && !outline.entity_owners.empty())
            outline.entity_owners.back() = value;
    }
    return outline;
}

ParameterSet Params(bool outer_ring) {
    ParameterValues values;
    values.show_outer_ring = outer_ring;
    return ParameterSet(values);
}

// =============================================================================
// DXF
// =============================================================================

TEST(DxfWriterTest, R12IsUnavailable) {
    EXPECT_THROW({ DxfWriter writer(DxfVersion::R12); }, ExportUnavailableError);
    EXPECT_STREQ(dxf_version_code(DxfVersion::R2000), "AC1015");
    EXPECT_STREQ(dxf_version_code(DxfVersion::R2010), "AC1024");
}

TEST(DxfWriterTest, DocumentStructure) {
    DxfWriter writer(DxfVersion::R2000);
    writer.addLayer("A", 1);
    writer.addLayer("A", 2);
    writer.addCircle(Point(1.0, 2.0), 3.0, "A");
    writer.addPolyline({ Point(0, 0), Point(1, 0), Point(1, 1) }, true, "A");
    EXPECT_EQ(writer.entityCount(), 2u);

    const auto groups = Groups(writer.str());
    ASSERT_FALSE(groups.empty());
    EXPECT_EQ(groups.front(), std::make_pair(0, std::string("SECTION")));
    EXPECT_EQ(groups.back(), std::make_pair(0, std::string("EOF")));

    size_t layers = 0;
    bool version = false;
    for (size_t i = 0; i + 1 < groups.size(); ++i) {
        if (groups[i] == std::make_pair(0, std::string("LAYER")))
            ++layers;
        if (groups[i] == std::make_pair(9, std::string("$ACADVER")))
            version = groups[i + 1].second == "AC1015";
    }
    // "0" plus "A"
    EXPECT_EQ(layers, 2u);
    EXPECT_TRUE(version);
}

TEST(DxfWriterTest, ClosedPolylineSetsTheFlag) {
    DxfWriter writer;
    writer.addPolyline({ Point(0, 0), Point(1, 0), Point(1, 1), Point(0, 1) }, true, "A");
    const auto groups = Groups(writer.str());

    bool in_polyline = false;
    int vertices = -1;
    int flags = -1;
    for (const auto& g : groups) {
        if (g.first == 0)
            in_polyline = g.second == "LWPOLYLINE";
        else if (in_polyline && g.first == 90)
            vertices = std::stoi(g.second);
        else if (in_polyline && g.first == 70)
            flags = std::stoi(g.second);
    }
    EXPECT_EQ(vertices, 4);
    EXPECT_EQ(flags, 1);
}

class GearboxDxfTest : public ::testing::Test {
protected:
    std::string Generate(bool outer_ring, double phi = 0.6) {
        ParameterSet params = Params(outer_ring);
        CurveSet curves = generate_gearbox(params, phi, Resolution::for_export());
        return generate_dxf(curves, params, phi);
    }
};

TEST_F(GearboxDxfTest, EntitiesPerLayer) {
    const auto groups = Groups(Generate(true));

    std::map<std::string, std::map<std::string, int>> entities;
    std::string type;
    for (const auto& g : groups) {
        if (g.first == 0)
            type = g.second;
        else if (g.first == 8)
            entities[g.second][type]++;
    }

    EXPECT_EQ(entities["CENTER_AXIS"]["POINT"], 1);
    EXPECT_EQ(entities["PIN_CENTERS"]["POINT"], 24);
    EXPECT_EQ(entities["OUTPUT_PINS"]["CIRCLE"], 7);
    EXPECT_EQ(entities["OUTPUT_HOLES"]["CIRCLE"], 7);
    EXPECT_EQ(entities["CAMSHAFT_HOLE"]["CIRCLE"], 1);
    EXPECT_EQ(entities["ECCENTRIC_CAM"]["CIRCLE"], 1);
    EXPECT_EQ(entities["CYCLOID_DISK"]["SPLINE"], 1);
    EXPECT_EQ(entities["OUTER_RING"]["LWPOLYLINE"], 1);
    EXPECT_EQ(entities["OUTER_RING"]["CIRCLE"], 1);
}

TEST_F(GearboxDxfTest, DocumentSkeleton) {
    const DxfOutline outline = Outline(Generate(true, 0.5));

    EXPECT_EQ(outline.sections,
              (std::vector<std::string>{ "HEADER", "CLASSES", "TABLES", "BLOCKS", "ENTITIES", "OBJECTS" }));
    for (const char* table : { "LTYPE", "LAYER", "STYLE", "APPID", "DIMSTYLE", "BLOCK_RECORD" })
        EXPECT_NE(std::find(outline.tables.begin(), outline.tables.end(), table), outline.tables.end()) << table;

    EXPECT_EQ(outline.linetypes, (std::set<std::string>{ "ByBlock", "ByLayer", "Continuous" }));
    ASSERT_FALSE(outline.layer_linetypes.empty());
    for (const std::string& linetype : outline.layer_linetypes)
        EXPECT_EQ(outline.linetypes.count(linetype), 1u) << linetype;
    EXPECT_EQ(outline.layers.count("0"), 1u);
    EXPECT_EQ(outline.layers.size(), 9u);

    EXPECT_EQ(outline.blocks, (std::vector<std::string>{ "*Model_Space", "*Paper_Space" }));
    EXPECT_GE(outline.dictionaries, 1u);
}

TEST_F(GearboxDxfTest, EntitiesBelongToModelSpace) {
    const DxfOutline outline = Outline(Generate(true, 0.5));
    ASSERT_FALSE(outline.model_space.empty());
    // 25 points, 17 circles, the housing polyline and the disk spline
    ASSERT_EQ(outline.entity_owners.size(), 44u);
    for (const std::string& owner : outline.entity_owners)
        EXPECT_EQ(owner, outline.model_space);
}

TEST_F(GearboxDxfTest, HandlesAreUniqueAndBelowTheSeed) {
    const DxfOutline outline = Outline(Generate(true, 0.5));
    std::vector<unsigned long> handles = outline.handles;
    ASSERT_FALSE(handles.empty());
    std::sort(handles.begin(), handles.end());
    EXPECT_EQ(std::adjacent_find(handles.begin(), handles.end()), handles.end());
    EXPECT_GT(outline.handseed, handles.back());
}

TEST_F(GearboxDxfTest, DiskSplineIsClosedWithSixtyFitPointsPerLobe) {
    const auto groups = Groups(Generate(false));

    bool in_spline = false;
    int flags = -1;
    int fit_points = -1;
    size_t fit_x = 0;
    for (const auto& g : groups) {
        if (g.first == 0)
            in_spline = g.second == "SPLINE";
        else if (in_spline && g.first == 70)
            flags = std::stoi(g.second);
        else if (in_spline && g.first == 74)
            fit_points = std::stoi(g.second);
        else if (in_spline && g.first == 11)
            ++fit_x;
    }
    EXPECT_EQ(flags & 1, 1);
    EXPECT_EQ(fit_points, 23 * 60 - 1);
    EXPECT_EQ(fit_x, static_cast<size_t>(fit_points));
}

TEST_F(GearboxDxfTest, HousingOnlyWhenEnabled) {
    const std::string dxf = Generate(false);
    EXPECT_EQ(Count(dxf, "\nLWPOLYLINE\n"), 0u);
    // the layer itself is always declared
    EXPECT_NE(dxf.find("OUTER_RING"), std::string::npos);
}

TEST_F(GearboxDxfTest, DegenerateEccentricShaft) {
    ParameterValues values;
    values.camshaft_diameter = 2.0;
    ParameterSet params(values);
    CurveSet curves;
    EXPECT_THROW(generate_dxf(curves, params, 0.0), DegenerateGeometryError);
}

// =============================================================================
// SVG
// =============================================================================

TEST(SvgTest, ViewBoxCoversTheHousing) {
    EXPECT_DOUBLE_EQ(svg_view_radius(Params(false)), 50.0);
    EXPECT_DOUBLE_EQ(svg_view_radius(Params(true)), 65.0);

    ParameterSet params = Params(false);
    const std::string svg = generate_svg(generate_gearbox(params, 0.0, Resolution::for_export()), params);
    EXPECT_NE(svg.find("viewBox=\"-50 -50 100 100\""), std::string::npos);
    EXPECT_NE(svg.find("<g transform=\"scale(1,-1)\">"), std::string::npos);
}

TEST(SvgTest, OnePathPerCurveWithLayerStroke) {
    ParameterSet params = Params(true);
    CurveSet curves = generate_gearbox(params, 1.0, Resolution::for_export());
    const std::string svg = generate_svg(curves, params);

    EXPECT_EQ(Count(svg, "<path "), curves.curveCount());
    EXPECT_EQ(Count(svg, "fill=\"none\""), curves.curveCount());
    EXPECT_EQ(Count(svg, "stroke=\"#666666\""), 24u);
    EXPECT_EQ(Count(svg, "stroke=\"#FF4444\""), 1u);
    EXPECT_EQ(Count(svg, "stroke=\"#888888\""), 2u);
    EXPECT_EQ(Count(svg, " Z\""), curves.curveCount());
}

TEST(SvgTest, PathCoordinatesUseThreeDecimals) {
    SvgWriter writer(10.0);
    writer.addPath(Curve({ Point(1.0, 2.0), Point(3.25, -4.5), Point(1.0, 2.0) }, true, Layer::CamshaftHole));
    const std::string svg = writer.str();
    EXPECT_NE(svg.find("d=\"M 1.000,2.000 L 3.250,-4.500 Z\""), std::string::npos);
    EXPECT_NE(svg.find("stroke=\"#4444FF\" stroke-width=\"0.6\""), std::string::npos);
}

// =============================================================================
// Exporter
// =============================================================================

TEST(ExportFormatTest, FromPathAndName) {
    EXPECT_EQ(format_from_path("drive.dxf"), ExportFormat::DXF);
    EXPECT_EQ(format_from_path("out/Drive.SVG"), ExportFormat::SVG);
    EXPECT_THROW(format_from_path("drive.step"), ExportUnavailableError);
    EXPECT_THROW(format_from_path("drive"), ExportUnavailableError);
    EXPECT_EQ(format_from_name("Dxf"), ExportFormat::DXF);
    EXPECT_STREQ(format_name(ExportFormat::SVG), "svg");

    EXPECT_EQ(dxf_version_from_name("r2000"), DxfVersion::R2000);
    EXPECT_THROW(dxf_version_from_name("R14"), InvalidArgument);
}

class ExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cyclodrive-export-%%%%-%%%%");
        boost::filesystem::create_directories(dir);
    }

    void TearDown() override {
        boost::system::error_code ec;
        boost::filesystem::remove_all(dir, ec);
    }

    std::string Read(const boost::filesystem::path& path) {
        boost::nowide::ifstream file(path.string());
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    boost::filesystem::path dir;
};

TEST_F(ExporterTest, WritesBothFormats) {
    ParameterSet params = Params(true);
    const boost::filesystem::path dxf = dir / "drive.dxf";
    const boost::filesystem::path svg = dir / "drive.svg";

    export_gearbox(dxf.string(), ExportFormat::DXF, params, 0.4);
    export_gearbox(svg.string(), ExportFormat::SVG, params, 0.4);

    EXPECT_EQ(Read(dxf), generate_document(ExportFormat::DXF, params, 0.4));
    EXPECT_NE(Read(svg).find("<svg"), std::string::npos);
    EXPECT_FALSE(boost::filesystem::exists(dir / "drive.dxf.tmp"));
}

TEST_F(ExporterTest, R12WritesNothing) {
    const boost::filesystem::path path = dir / "drive.dxf";
    ExportOptions options;
    options.dxf_version = DxfVersion::R12;
    EXPECT_THROW(export_gearbox(path.string(), ExportFormat::DXF, Params(false), 0.0, options), ExportUnavailableError);
    EXPECT_FALSE(boost::filesystem::exists(path));
}

TEST_F(ExporterTest, DegenerateWritesNothing) {
    ParameterValues values;
    values.camshaft_diameter = 2.0;
    ParameterSet params(values);

    for (ExportFormat format : { ExportFormat::DXF, ExportFormat::SVG }) {
        const boost::filesystem::path path = dir / (std::string("drive.") + format_name(format));
        EXPECT_THROW(export_gearbox(path.string(), format, params, 0.3), DegenerateGeometryError);
        EXPECT_FALSE(boost::filesystem::exists(path));
        EXPECT_FALSE(boost::filesystem::exists(path.string() + ".tmp"));
    }
    EXPECT_TRUE(boost::filesystem::is_empty(dir));
}

TEST_F(ExporterTest, UnwritableTargetIsAnIOError) {
    const boost::filesystem::path path = dir / "missing" / "drive.svg";
    EXPECT_THROW(export_gearbox(path.string(), ExportFormat::SVG, Params(false), 0.0), FileIOError);
    EXPECT_FALSE(boost::filesystem::exists(path));
    EXPECT_FALSE(boost::filesystem::exists(dir / "missing"));
}

TEST_F(ExporterTest, ExistingFileIsReplaced) {
    const boost::filesystem::path path = dir / "drive.svg";
    write_document(path.string(), "old");
    write_document(path.string(), "new contents");
    EXPECT_EQ(Read(path), "new contents");
}

} // namespace
} // namespace cyclodrive
