/**
 * @file export_gearbox.cpp
 * @brief Exports the default gearbox with housing to DXF and SVG and checks the files
 */

#include "cyclodrive/cyclodrive.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

    std::string read_file(const std::string& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    size_t count(const std::string& text, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
            ++n;
        return n;
    }

}

int main() {
    std::cout << "=== Cycloidal Drive Export Test ===" << std::endl;

    cyclodrive::set_log_path_and_level("", 3);

    cyclodrive::ParameterValues values;
    values.show_outer_ring = true;
    cyclodrive::ParameterSet params(values);
    const double phase = 0.75;

    std::cout << "Parameters:" << std::endl;
    std::cout << "  " << params.toString() << std::endl;
    std::cout << "  Phase: " << phase << " rad" << std::endl;
    std::cout << std::endl;

    const std::string dxf_file = "test_export_gearbox_output.dxf";
    const std::string svg_file = "test_export_gearbox_output.svg";

    try {
        std::cout << "Exporting DXF and SVG..." << std::endl;
        cyclodrive::export_gearbox(dxf_file, cyclodrive::ExportFormat::DXF, params, phase);
        cyclodrive::export_gearbox(svg_file, cyclodrive::ExportFormat::SVG, params, phase);
    }
    catch (const std::exception& err) {
        std::cerr << "Export failed: " << err.what() << std::endl;
        return 1;
    }

    const std::string dxf = read_file(dxf_file);
    const std::string svg = read_file(svg_file);
    std::cout << "DXF: " << dxf.size() << " bytes, SVG: " << svg.size() << " bytes" << std::endl;

    std::cout << std::endl << "Validating DXF..." << std::endl;

    // 24 pin centres plus the origin
    bool has_version = dxf.find("AC1024") != std::string::npos;
    bool has_layers = dxf.find("CYCLOID_DISK") != std::string::npos && dxf.find("CENTER_AXIS") != std::string::npos;
    bool has_spline = count(dxf, "\nSPLINE\n") == 1;
    bool has_housing = count(dxf, "\nLWPOLYLINE\n") == 1;
    bool has_points = count(dxf, "\nPOINT\n") == 25;
    // 7 output pins, 7 holes, camshaft, eccentric, housing outline
    bool has_circles = count(dxf, "\nCIRCLE\n") == 17;
    bool has_eof = dxf.find("EOF") != std::string::npos;

    std::cout << "  Version: " << (has_version ? "✓" : "✗") << std::endl;
    std::cout << "  Layers: " << (has_layers ? "✓" : "✗") << std::endl;
    std::cout << "  Disk spline: " << (has_spline ? "✓" : "✗") << std::endl;
    std::cout << "  Housing polyline: " << (has_housing ? "✓" : "✗") << std::endl;
    std::cout << "  Points: " << (has_points ? "✓" : "✗") << std::endl;
    std::cout << "  Circles: " << (has_circles ? "✓" : "✗") << std::endl;
    std::cout << "  EOF: " << (has_eof ? "✓" : "✗") << std::endl;

    std::cout << std::endl << "Validating SVG..." << std::endl;

    // 24 pins, disk, 7 output pins, 7 holes, camshaft, eccentric, 2 housing outlines
    bool has_view_box = svg.find("viewBox=\"-65 -65 130 130\"") != std::string::npos;
    bool has_flip = svg.find("scale(1,-1)") != std::string::npos;
    bool has_paths = count(svg, "<path ") == 43;
    bool has_disk_stroke = svg.find("#FF4444") != std::string::npos;
    bool has_ring_stroke = svg.find("#888888") != std::string::npos;

    std::cout << "  View box: " << (has_view_box ? "✓" : "✗") << std::endl;
    std::cout << "  Y flip: " << (has_flip ? "✓" : "✗") << std::endl;
    std::cout << "  Paths: " << (has_paths ? "✓" : "✗") << std::endl;
    std::cout << "  Disk stroke: " << (has_disk_stroke ? "✓" : "✗") << std::endl;
    std::cout << "  Housing stroke: " << (has_ring_stroke ? "✓" : "✗") << std::endl;

    if (has_version && has_layers && has_spline && has_housing && has_points && has_circles && has_eof &&
        has_view_box && has_flip && has_paths && has_disk_stroke && has_ring_stroke) {
        std::cout << std::endl << "✅ All tests PASSED!" << std::endl;
        return 0;
    } else {
        std::cerr << std::endl << "❌ Some tests FAILED!" << std::endl;
        return 1;
    }
}
