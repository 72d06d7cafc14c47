/**
 * @file curve.cpp
 * @brief Curve and curve set implementation
 */

#include "cyclodrive/core/curve.h"

namespace cyclodrive {

    namespace {
        // AutoCAD colour index for DXF,
        // hex stroke for SVG.
        const LayerStyle layer_styles[] = {
            /* CycloidDisk */  { "CYCLOID_DISK",  1, "#FF4444", 0.8 },
            /* OutputPins */   { "OUTPUT_PINS",   3, "#44FF44", 0.5 },
            /* OutputHoles */  { "OUTPUT_HOLES",  6, "#FF44FF", 0.5 },
            /* CamshaftHole */ { "CAMSHAFT_HOLE", 5, "#4444FF", 0.6 },
            /* EccentricCam */ { "ECCENTRIC_CAM", 2, "#FFAA00", 0.5 },
            /* OuterRing */    { "OUTER_RING",    8, "#888888", 0.6 },
            /* PinCenters */   { "PIN_CENTERS",   7, "#FFFFFF", 0.5 },
            /* CenterAxis */   { "CENTER_AXIS",   4, "#44FFFF", 0.5 },
            /* ExternalPins */ { "EXTERNAL_PINS", 8, "#666666", 0.5 },
        };

        const std::vector<Curve> no_curves;
    }

    const LayerStyle& layer_style(Layer layer) {
        return layer_styles[static_cast<size_t>(layer)];
    }

    std::string layer_name(Layer layer) {
        return layer_style(layer).name;
    }

    const std::array<Layer, 8>& dxf_layers() {
        static const std::array<Layer, 8> layers = {
            Layer::CycloidDisk,
            Layer::OutputPins,
            Layer::OutputHoles,
            Layer::CamshaftHole,
            Layer::EccentricCam,
            Layer::OuterRing,
            Layer::PinCenters,
            Layer::CenterAxis,
        };
        return layers;
    }

    Curve::Curve(std::vector<Point> pts, bool is_closed, Layer tag)
        : points(std::move(pts)), closed(is_closed), layer(tag) {
    }

    bool Curve::isClosedLoop(double tolerance) const {
        if (points.size() < 2) {
            return false;
        }
        return points.front().isClose(points.back(), tolerance);
    }

    std::vector<Point> Curve::uniquePoints() const {
        if (closed && isClosedLoop()) {
            return std::vector<Point>(points.begin(), points.end() - 1);
        }
        return points;
    }

    Point Curve::centroid() const {
        std::vector<Point> pts = uniquePoints();
        Point sum;
        if (pts.empty()) {
            return sum;
        }
        for (const Point& p : pts) {
            sum += p;
        }
        return sum / static_cast<double>(pts.size());
    }

    std::vector<float> line_strip_vertices(const Curve& curve) {
        std::vector<float> vertices;
        vertices.reserve(curve.points.size() * 3);
        for (const Point& p : curve.points) {
            vertices.push_back(static_cast<float>(p.x));
            vertices.push_back(static_cast<float>(p.y));
            vertices.push_back(0.0f);
        }
        return vertices;
    }

    void CurveSet::add(Curve curve) {
        Layer layer = curve.layer;
        m_layers[layer].push_back(std::move(curve));
    }

    void CurveSet::add(std::vector<Curve> curves) {
        for (Curve& curve : curves) {
            add(std::move(curve));
        }
    }

    bool CurveSet::has(Layer layer) const {
        return m_layers.find(layer) != m_layers.end();
    }

    const std::vector<Curve>& CurveSet::curves(Layer layer) const {
        auto it = m_layers.find(layer);
        return it == m_layers.end() ? no_curves : it->second;
    }

    size_t CurveSet::curveCount() const {
        size_t count = 0;
        for (const auto& item : m_layers) {
            count += item.second.size();
        }
        return count;
    }

    size_t CurveSet::pointCount() const {
        size_t count = 0;
        for (const auto& item : m_layers) {
            for (const Curve& curve : item.second) {
                count += curve.size();
            }
        }
        return count;
    }

    std::vector<std::vector<float>> CurveSet::lineStrips(Layer layer) const {
        std::vector<std::vector<float>> strips;
        for (const Curve& curve : curves(layer)) {
            strips.push_back(line_strip_vertices(curve));
        }
        return strips;
    }

} // namespace cyclodrive
