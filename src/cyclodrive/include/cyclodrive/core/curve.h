/**
 * @file curve.h
 * @brief Curves, layers and the per-frame curve set
 */

#ifndef CYCLODRIVE_CURVE_H
#define CYCLODRIVE_CURVE_H

#include "cyclodrive/core/point.h"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace cyclodrive {

    /**
     * @brief Semantic tag of a curve family
     *
     * ExternalPins has no DXF layer of its own; the DXF exporter writes the
     * pin centres to PinCenters instead.
     */
    enum class Layer {
        CycloidDisk,
        OutputPins,
        OutputHoles,
        CamshaftHole,
        EccentricCam,
        OuterRing,
        PinCenters,
        CenterAxis,
        ExternalPins,
    };

    /**
     * @brief Presentation data attached to a layer
     */
    struct LayerStyle {
        const char* name;         ///< DXF layer name
        int dxf_color;            ///< AutoCAD colour index
        const char* svg_stroke;   ///< SVG stroke colour
        double svg_stroke_width;  ///< SVG stroke width
    };

    const LayerStyle& layer_style(Layer layer);

    std::string layer_name(Layer layer);

    /**
     * @brief Layers in DXF table order
     */
    const std::array<Layer, 8>& dxf_layers();

    /**
     * @class Curve
     * @brief Ordered point sequence with a closed flag and a layer tag
     *
     * A closed curve repeats its first point at the end, so a line strip
     * through all points draws the complete loop.
     */
    class Curve {
    public:
        std::vector<Point> points;
        bool closed = true;
        Layer layer = Layer::CycloidDisk;

        Curve() = default;
        Curve(std::vector<Point> pts, bool is_closed, Layer tag);

        size_t size() const { return points.size(); }
        bool empty() const { return points.empty(); }

        /**
         * @brief True if the first and last point coincide within tolerance
         */
        bool isClosedLoop(double tolerance = 1e-9) const;

        /**
         * @brief Points without the repeated closing point
         *
         * Exporters use this for entities that carry their own closed flag.
         */
        std::vector<Point> uniquePoints() const;

        /**
         * @brief Average of uniquePoints()
         */
        Point centroid() const;
    };

    /**
     * @brief Flat x,y,z float array (z = 0) for a line strip renderer
     */
    std::vector<float> line_strip_vertices(const Curve& curve);

    /**
     * @class CurveSet
     * @brief All curves of one (parameters, phase) evaluation, keyed by layer
     */
    class CurveSet {
    public:
        void add(Curve curve);
        void add(std::vector<Curve> curves);

        bool has(Layer layer) const;

        /**
         * @brief Curves of a layer, empty if the layer was not generated
         */
        const std::vector<Curve>& curves(Layer layer) const;

        const std::map<Layer, std::vector<Curve>>& layers() const { return m_layers; }

        size_t curveCount() const;
        size_t pointCount() const;

        /**
         * @brief Line strips of every curve in a layer
         */
        std::vector<std::vector<float>> lineStrips(Layer layer) const;

    private:
        std::map<Layer, std::vector<Curve>> m_layers;
    };

} // namespace cyclodrive

#endif // CYCLODRIVE_CURVE_H
