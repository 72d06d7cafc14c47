#include "cyclodrive/export/svg_writer.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace cyclodrive {

    SvgWriter::SvgWriter(double view_radius)
        : m_view_radius(view_radius) {
        if (!(view_radius > 0.0))
            throw InvalidArgument("SVG view radius must be positive");
    }

    void SvgWriter::addPath(const Curve& curve) {
        if (curve.empty())
            return;

        const std::vector<Point> points = curve.closed ? curve.uniquePoints() : curve.points;
        const LayerStyle& style = layer_style(curve.layer);

        m_paths << "    <path d=\"";
        for (size_t i = 0; i < points.size(); ++i) {
            m_paths << (i == 0 ? "M " : " L ") << boost::format("%.3f,%.3f") % points[i].x % points[i].y;
        }
        if (curve.closed)
            m_paths << " Z";
        m_paths << boost::format("\" fill=\"none\" stroke=\"%1%\" stroke-width=\"%2%\"/>\n")
            % style.svg_stroke % style.svg_stroke_width;
        ++m_path_count;
    }

    std::string SvgWriter::str() const {
        const double size = 2.0 * m_view_radius;
        std::ostringstream out;
        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out << boost::format("<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%1%mm\" height=\"%1%mm\" viewBox=\"%2% %2% %1% %1%\">\n")
            % size % -m_view_radius;
        out << "  <g transform=\"scale(1,-1)\">\n";
        out << m_paths.str();
        out << "  </g>\n";
        out << "</svg>\n";
        return out.str();
    }

    double svg_view_radius(const ParameterSet& params) {
        if (params.showOuterRing())
            return params.ringRadius() + params.outerRingWidth() + 10.0;
        return params.ringRadius() + 10.0;
    }

    std::string generate_svg(const CurveSet& curves, const ParameterSet& params) {
        static const Layer order[] = {
            Layer::ExternalPins,
            Layer::CycloidDisk,
            Layer::OutputPins,
            Layer::OutputHoles,
            Layer::CamshaftHole,
            Layer::EccentricCam,
            Layer::OuterRing,
        };

        SvgWriter writer(svg_view_radius(params));
        for (Layer layer : order) {
            for (const Curve& curve : curves.curves(layer))
                writer.addPath(curve);
        }

        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << boost::format(": %1% paths, view radius %2%")
            % writer.pathCount() % writer.viewRadius();
        return writer.str();
    }

} // namespace cyclodrive
