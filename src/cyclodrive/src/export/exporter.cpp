#include "cyclodrive/export/exporter.h"
#include "cyclodrive/export/svg_writer.h"
#include "cyclodrive/geometry/gearbox.h"
#include "cyclodrive/core/exception.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>

#include <cerrno>
#include <cstring>

namespace cyclodrive {

    const char* format_name(ExportFormat format)
    {
        switch (format) {
        case ExportFormat::DXF: return "dxf";
        case ExportFormat::SVG: return "svg";
        default: return "unknown";
        }
    }

    ExportFormat format_from_name(const std::string& name)
    {
        const std::string lower = boost::algorithm::to_lower_copy(name);
        if (lower == "dxf")
            return ExportFormat::DXF;
        if (lower == "svg")
            return ExportFormat::SVG;
        throw ExportUnavailableError((boost::format("unsupported export format \"%1%\", supported formats are dxf and svg") % name).str());
    }

    ExportFormat format_from_path(const std::string& path)
    {
        std::string extension = boost::filesystem::path(path).extension().string();
        if (extension.empty())
            throw ExportUnavailableError((boost::format("cannot tell the export format of %1%, no file extension") % path).str());
        return format_from_name(extension.substr(1));
    }

    DxfVersion dxf_version_from_name(const std::string& name)
    {
        const std::string upper = boost::algorithm::to_upper_copy(name);
        if (upper == "R12")
            return DxfVersion::R12;
        if (upper == "R2000")
            return DxfVersion::R2000;
        if (upper == "R2010")
            return DxfVersion::R2010;
        throw InvalidArgument((boost::format("unknown DXF version \"%1%\"") % name).str());
    }

    std::string generate_document(ExportFormat format, const ParameterSet& params, double phi, const ExportOptions& options)
    {
        // fail before generating anything
        if (format == ExportFormat::DXF && options.dxf_version == DxfVersion::R12)
            throw ExportUnavailableError("DXF R12 cannot hold LWPOLYLINE and SPLINE entities, use R2000 or newer");

        const CurveSet curves = generate_gearbox(params, phi, Resolution::for_export());
        if (format == ExportFormat::DXF)
            return generate_dxf(curves, params, phi, options.dxf_version);
        return generate_svg(curves, params);
    }

    void write_document(const std::string& path, const std::string& contents)
    {
        const boost::filesystem::path target(path);
        const boost::filesystem::path temp = target.string() + ".tmp";

        {
            boost::nowide::ofstream file(temp.string(), std::ios::out | std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                const std::string reason = std::strerror(errno);
                BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": cannot create " << temp.string() << ", " << reason;
                throw FileIOError((boost::format("cannot write %1%: %2%") % path % reason).str());
            }
            file << contents;
            file.close();
            if (file.fail()) {
                const std::string reason = std::strerror(errno);
                boost::system::error_code ignored;
                boost::filesystem::remove(temp, ignored);
                BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": writing " << temp.string() << " failed, " << reason;
                throw FileIOError((boost::format("cannot write %1%: %2%") % path % reason).str());
            }
        }

        boost::system::error_code ec;
        boost::filesystem::rename(temp, target, ec);
        if (ec) {
            boost::system::error_code ignored;
            boost::filesystem::remove(temp, ignored);
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": renaming " << temp.string() << " to " << path << " failed, " << ec.message();
            throw FileIOError((boost::format("cannot write %1%: %2%") % path % ec.message()).str());
        }
    }

    void export_gearbox(const std::string& path, ExportFormat format, const ParameterSet& params, double phi,
                        const ExportOptions& options)
    {
        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": exporting %1% at phi %2% to %3%")
            % format_name(format) % phi % path;

        const std::string contents = generate_document(format, params, phi, options);
        write_document(path, contents);

        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": wrote %1% bytes to %2%") % contents.size() % path;
    }

} // namespace cyclodrive
