#include "cyclodrive/cyclodrive.h"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/args.hpp>
#include <boost/nowide/iostream.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

using namespace cyclodrive;

namespace {

    struct Options {
        std::string preset;
        std::string save_preset;
        std::string output;
        std::string format;
        DxfVersion dxf_version = DxfVersion::R2010;
        bool phase_given = false;
        double phase = 0.0;
        bool normalize = false;
        bool outer_ring = false;
        int frames = 0;
        unsigned log_level = 2;
        bool help = false;
    };

    void print_usage(const char* program)
    {
        boost::nowide::cout << DESCRIPTION << " " << VERSION << "\n\n"
            << "usage: " << program << " [options]\n"
            << "  --preset FILE        load parameters (and phase) from a JSON preset\n"
            << "  --save-preset FILE   write the effective parameters as a JSON preset\n"
            << "  --phase RAD          input phase in radians\n"
            << "  --normalize          derive ring and disk diameters from the pin size\n"
            << "  --outer-ring         include the housing\n"
            << "  --format dxf|svg     export format, default from the output extension\n"
            << "  --output FILE        output file, default cycloidal_drive.<format>\n"
            << "  --dxf-version V      R2000 or R2010 (default)\n"
            << "  --frames N           export N animation frames as FILE_0000.<ext> ...\n"
            << "  --log-level N        0 fatal .. 5 trace or a level name, default 2 (warning)\n"
            << "  --help               show this text\n";
    }

    const std::string& next_value(const std::vector<std::string>& args, size_t& i)
    {
        if (i + 1 >= args.size())
            throw InvalidArgument((boost::format("option %1% needs a value") % args[i]).str());
        return args[++i];
    }

    double parse_number(const std::string& option, const std::string& value)
    {
        try {
            size_t used = 0;
            double number = std::stod(value, &used);
            if (used == value.size())
                return number;
        }
        catch (const std::logic_error&) {
        }
        throw InvalidArgument((boost::format("option %1% expects a number, got \"%2%\"") % option % value).str());
    }

    int parse_count(const std::string& option, const std::string& value, int max_count)
    {
        const double number = parse_number(option, value);
        if (!(number >= 0.0 && number <= max_count) || number != std::floor(number))
            throw InvalidArgument((boost::format("option %1% expects a whole number from 0 to %2%, got \"%3%\"") % option % max_count % value).str());
        return static_cast<int>(number);
    }

    Options parse_options(const std::vector<std::string>& args)
    {
        Options options;
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--preset")
                options.preset = next_value(args, i);
            else if (arg == "--save-preset")
                options.save_preset = next_value(args, i);
            else if (arg == "--phase") {
                options.phase = parse_number(arg, next_value(args, i));
                options.phase_given = true;
            }
            else if (arg == "--normalize")
                options.normalize = true;
            else if (arg == "--outer-ring")
                options.outer_ring = true;
            else if (arg == "--format")
                options.format = next_value(args, i);
            else if (arg == "--output")
                options.output = next_value(args, i);
            else if (arg == "--dxf-version")
                options.dxf_version = dxf_version_from_name(next_value(args, i));
            else if (arg == "--frames")
                options.frames = parse_count(arg, next_value(args, i), std::numeric_limits<int>::max());
            else if (arg == "--log-level") {
                const std::string& level = next_value(args, i);
                if (!level.empty() && std::isdigit(static_cast<unsigned char>(level.front())))
                    options.log_level = static_cast<unsigned>(parse_count(arg, level, 5));
                else
                    options.log_level = level_string_to_boost(level);
            }
            else if (arg == "--help" || arg == "-h")
                options.help = true;
            else
                throw InvalidArgument((boost::format("unknown option %1%") % arg).str());
        }
        return options;
    }

    std::string frame_path(const std::string& output, int frame)
    {
        boost::filesystem::path path(output);
        std::string name = (boost::format("%1%_%2$04d%3%") % path.stem().string() % frame % path.extension().string()).str();
        return (path.parent_path() / name).string();
    }

    int run(const Options& options)
    {
        Preset preset;
        if (!options.preset.empty())
            preset = load_preset(options.preset);

        ParameterValues values = preset.values;
        if (options.outer_ring)
            values.show_outer_ring = true;

        ParameterSet params(values);
        if (options.normalize)
            params = normalizeToPins(params);

        const double phase = options.phase_given ? options.phase : preset.phase;
        BOOST_LOG_TRIVIAL(info) << "parameters: " << params.toString() << ", phase " << phase;

        if (!options.save_preset.empty()) {
            Preset effective;
            effective.values = params.values();
            effective.phase = phase;
            save_preset(options.save_preset, effective);
        }

        ExportFormat format = ExportFormat::DXF;
        if (!options.format.empty())
            format = format_from_name(options.format);
        else if (!options.output.empty())
            format = format_from_path(options.output);

        const std::string output = options.output.empty()
            ? std::string("cycloidal_drive.") + format_name(format)
            : options.output;

        ExportOptions export_options;
        export_options.dxf_version = options.dxf_version;

        if (options.frames == 0) {
            export_gearbox(output, format, params, phase, export_options);
            boost::nowide::cout << "exported " << output << std::endl;
            return EXIT_SUCCESS;
        }

        PhaseDriver driver;
        driver.set_phase(phase);
        for (int frame = 0; frame < options.frames; ++frame) {
            const std::string path = frame_path(output, frame);
            export_gearbox(path, format, params, driver.phase(), export_options);
            driver.advance();
        }
        boost::nowide::cout << "exported " << options.frames << " frames next to " << output << std::endl;
        return EXIT_SUCCESS;
    }

}

int main(int argc, char** argv)
{
    boost::nowide::args nowide_args(argc, argv);
    std::vector<std::string> args(argv, argv + argc);

    Options options;
    try {
        options = parse_options(args);
    }
    catch (const InvalidArgument& err) {
        boost::nowide::cerr << err.what() << "\n\n";
        print_usage(args.empty() ? "cyclodrive_maker" : args.front().c_str());
        return 2;
    }

    if (options.help) {
        print_usage(args.front().c_str());
        return EXIT_SUCCESS;
    }

    set_log_path_and_level("", options.log_level);
    trace(4, ("log level " + get_string_logging_level(get_logging_level())).c_str());

    int result = EXIT_FAILURE;
    try {
        result = run(options);
    }
    catch (const ConfigError& err) {
        BOOST_LOG_TRIVIAL(error) << "invalid preset: " << err.what();
    }
    catch (const FileIOError& err) {
        BOOST_LOG_TRIVIAL(error) << "file error: " << err.what();
    }
    catch (const ExportUnavailableError& err) {
        BOOST_LOG_TRIVIAL(error) << "export unavailable: " << err.what();
    }
    catch (const DegenerateGeometryError& err) {
        BOOST_LOG_TRIVIAL(error) << "degenerate geometry: " << err.what();
    }
    catch (const InvalidArgument& err) {
        BOOST_LOG_TRIVIAL(error) << "invalid parameters: " << err.what();
    }
    catch (const std::exception& err) {
        BOOST_LOG_TRIVIAL(fatal) << "unexpected error: " << err.what();
    }

    flush_logs();
    return result;
}
