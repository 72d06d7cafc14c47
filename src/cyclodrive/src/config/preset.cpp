#include "cyclodrive/config/preset.h"
#include "cyclodrive/core/exception.h"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>

#include <sstream>

using namespace nlohmann;
namespace cyclodrive {

    namespace {
        template<typename T>
        void read_key(const json& j, const char* key, T& value)
        {
            if (j.contains(key))
                j.at(key).get_to(value);
        }
    }

    void to_json(json& j, const ParameterValues& values)
    {
        j = json{
            { "eccentricity", values.eccentricity },
            { "num_external_pins", values.num_external_pins },
            { "num_output_pins", values.num_output_pins },
            { "ring_diameter", values.ring_diameter },
            { "pin_diameter", values.pin_diameter },
            { "output_disk_diameter", values.output_disk_diameter },
            { "output_pin_diameter", values.output_pin_diameter },
            { "camshaft_diameter", values.camshaft_diameter },
            { "tolerance", values.tolerance },
            { "show_outer_ring", values.show_outer_ring },
            { "outer_ring_width", values.outer_ring_width },
        };
    }

    void from_json(const json& j, ParameterValues& values)
    {
        read_key(j, "eccentricity", values.eccentricity);
        read_key(j, "num_external_pins", values.num_external_pins);
        read_key(j, "num_output_pins", values.num_output_pins);
        read_key(j, "ring_diameter", values.ring_diameter);
        read_key(j, "pin_diameter", values.pin_diameter);
        read_key(j, "output_disk_diameter", values.output_disk_diameter);
        read_key(j, "output_pin_diameter", values.output_pin_diameter);
        read_key(j, "camshaft_diameter", values.camshaft_diameter);
        read_key(j, "tolerance", values.tolerance);
        read_key(j, "show_outer_ring", values.show_outer_ring);
        read_key(j, "outer_ring_width", values.outer_ring_width);
    }

    Preset parse_preset(const std::string& contents)
    {
        Preset preset;
        try {
            json jLocal = json::parse(contents);
            if (!jLocal.is_object())
                throw ConfigError("preset must be a JSON object");

            jLocal.get_to(preset.values);
            read_key(jLocal, "phase", preset.phase);
        }
        catch (nlohmann::detail::parse_error& err) {
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": got a nlohmann::detail::parse_error, reason = " << err.what();
            throw ConfigError(std::string("malformed preset: ") + err.what());
        }
        catch (nlohmann::detail::type_error& err) {
            BOOST_LOG_TRIVIAL(error) << __FUNCTION__ << ": got a nlohmann::detail::type_error, reason = " << err.what();
            throw ConfigError(std::string("mistyped preset value: ") + err.what());
        }
        return preset;
    }

    Preset load_preset(const std::string& path)
    {
        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": loading preset %1%") % path;

        boost::nowide::ifstream file(path);
        if (!file.is_open())
            throw FileIOError((boost::format("cannot open preset %1%") % path).str());

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
            throw FileIOError((boost::format("cannot read preset %1%") % path).str());

        return parse_preset(buffer.str());
    }

    void save_preset(const std::string& path, const Preset& preset)
    {
        json j = preset.values;
        j["phase"] = preset.phase;

        boost::nowide::ofstream file(path);
        if (!file.is_open())
            throw FileIOError((boost::format("cannot open %1% for writing") % path).str());

        file << j.dump(4) << std::endl;
        file.close();
        if (file.fail())
            throw FileIOError((boost::format("cannot write preset %1%") % path).str());

        BOOST_LOG_TRIVIAL(info) << __FUNCTION__ << boost::format(": saved preset %1%") % path;
    }

} // namespace cyclodrive
