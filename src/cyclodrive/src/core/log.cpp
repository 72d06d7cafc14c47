#include "cyclodrive/core/log.h"

#include <boost/filesystem.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/support/date_time.hpp>

#include <iostream>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace attrs = boost::log::attributes;
using boost::log::trivial::severity_level;

namespace cyclodrive {

namespace {
    // index is the numeric level used on the command line
    struct LevelEntry {
        const char* name;
        severity_level severity;
    };

    const LevelEntry levels[] = {
        { "fatal",   boost::log::trivial::fatal },
        { "error",   boost::log::trivial::error },
        { "warning", boost::log::trivial::warning },
        { "info",    boost::log::trivial::info },
        { "debug",   boost::log::trivial::debug },
        { "trace",   boost::log::trivial::trace },
    };
    const unsigned num_levels = sizeof(levels) / sizeof(levels[0]);

    severity_level current_severity = boost::log::trivial::warning;

    severity_level level_to_boost(unsigned level)
    {
        return levels[level < num_levels ? level : num_levels - 1].severity;
    }

    // [severity]  timestamp[Thread id]:message
    logging::formatter line_format()
    {
        return expr::stream
            << "[" << expr::attr<severity_level>("Severity") << "]\t"
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << "[Thread " << expr::attr<attrs::current_thread_id::value_type>("ThreadID") << "]"
            << ":" << expr::smessage;
    }

    boost::shared_ptr<logging::sinks::synchronous_sink<logging::sinks::text_file_backend>> g_log_sink;
    boost::shared_ptr<logging::sinks::synchronous_sink<logging::sinks::text_ostream_backend>> g_console_sink;

    // warnings and worse until a caller picks a level
    struct RunOnInit {
        RunOnInit() { set_logging_level(2); }
    } g_RunOnInit;
}

void set_logging_level(unsigned int level)
{
    current_severity = level_to_boost(level);
    logging::core::get()->set_filter(boost::log::trivial::severity >= current_severity);
}

unsigned int level_string_to_boost(const std::string& level)
{
    for (unsigned i = 0; i < num_levels; ++i) {
        if (level == levels[i].name)
            return i;
    }
    return 1;
}

std::string get_string_logging_level(unsigned level)
{
    return level < num_levels ? levels[level].name : "error";
}

unsigned get_logging_level()
{
    for (unsigned i = 0; i < num_levels; ++i) {
        if (levels[i].severity == current_severity)
            return i;
    }
    return 1;
}

void trace(unsigned int level, const char *message)
{
    BOOST_LOG_STREAM_WITH_PARAMS(::boost::log::trivial::logger::get(),
        (::boost::log::keywords::severity = level_to_boost(level))) << message;
}

void set_log_path_and_level(const std::string& file, unsigned int level)
{
    if (file.empty()) {
        if (!g_console_sink)
            g_console_sink = logging::add_console_log(std::clog, keywords::format = line_format());
    } else {
        const boost::filesystem::path full_path = boost::filesystem::absolute(boost::filesystem::path(file)).make_preferred();
        const boost::filesystem::path log_folder = full_path.parent_path();
        if (!log_folder.empty() && !boost::filesystem::exists(log_folder))
            boost::filesystem::create_directories(log_folder);

        g_log_sink = logging::add_file_log(
            keywords::file_name = full_path.string() + ".%N",
            keywords::rotation_size = 100 * 1024 * 1024,
            keywords::format = line_format());
    }

    logging::add_common_attributes();
    set_logging_level(level);
}

void flush_logs()
{
    if (g_log_sink)
        g_log_sink->flush();
    if (g_console_sink)
        g_console_sink->flush();
}

} // namespace cyclodrive
