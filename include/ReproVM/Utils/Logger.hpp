// BoostLogger.h
#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/shared_ptr.hpp>
#include <iostream>
#include <unistd.h>

namespace ReproVM {

namespace bl = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace attrs = boost::log::attributes;
using boost::log::trivial::severity_level;

class BoostLogger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    struct Config {
        Config() {}
        Level console_level = Level::Info;
        Level file_level = Level::Debug;
        std::size_t rotation_size = 10 * 1024 * 1024; // 10 MB
        bool enable_console = true;
        bool colour = ::isatty(STDERR_FILENO) == 1;
    };

    // Console sink only; the instance log file is attached later by launch paths.
    static void Init(const Config& config = Config());

    // Adds the rotating file sink once per process.
    static void AttachFile(const std::filesystem::path& file_path);

    static void SetConsoleLevel(Level level);

    static void Trace(const auto& msg) { log_impl(severity_level::trace, msg); }
    static void Debug(const auto& msg) { log_impl(severity_level::debug, msg); }
    static void Info(const auto& msg) { log_impl(severity_level::info, msg); }
    static void Success(const auto& msg) {
        ensure_init();
        BOOST_LOG_SEV(s_success_logger, severity_level::info) << msg;
    }
    static void Warn(const auto& msg) { log_impl(severity_level::warning, msg); }
    static void Error(const auto& msg) { log_impl(severity_level::error, msg); }
    static void Critical(const auto& msg) { log_impl(severity_level::fatal, msg); }

private:
    using console_sink_t = sinks::synchronous_sink<sinks::text_ostream_backend>;

    inline static src::severity_logger_mt<severity_level> s_logger;
    inline static src::severity_logger_mt<severity_level> s_success_logger;
    inline static boost::shared_ptr<console_sink_t> s_console_sink;
    inline static std::filesystem::path s_file_path;
    inline static bool s_colour = false;
    inline static bool s_initialized = false;

    static severity_level to_boost_level(Level level);
    static void ensure_init() {
        if (!s_initialized) {
            Init();
        }
    }
    static void log_impl(severity_level lvl, const auto& msg) {
        ensure_init();
        BOOST_LOG_SEV(s_logger, lvl) << msg;
    }
    static void format_console(const bl::record_view& rec, bl::formatting_ostream& strm);
};

inline severity_level BoostLogger::to_boost_level(Level level) {
    switch (level) {
        case Level::Trace:    return severity_level::trace;
        case Level::Debug:    return severity_level::debug;
        case Level::Info:     return severity_level::info;
        case Level::Warning:  return severity_level::warning;
        case Level::Error:    return severity_level::error;
        case Level::Fatal:    return severity_level::fatal;
        default:              return severity_level::info;
    }
}

inline void BoostLogger::format_console(const bl::record_view& rec, bl::formatting_ostream& strm) {
    severity_level lvl = severity_level::info;
    if (auto sev = rec[bl::trivial::severity]) {
        lvl = sev.get();
    }
    auto success = bl::extract<bool>("Success", rec);
    const bool ok = success && success.get();

    const char* marker = "->";
    const char* colour = "\033[1;36m";
    if (ok) {
        marker = "OK";
        colour = "\033[1;32m";
    } else if (lvl <= severity_level::debug) {
        marker = "  ";
        colour = "\033[2m";
    } else if (lvl == severity_level::warning) {
        marker = "!";
        colour = "\033[1;33m";
    } else if (lvl >= severity_level::error) {
        marker = "x";
        colour = "\033[1;31m";
    }

    if (s_colour) strm << colour;
    strm << marker << ' ' << rec[expr::smessage];
    if (s_colour) strm << "\033[0m";
}

inline void BoostLogger::Init(const Config& config) {
    if (s_initialized) return;

    bl::core::get()->remove_all_sinks();
    bl::add_common_attributes();
    s_success_logger.add_attribute("Success", attrs::constant<bool>(true));
    s_colour = config.colour;

    if (config.enable_console) {
        s_console_sink = bl::add_console_log(std::clog);
        s_console_sink->set_formatter(&BoostLogger::format_console);
        s_console_sink->set_filter(bl::trivial::severity >= to_boost_level(config.console_level));
    }

    bl::core::get()->set_filter(bl::trivial::severity >= severity_level::trace);
    s_initialized = true;
}

inline void BoostLogger::SetConsoleLevel(Level level) {
    ensure_init();
    if (s_console_sink) {
        s_console_sink->set_filter(bl::trivial::severity >= to_boost_level(level));
    }
}

inline void BoostLogger::AttachFile(const std::filesystem::path& file_path) {
    ensure_init();
    if (!s_file_path.empty()) return;

    auto file_sink = bl::add_file_log(
        bl::keywords::file_name = file_path.string(),
        bl::keywords::rotation_size = Config{}.rotation_size,
        bl::keywords::open_mode = std::ios_base::out | std::ios_base::app,
        bl::keywords::auto_flush = true
    );
    file_sink->set_formatter(
        expr::stream
            << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
            << "] [" << bl::trivial::severity << "] " << expr::smessage);
    file_sink->set_filter(bl::trivial::severity >= to_boost_level(Config{}.file_level));
    s_file_path = file_path;
}

} // namespace ReproVM
