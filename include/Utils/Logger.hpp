// BoostLogger.hpp
#pragma once

#include <string>
#include <string_view>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <fmt/format.h>
#include <iostream>
#include <atomic>
#include <mutex>

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
        std::string name = "practicelab";
        std::string file_path = "logs/practicelab.log";
        Level console_level = Level::Info;
        Level file_level = Level::Trace;
        std::size_t rotation_size = 10 * 1024 * 1024; // 10 MB
        int max_files = 5;
        bool enable_console = true;
        bool enable_file = true;
    };

    // تهيئة السجل وفق الإعدادات
    static void Init(const Config& config);
    static void Init();
    // إعادة التهيئة بعد تحميل ملف الإعدادات
    static void Reconfigure(const Config& config);

    [[nodiscard]] static Level ParseLevel(std::string_view name, Level fallback = Level::Info);

    static void Trace(const auto& msg) { log_impl(boost::log::trivial::trace, msg); }
    static void Debug(const auto& msg) { log_impl(boost::log::trivial::debug, msg); }
    static void Info(const auto& msg) { log_impl(boost::log::trivial::info, msg); }
    static void Warn(const auto& msg) { log_impl(boost::log::trivial::warning, msg); }
    static void Error(const auto& msg) { log_impl(boost::log::trivial::error, msg); }
    static void Critical(const auto& msg) { log_impl(boost::log::trivial::fatal, msg); }

    // تنسيق الرسائل عبر fmt
    template<typename... Args>
    static void Trace(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::trace, fmt::format(f, std::forward<Args>(args)...));
    }
    template<typename... Args>
    static void Debug(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::debug, fmt::format(f, std::forward<Args>(args)...));
    }
    template<typename... Args>
    static void Info(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::info, fmt::format(f, std::forward<Args>(args)...));
    }
    template<typename... Args>
    static void Warn(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::warning, fmt::format(f, std::forward<Args>(args)...));
    }
    template<typename... Args>
    static void Error(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::error, fmt::format(f, std::forward<Args>(args)...));
    }
    template<typename... Args>
    static void Critical(fmt::format_string<Args...> f, Args&&... args) {
        log_impl(boost::log::trivial::fatal, fmt::format(f, std::forward<Args>(args)...));
    }

private:
    using severity_level = boost::log::trivial::severity_level;

    inline static boost::log::sources::severity_logger_mt<severity_level> s_logger;
    inline static std::atomic<bool> s_initialized{false};
    inline static std::mutex s_init_mutex;

    static severity_level to_boost_level(Level level);
    static void install_sinks(const Config& config);
    static void log_impl(severity_level lvl, const auto& msg);
};

inline boost::log::trivial::severity_level BoostLogger::to_boost_level(Level level) {
    switch (level) {
        case Level::Trace:    return boost::log::trivial::trace;
        case Level::Debug:    return boost::log::trivial::debug;
        case Level::Info:     return boost::log::trivial::info;
        case Level::Warning:  return boost::log::trivial::warning;
        case Level::Error:    return boost::log::trivial::error;
        case Level::Fatal:    return boost::log::trivial::fatal;
        default:              return boost::log::trivial::info;
    }
}

inline BoostLogger::Level BoostLogger::ParseLevel(std::string_view name, Level fallback) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "fatal" || name == "critical") return Level::Fatal;
    return fallback;
}

inline void BoostLogger::log_impl(severity_level lvl, const auto& msg) {
    if (!s_initialized) {
        // تهيئة افتراضية إذا لم تتم التهيئة يدويًا
        Init();
    }
    BOOST_LOG_SEV(s_logger, lvl) << msg;
}

inline void BoostLogger::install_sinks(const Config& config) {
    namespace bl = boost::log;
    namespace expr = boost::log::expressions;

    bl::core::get()->remove_all_sinks();

    if (config.enable_console) {
        auto console_sink = bl::add_console_log(
            std::clog,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%"
        );
        console_sink->set_filter(bl::trivial::severity >= to_boost_level(config.console_level));
    }

    if (config.enable_file) {
        auto file_sink = bl::add_file_log(
            bl::keywords::file_name = config.file_path,
            bl::keywords::rotation_size = config.rotation_size,
            bl::keywords::max_size = config.rotation_size * config.max_files,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
            bl::keywords::auto_flush = true
        );
        file_sink->set_filter(bl::trivial::severity >= to_boost_level(config.file_level));
    }

    bl::core::get()->set_filter(bl::trivial::severity >= bl::trivial::trace);
}

inline void BoostLogger::Init(const Config& config) {
    std::scoped_lock lock(s_init_mutex);
    if (s_initialized) return;

    boost::log::add_common_attributes();
    install_sinks(config);
    s_initialized = true;
}

inline void BoostLogger::Init() {
    Init(Config());
}

inline void BoostLogger::Reconfigure(const Config& config) {
    std::scoped_lock lock(s_init_mutex);
    if (!s_initialized) {
        boost::log::add_common_attributes();
    }
    install_sinks(config);
    s_initialized = true;
}
