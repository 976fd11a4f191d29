#pragma once

// Logging for tessel using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Per-column and per-split detail (e.g., every allocation)
//   - DEBUG: Decisions worth knowing about (e.g., main overflow rerouted)
//   - INFO:  Normal operational messages (e.g., layouts loaded)
//   - WARN:  Recoverable configuration problems
//   - ERROR: Invariant violations and unusable configuration
//
// In Release builds: TRACE and DEBUG are compiled out (zero cost)
// In Debug builds: All levels are active
//
// The library never installs sinks itself; applications call tessel::log::init().
//
// Usage:
//   LOG_DEBUG("Main column holds {} of {} windows", main, total);
//   LOG_WARN("Unknown split '{}' in layout {}", value, name);

#include <memory>
#include <string>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tessel::log {

// Initialize logging - call once at startup.
// An empty file_path disables the file sink.
inline void init(spdlog::level::level_enum level = spdlog::level::info, std::string const& file_path = {})
{
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (stderr) with colors
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    // File sink for persistent logs
    if (!file_path.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("tessel", sinks.begin(), sinks.end());
    logger->set_level(level); // Runtime level (compile-time is separate)
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

// Shutdown logging - call at exit
inline void shutdown() { spdlog::shutdown(); }

} // namespace tessel::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Rectangle logging helper (trace level)
#define LOG_RECT(label, rect) \
    SPDLOG_TRACE("{}: x={} y={} w={} h={}", label, (rect).x, (rect).y, (rect).width, (rect).height)
