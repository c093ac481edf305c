//===----------------------------------------------------------------------===//
//                         DBDriver
//
// logging/logger.hpp
//
// Process-wide logging facade over spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace dbdriver {

// Ordered to match spdlog's trace..critical
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

struct LogOptions {
    std::string file;               // empty = no file sink
    std::string level = "info";
    bool console = true;            // colored stderr sink
    size_t max_file_bytes = 100 * 1024 * 1024;
    size_t max_files = 3;
};

class Logger {
public:
    // First call wins; later calls are ignored until Shutdown
    static void Initialize(const LogOptions& options);
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info");

    static void Shutdown();

    // Lazily initializes a console logger at "info"
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);
    static std::string GetLevelName();

    static void Flush();

    // Case-insensitive; accepts "warning", "critical" and "off" as aliases
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& level);
    static bool IsValidLevel(const std::string& level) { return ParseLevel(level).has_value(); }

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    // Unknown names fall back to info
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace dbdriver

// LOG_INFO("component", "message " + std::to_string(x))
// The message expression is only evaluated when the level is enabled.
#define DBDRIVER_LOG_AT(lvl, component, message) \
    do { \
        auto& dbdriver_log_ = dbdriver::Logger::Get(); \
        if (dbdriver_log_->should_log(lvl)) \
            dbdriver_log_->log(lvl, "[{}] {}", component, message); \
    } while (0)

#define LOG_TRACE(component, message) DBDRIVER_LOG_AT(spdlog::level::trace, component, message)
#define LOG_DEBUG(component, message) DBDRIVER_LOG_AT(spdlog::level::debug, component, message)
#define LOG_INFO(component, message)  DBDRIVER_LOG_AT(spdlog::level::info, component, message)
#define LOG_WARN(component, message)  DBDRIVER_LOG_AT(spdlog::level::warn, component, message)
#define LOG_ERROR(component, message) DBDRIVER_LOG_AT(spdlog::level::err, component, message)
#define LOG_FATAL(component, message) DBDRIVER_LOG_AT(spdlog::level::critical, component, message)

// fmt-style variants: DLOG_INFO("component", "queued {} at {}", id, prio)
#define DLOG_DEBUG(component, fmt, ...) \
    dbdriver::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...) \
    dbdriver::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...) \
    dbdriver::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
