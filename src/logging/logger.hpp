//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// logging/logger.hpp
//
// Process-wide client logger on top of spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace exaconn {

struct LogOptions {
    std::string file;              // empty = stderr only
    std::string level = "warn";
    bool console = true;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
};

class Logger {
public:
    // Build the "exaconn" logger. Only the first call has an effect until
    // Shutdown(). Console output goes to stderr, never to stdout.
    static void Initialize(const LogOptions& options);
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "warn");

    // Send client logging to a logger owned by the application. A null
    // logger is ignored.
    static void Attach(std::shared_ptr<spdlog::logger> logger);

    static void Shutdown();

    // Initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(const std::string& level);
    static void Flush();

    // Accepts trace, debug, info, warn|warning, error, fatal|critical, off
    // in any case.
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& out);

    // As ParseLevel, falling back to warn for unknown names
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);
};

} // namespace exaconn

#define EXACONN_LOG_AT(lvl, component, fmt, ...) \
    do { \
        auto& exaconn_logger_ = exaconn::Logger::Get(); \
        if (exaconn_logger_->should_log(lvl)) \
            exaconn_logger_->log(lvl, "[{}] " fmt, component, ##__VA_ARGS__); \
    } while(0)

// LOG_INFO("session", "opened " + name)
#define LOG_TRACE(component, message) EXACONN_LOG_AT(spdlog::level::trace, component, "{}", message)
#define LOG_DEBUG(component, message) EXACONN_LOG_AT(spdlog::level::debug, component, "{}", message)
#define LOG_INFO(component, message)  EXACONN_LOG_AT(spdlog::level::info, component, "{}", message)
#define LOG_WARN(component, message)  EXACONN_LOG_AT(spdlog::level::warn, component, "{}", message)
#define LOG_ERROR(component, message) EXACONN_LOG_AT(spdlog::level::err, component, "{}", message)

// ELOG_INFO("session", "opened {} on {}", name, host)
#define ELOG_TRACE(component, fmt, ...) EXACONN_LOG_AT(spdlog::level::trace, component, fmt, ##__VA_ARGS__)
#define ELOG_DEBUG(component, fmt, ...) EXACONN_LOG_AT(spdlog::level::debug, component, fmt, ##__VA_ARGS__)
#define ELOG_INFO(component, fmt, ...)  EXACONN_LOG_AT(spdlog::level::info, component, fmt, ##__VA_ARGS__)
#define ELOG_WARN(component, fmt, ...)  EXACONN_LOG_AT(spdlog::level::warn, component, fmt, ##__VA_ARGS__)
#define ELOG_ERROR(component, fmt, ...) EXACONN_LOG_AT(spdlog::level::err, component, fmt, ##__VA_ARGS__)
