//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// logging/logger.cpp
//
// Logger implementation using spdlog
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <vector>

namespace exaconn {

namespace {

// Set by Initialize or Attach, cleared by Shutdown
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void Logger::Initialize(const LogOptions& options) {
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
        sinks.push_back(console);
    }
    if (!options.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_size, options.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("exaconn", sinks.begin(), sinks.end());
    logger->set_level(ToSpdlogLevel(options.level));
    logger->flush_on(spdlog::level::warn);
    g_logger = std::move(logger);
}

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    LogOptions options;
    options.file = log_file;
    options.level = log_level;
    Initialize(options);
}

void Logger::Attach(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        g_logger = std::move(logger);
    }
}

void Logger::Shutdown() {
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!g_logger) {
        Initialize(LogOptions{});
    }
    return g_logger;
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::Flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    static const std::pair<const char*, spdlog::level::level_enum> names[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"fatal", spdlog::level::critical},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& entry : names) {
        if (lower == entry.first) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    auto parsed = spdlog::level::warn;
    ParseLevel(level, parsed);
    return parsed;
}

} // namespace exaconn
