#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace geoshard {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4
};

/**
 * Process-wide "geoshard" logger.
 * Writes to a colour stdout sink until init_logging() adds a file sink.
 */
std::shared_ptr<spdlog::logger> logger();

// Replaces the process logger; an empty file keeps logging on stdout only
void init_logging(LogLevel level, const std::string& file = "");

void set_log_level(LogLevel level);

// "trace", "debug", "info", "warn"/"warning", "error"
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level) noexcept;

} // namespace geoshard

#define GEOSHARD_LOG_TRACE(...) geoshard::logger()->trace(__VA_ARGS__)
#define GEOSHARD_LOG_DEBUG(...) geoshard::logger()->debug(__VA_ARGS__)
#define GEOSHARD_LOG_INFO(...)  geoshard::logger()->info(__VA_ARGS__)
#define GEOSHARD_LOG_WARN(...)  geoshard::logger()->warn(__VA_ARGS__)
#define GEOSHARD_LOG_ERROR(...) geoshard::logger()->error(__VA_ARGS__)
