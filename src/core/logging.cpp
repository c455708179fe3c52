#include "geoshard/logging.hpp"
#include "geoshard/error.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <cctype>
#include <vector>

namespace geoshard {

namespace {

constexpr const char* kLoggerName = "geoshard";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(LogLevel level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError("Could not open log file: " + file, e.what());
        }
    }

    auto result = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    result->set_pattern(kPattern);
    result->set_level(to_spdlog(level));
    result->flush_on(spdlog::level::warn);
    return result;
}

// Built on first use; init_logging() swaps it atomically
std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> instance = make_logger(LogLevel::INFO, "");
    return instance;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    return std::atomic_load(&logger_slot());
}

void init_logging(LogLevel level, const std::string& file) {
    auto replacement = make_logger(level, file);
    std::atomic_store(&logger_slot(), std::move(replacement));
}

void set_log_level(LogLevel level) {
    logger()->set_level(to_spdlog(level));
}

LogLevel parse_log_level(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "trace") return LogLevel::TRACE;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "info") return LogLevel::INFO;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "error") return LogLevel::ERROR;

    throw ConfigurationError("Unknown log level '" + name + "'", __func__,
                             "Use one of trace, debug, info, warn, error");
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

} // namespace geoshard
