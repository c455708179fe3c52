#include "geoshard/config.hpp"
#include "geoshard/error.hpp"
#include "geoshard/types.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace geoshard {

namespace {

int env_int(const char* name, int current) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return current;
    }
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != std::string(value).size()) {
        throw ConfigurationError(std::string("Environment variable ") + name + "='" + value +
                                 "' is not an integer");
    }
    return parsed;
}

std::string env_string(const char* name, const std::string& current) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : current;
}

template <typename T>
void read_field(const YAML::Node& node, const char* key, T& target, const std::string& section) {
    if (!node[key]) {
        return;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for " + section + "." + key, e.what());
    }
}

} // anonymous namespace

void BuildConfig::validate() const {
    GEOSHARD_CHECK_CONFIG(storage_level >= 0 && storage_level <= kMaxLevel,
                          "storage_level " + std::to_string(storage_level) + " is outside [0, 30]");
    GEOSHARD_CHECK_CONFIG(min_shard_count > 0,
                          "min_shard_count must be positive, got " + std::to_string(min_shard_count));
    GEOSHARD_CHECK_CONFIG(max_shard_count > 0,
                          "max_shard_count must be positive, got " + std::to_string(max_shard_count));
    GEOSHARD_CHECK_CONFIG(min_shard_count <= max_shard_count,
                          "min_shard_count " + std::to_string(min_shard_count) +
                              " exceeds max_shard_count " + std::to_string(max_shard_count));
}

void apply_env_overrides(AppConfig& config) {
    config.build.storage_level = env_int("GEOSHARD_STORAGE_LEVEL", config.build.storage_level);
    config.build.min_shard_count = env_int("GEOSHARD_MIN_SHARDS", config.build.min_shard_count);
    config.build.max_shard_count = env_int("GEOSHARD_MAX_SHARDS", config.build.max_shard_count);
    config.build.scorer = env_string("GEOSHARD_SCORER", config.build.scorer);

    const char* level = std::getenv("GEOSHARD_LOG_LEVEL");
    if (level && *level) {
        config.log_level = parse_log_level(level);
    }
    config.log_file = env_string("GEOSHARD_LOG_FILE", config.log_file);
}

AppConfig load_config(const std::string& config_file) {
    AppConfig config;

    if (!config_file.empty()) {
        YAML::Node yaml;
        try {
            yaml = YAML::LoadFile(config_file);
        } catch (const YAML::BadFile& e) {
            throw ConfigurationError("Cannot read config file " + config_file, e.what());
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError("Malformed config file " + config_file, e.what());
        }

        try {
            if (const YAML::Node build = yaml["build"]) {
                read_field(build, "storage_level", config.build.storage_level, "build");
                read_field(build, "min_shard_count", config.build.min_shard_count, "build");
                read_field(build, "max_shard_count", config.build.max_shard_count, "build");
                read_field(build, "scorer", config.build.scorer, "build");
            }

            if (const YAML::Node logging = yaml["logging"]) {
                std::string level;
                read_field(logging, "level", level, "logging");
                if (!level.empty()) {
                    config.log_level = parse_log_level(level);
                }
                read_field(logging, "file", config.log_file, "logging");
            }

            if (const YAML::Node io = yaml["io"]) {
                read_field(io, "users", config.users_file, "io");
                read_field(io, "shards", config.shards_file, "io");
            }
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("Unexpected structure in config file " + config_file, e.what());
        }
    }

    apply_env_overrides(config);
    config.build.validate();
    GEOSHARD_CHECK_CONFIG(config.build.scorer == "user_count" || config.build.scorer == "weighted",
                          "Unknown scorer '" + config.build.scorer + "'");
    return config;
}

} // namespace geoshard
