#pragma once

#include "geoshard/logging.hpp"

#include <string>

namespace geoshard {

// Parameters of one shard build
struct BuildConfig {
    int storage_level = 8;
    int min_shard_count = 40;
    int max_shard_count = 100;
    std::string scorer = "user_count";

    // Checks level and shard-count bounds; throws ConfigurationError naming
    // the first offending field. Scorer names are resolved by make_scorer().
    void validate() const;
};

struct AppConfig {
    BuildConfig build;
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    std::string users_file = "users.csv";
    std::string shards_file = "shards.json";
};

/**
 * Loads settings from a YAML file, then applies GEOSHARD_* environment
 * overrides. An empty path skips the file. The result is validated,
 * including the scorer name.
 *
 *   build:   { storage_level, min_shard_count, max_shard_count, scorer }
 *   logging: { level, file }
 *   io:      { users, shards }
 */
AppConfig load_config(const std::string& config_file = "");

// Environment overrides only; used by load_config after the file is read
void apply_env_overrides(AppConfig& config);

} // namespace geoshard
