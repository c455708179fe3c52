#pragma once

#include "geoshard/config.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace geoshard::cli {

// Thrown for bad command-line input; maps to exit code 1
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

int parse_int(const std::string& flag, const std::string& value);

// Levels and shard counts; rejects negative values
int parse_count(const std::string& flag, const std::string& value);

double parse_double(const std::string& flag, const std::string& value);

/**
 * Flags of `geoshard build`. Unset flags leave the configuration alone.
 */
struct BuildOptions {
    std::string config_file;
    std::string users_file;
    std::string output_file;
    std::optional<int> level;
    std::optional<int> min_shards;
    std::optional<int> max_shards;

    void apply_to(AppConfig& config) const;
};

// argv holds the arguments after the command name
BuildOptions parse_build_options(int argc, char* argv[]);

} // namespace geoshard::cli
