#include "geoshard/cli_options.hpp"

namespace geoshard::cli {

int parse_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw UsageError(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw UsageError(flag + " expects an integer, got '" + value + "'");
    }
    return result;
}

int parse_count(const std::string& flag, const std::string& value) {
    const int result = parse_int(flag, value);
    if (result < 0) {
        throw UsageError(flag + " must not be negative, got " + value);
    }
    return result;
}

double parse_double(const std::string& flag, const std::string& value) {
    size_t used = 0;
    double result = 0;
    try {
        result = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw UsageError(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw UsageError(flag + " expects a number, got '" + value + "'");
    }
    return result;
}

void BuildOptions::apply_to(AppConfig& config) const {
    if (!users_file.empty()) config.users_file = users_file;
    if (!output_file.empty()) config.shards_file = output_file;
    if (level) config.build.storage_level = *level;
    if (min_shards) config.build.min_shard_count = *min_shards;
    if (max_shards) config.build.max_shard_count = *max_shards;
}

BuildOptions parse_build_options(int argc, char* argv[]) {
    BuildOptions options;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
        std::string value = argv[++i];
        if (arg == "--config") {
            options.config_file = value;
        } else if (arg == "--users") {
            options.users_file = value;
        } else if (arg == "--output" || arg == "-o") {
            options.output_file = value;
        } else if (arg == "--level") {
            options.level = parse_count(arg, value);
        } else if (arg == "--min") {
            options.min_shards = parse_count(arg, value);
        } else if (arg == "--max") {
            options.max_shards = parse_count(arg, value);
        } else {
            throw UsageError("Unknown option " + arg);
        }
    }
    return options;
}

} // namespace geoshard::cli
