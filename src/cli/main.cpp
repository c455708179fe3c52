// =============================================================================
// geoshard CLI - build and query geographic shard schemes
// =============================================================================
//
// Usage:
//   geoshard <command> [options]
//
// Commands:
//   build       Partition the sphere into shards from a user file
//   lookup      Resolve a location (or disc) to shards
//   stats       Show load distribution of a shard file
//   version     Show version information
//
// Examples:
//   geoshard build --users users.csv --output shards.json --level 8
//   geoshard lookup --shards shards.json --lat 48.85 --lng 2.35 --radius 5000
//   geoshard stats --shards shards.json
//
// =============================================================================

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

#include "geoshard/builder.hpp"
#include "geoshard/cli_options.hpp"
#include "geoshard/config.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"
#include "geoshard/shard_io.hpp"
#include "geoshard/shard_searcher.hpp"
#include "geoshard/user_source.hpp"

namespace geoshard::cli {
    int cmd_build(int argc, char* argv[]);
    int cmd_lookup(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define GEOSHARD_VERSION_MAJOR 1
#define GEOSHARD_VERSION_MINOR 0
#define GEOSHARD_VERSION_PATCH 0
#define GEOSHARD_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"build",   "Build a shard scheme from a user file", geoshard::cli::cmd_build},
    {"lookup",  "Find the shard(s) for a location", geoshard::cli::cmd_lookup},
    {"stats",   "Show shard load statistics", geoshard::cli::cmd_stats},
    {"version", "Show version information", geoshard::cli::cmd_version},
    {"help",    "Show this help message", geoshard::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace geoshard::cli {

namespace {

// Level from the config, lowered by -v and raised by -q
void start_logging(const AppConfig& config) {
    LogLevel level = config.log_level;
    if (g_options.verbose) level = LogLevel::DEBUG;
    if (g_options.quiet) level = LogLevel::WARN;
    init_logging(level, config.log_file);
}

void print_shard(const Shard& shard) {
    std::cout << "  " << std::left << std::setw(28) << shard.name << std::right
              << " [" << shard.start.to_token() << " .. " << shard.end.to_token() << "]"
              << "  cells=" << shard.cell_count << "  load=" << shard.load << "\n";
}

// Runs a command body, translating exceptions into exit codes
template <typename Body>
int run_guarded(const char* usage, Body&& body) {
    try {
        return body();
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage;
        return kExitUsage;
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    } catch (const GeoshardException& e) {
        std::cerr << e.what() << "\n";
        return kExitFailure;
    }
}

} // anonymous namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geoshard - Geographic shard partitioning\n";
    std::cout << "Version " << GEOSHARD_VERSION_STRING << "\n\n";
    std::cout << "Usage: geoshard [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GEOSHARD_STORAGE_LEVEL  Storage level (0-30)\n";
    std::cout << "  GEOSHARD_MIN_SHARDS     Minimum shard count\n";
    std::cout << "  GEOSHARD_MAX_SHARDS     Maximum shard count\n";
    std::cout << "  GEOSHARD_SCORER         user_count | weighted\n";
    std::cout << "  GEOSHARD_LOG_LEVEL      trace | debug | info | warn | error\n";
    std::cout << "  GEOSHARD_LOG_FILE       Also log to this file\n";
    std::cout << "\nExamples:\n";
    std::cout << "  geoshard build --config geoshard.yaml --users users.csv\n";
    std::cout << "  geoshard lookup --shards shards.json --lat 40.71 --lng -74.0\n";
    std::cout << "  geoshard stats --shards shards.json\n";

    return kExitOk;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geoshard " << GEOSHARD_VERSION_STRING << "\n";
    std::cout << "spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH << "\n";
    return kExitOk;
}

// =============================================================================
// Build Command
// =============================================================================

static const char* kBuildUsage =
    "Usage: geoshard build [options]\n"
    "Options:\n"
    "  --config <file>         YAML configuration\n"
    "  --users <file>          CSV of lat,lng[,weight] (default: users.csv)\n"
    "  --output <file>         Shard file to write (default: shards.json)\n"
    "  --level <n>             Storage level (default: 8)\n"
    "  --min <n>               Minimum shard count (default: 40)\n"
    "  --max <n>               Maximum shard count (default: 100)\n";

int cmd_build(int argc, char* argv[]) {
    return run_guarded(kBuildUsage, [&]() {
        const BuildOptions options = parse_build_options(argc, argv);

        AppConfig config = load_config(options.config_file);
        options.apply_to(config);
        config.build.validate();

        start_logging(config);

        CsvUserSource users(config.users_file);
        GeoshardBuilder builder(config.build);
        ShardCollection shards = builder.build(users);
        save_shards(config.shards_file, shards);

        std::cout << "Built " << shards.size() << " shards at level " << shards.storage_level()
                  << " (" << users.line_number() << " lines read)\n";
        std::cout << "Load std-dev: " << shards.standard_deviation() << "\n";
        std::cout << "Written to " << config.shards_file << "\n";
        return kExitOk;
    });
}

// =============================================================================
// Lookup Command
// =============================================================================

static const char* kLookupUsage =
    "Usage: geoshard lookup --shards <file> --lat <deg> --lng <deg> [--radius <m>]\n";

int cmd_lookup(int argc, char* argv[]) {
    return run_guarded(kLookupUsage, [&]() {
        std::string shards_file;
        double lat = 0.0;
        double lng = 0.0;
        double radius = 0.0;
        bool have_lat = false;
        bool have_lng = false;

        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
            std::string value = argv[++i];
            if (arg == "--shards") {
                shards_file = value;
            } else if (arg == "--lat") {
                lat = parse_double(arg, value);
                have_lat = true;
            } else if (arg == "--lng") {
                lng = parse_double(arg, value);
                have_lng = true;
            } else if (arg == "--radius") {
                radius = parse_double(arg, value);
            } else {
                throw UsageError("Unknown option " + arg);
            }
        }
        if (shards_file.empty() || !have_lat || !have_lng) {
            throw UsageError("--shards, --lat and --lng are required");
        }

        const LatLng location(lat, lng);

        AppConfig config = load_config();
        start_logging(config);

        ShardSearcher searcher(load_shards(shards_file));
        std::cout << "Cell:  " << searcher.cell_for_location(location).to_token() << "\n";
        std::cout << "Shard:\n";
        print_shard(searcher.shard_for_location(location));

        if (radius > 0.0) {
            const auto touched = searcher.shards_in_radius(location, radius);
            std::cout << "Shards within " << radius << " m (" << touched.size() << "):\n";
            for (const Shard* shard : touched) {
                print_shard(*shard);
            }
        }
        return kExitOk;
    });
}

// =============================================================================
// Stats Command
// =============================================================================

static const char* kStatsUsage = "Usage: geoshard stats --shards <file>\n";

int cmd_stats(int argc, char* argv[]) {
    return run_guarded(kStatsUsage, [&]() {
        std::string shards_file;
        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--shards" && i + 1 < argc) {
                shards_file = argv[++i];
            } else {
                throw UsageError("Unknown option " + arg);
            }
        }
        if (shards_file.empty()) {
            throw UsageError("--shards is required");
        }

        AppConfig config = load_config();
        start_logging(config);

        const ShardCollection shards = load_shards(shards_file);
        const auto loads = shards.loads();
        const auto [min_it, max_it] = std::minmax_element(loads.begin(), loads.end());

        std::cout << "\n=== Shard Statistics ===\n\n";
        std::cout << "  Storage level:   " << shards.storage_level() << "\n";
        std::cout << "  Shards:          " << shards.size() << "\n";
        std::cout << "  Cells:           " << shards.total_cells() << "\n";
        std::cout << "  Total load:      " << shards.total_load() << "\n";
        std::cout << "  Min / max load:  " << *min_it << " / " << *max_it << "\n";
        std::cout << "  Std-dev:         " << shards.standard_deviation() << "\n\n";

        for (const Shard& shard : shards) {
            print_shard(shard);
        }
        return kExitOk;
    });
}

}  // namespace geoshard::cli

// =============================================================================
// Main Entry Point
// =============================================================================

void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        geoshard::cli::cmd_help(0, nullptr);
        return kExitUsage;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'geoshard help' for usage.\n";
    return kExitUsage;
}
