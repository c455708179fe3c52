// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoshard/config.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <vector>

using namespace geoshard;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }

    void TearDown() override {
        clear_env();
        for (const std::string& path : written_) {
            std::remove(path.c_str());
        }
    }

    std::string write_yaml(const std::string& name, const std::string& contents) {
        const std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << contents;
        written_.push_back(path);
        return path;
    }

    static void clear_env() {
        for (const char* name : {"GEOSHARD_STORAGE_LEVEL", "GEOSHARD_MIN_SHARDS", "GEOSHARD_MAX_SHARDS",
                                 "GEOSHARD_SCORER", "GEOSHARD_LOG_LEVEL", "GEOSHARD_LOG_FILE"}) {
            unsetenv(name);
        }
    }

    std::vector<std::string> written_;
};

// =============================================================================
// Defaults and files
// =============================================================================

TEST_F(ConfigTest, Defaults) {
    AppConfig config = load_config();
    EXPECT_EQ(config.build.storage_level, 8);
    EXPECT_EQ(config.build.min_shard_count, 40);
    EXPECT_EQ(config.build.max_shard_count, 100);
    EXPECT_EQ(config.build.scorer, "user_count");
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.users_file, "users.csv");
    EXPECT_EQ(config.shards_file, "shards.json");
}

TEST_F(ConfigTest, LoadsYaml) {
    const std::string path = write_yaml("geoshard_full.yaml",
                                        "build:\n"
                                        "  storage_level: 10\n"
                                        "  min_shard_count: 12\n"
                                        "  max_shard_count: 24\n"
                                        "  scorer: weighted\n"
                                        "logging:\n"
                                        "  level: debug\n"
                                        "  file: build.log\n"
                                        "io:\n"
                                        "  users: people.csv\n"
                                        "  shards: out.json\n");
    AppConfig config = load_config(path);
    EXPECT_EQ(config.build.storage_level, 10);
    EXPECT_EQ(config.build.min_shard_count, 12);
    EXPECT_EQ(config.build.max_shard_count, 24);
    EXPECT_EQ(config.build.scorer, "weighted");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.log_file, "build.log");
    EXPECT_EQ(config.users_file, "people.csv");
    EXPECT_EQ(config.shards_file, "out.json");
}

TEST_F(ConfigTest, PartialYamlKeepsDefaults) {
    const std::string path = write_yaml("geoshard_partial.yaml", "build:\n  storage_level: 6\n");
    AppConfig config = load_config(path);
    EXPECT_EQ(config.build.storage_level, 6);
    EXPECT_EQ(config.build.min_shard_count, 40);
    EXPECT_EQ(config.shards_file, "shards.json");
}

// =============================================================================
// Environment overrides
// =============================================================================

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    const std::string path = write_yaml("geoshard_env.yaml", "build:\n  storage_level: 6\n  scorer: weighted\n");
    setenv("GEOSHARD_STORAGE_LEVEL", "9", 1);
    setenv("GEOSHARD_MIN_SHARDS", "5", 1);
    setenv("GEOSHARD_MAX_SHARDS", "50", 1);
    setenv("GEOSHARD_SCORER", "user_count", 1);
    setenv("GEOSHARD_LOG_LEVEL", "warn", 1);

    AppConfig config = load_config(path);
    EXPECT_EQ(config.build.storage_level, 9);
    EXPECT_EQ(config.build.min_shard_count, 5);
    EXPECT_EQ(config.build.max_shard_count, 50);
    EXPECT_EQ(config.build.scorer, "user_count");
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, EnvironmentMustBeNumeric) {
    setenv("GEOSHARD_STORAGE_LEVEL", "eight", 1);
    EXPECT_THROW(load_config(), ConfigurationError);
    setenv("GEOSHARD_STORAGE_LEVEL", "8x", 1);
    EXPECT_THROW(load_config(), ConfigurationError);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigTest, ValidateBounds) {
    EXPECT_NO_THROW((BuildConfig{8, 40, 100, "user_count"}.validate()));
    EXPECT_THROW((BuildConfig{31, 40, 100, "user_count"}.validate()), ConfigurationError);
    EXPECT_THROW((BuildConfig{-1, 40, 100, "user_count"}.validate()), ConfigurationError);
    EXPECT_THROW((BuildConfig{8, 0, 100, "user_count"}.validate()), ConfigurationError);
    EXPECT_THROW((BuildConfig{8, 40, -5, "user_count"}.validate()), ConfigurationError);
    EXPECT_THROW((BuildConfig{8, 50, 40, "user_count"}.validate()), ConfigurationError);
}

TEST_F(ConfigTest, RejectsUnknownScorer) {
    setenv("GEOSHARD_SCORER", "popularity", 1);
    EXPECT_THROW(load_config(), ConfigurationError);
}

TEST_F(ConfigTest, RejectsBadFiles) {
    EXPECT_THROW(load_config("/nonexistent/geoshard.yaml"), ConfigurationError);

    const std::string malformed = write_yaml("geoshard_bad.yaml", "build: [unclosed\n");
    EXPECT_THROW(load_config(malformed), ConfigurationError);

    const std::string wrong_type = write_yaml("geoshard_type.yaml", "build:\n  storage_level: deep\n");
    EXPECT_THROW(load_config(wrong_type), ConfigurationError);

    const std::string bad_level = write_yaml("geoshard_log.yaml", "logging:\n  level: loud\n");
    EXPECT_THROW(load_config(bad_level), ConfigurationError);
}

TEST_F(ConfigTest, LogLevelNames) {
    EXPECT_EQ(parse_log_level("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_STREQ(log_level_name(LogLevel::ERROR), "error");
    EXPECT_THROW(parse_log_level("verbose"), ConfigurationError);
}

TEST_F(ConfigTest, LoggerIsSharedUntilReplaced) {
    auto first = logger();
    EXPECT_EQ(logger(), first);

    // Concurrent callers all see the same instance
    std::vector<std::thread> threads;
    std::vector<spdlog::logger*> seen(4, nullptr);
    for (size_t n = 0; n < seen.size(); ++n) {
        threads.emplace_back([&seen, n]() {
            for (int k = 0; k < 1000; ++k) {
                seen[n] = logger().get();
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }
    for (spdlog::logger* instance : seen) {
        EXPECT_EQ(instance, first.get());
    }

    init_logging(LogLevel::WARN);
    EXPECT_NE(logger(), first);
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
    EXPECT_EQ(logger()->name(), "geoshard");
    init_logging(LogLevel::INFO);
}
