#include <gtest/gtest.h>
#include "config/config.hpp"
#include "log/log.hpp"
#include "graph/errors.hpp"
#include "graph/id.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace weave;
using nlohmann::json;

TEST(ConfigTest, Defaults) {
    WeaveConfig c;
    EXPECT_DOUBLE_EQ(c.linker.threshold, 0.72);
    EXPECT_EQ(c.linker.max_connections, 20u);
    EXPECT_DOUBLE_EQ(c.hebbian.strength, 0.1);
    EXPECT_DOUBLE_EQ(c.hebbian.decay_rate, 0.99);
    EXPECT_DOUBLE_EQ(c.hebbian.prune_threshold, 0.05);
    EXPECT_DOUBLE_EQ(c.hebbian.max_weight, 5.0);
    EXPECT_DOUBLE_EQ(c.compression.max_context_bytes, 100000.0);
    EXPECT_DOUBLE_EQ(c.compression.threshold, 0.75);
    EXPECT_TRUE(c.persistence.provider.empty());
    EXPECT_EQ(c.log_level, "info");
}

TEST(ConfigTest, OverlaysOnlyPresentKeys) {
    json j = {
        {"log_level", "debug"},
        {"linker", {{"threshold", 0.5}, {"embed_workers", 4}}},
        {"hebbian", {{"max_weight", 3}}},
        {"compression", {{"stale_frequency", 5}}},
        {"persistence", {{"provider", "sqlite"}, {"sqlite_file", "graphs.db"}}},
        {"future_section", {{"anything", true}}},
    };
    WeaveConfig c = parseConfig(j);

    EXPECT_EQ(c.log_level, "debug");
    EXPECT_DOUBLE_EQ(c.linker.threshold, 0.5);
    EXPECT_EQ(c.linker.max_connections, 20u);
    EXPECT_EQ(c.linker.embed_workers, 4u);
    EXPECT_DOUBLE_EQ(c.hebbian.max_weight, 3.0);
    EXPECT_DOUBLE_EQ(c.hebbian.strength, 0.1);
    EXPECT_EQ(c.compression.stale_frequency, 5u);
    EXPECT_EQ(c.persistence.provider, "sqlite");
    EXPECT_EQ(c.persistence.sqlite_file, "graphs.db");
    EXPECT_EQ(c.persistence.data_dir, "./weave-data");
}

TEST(ConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(parseConfig(json::array()), WeaveError);
    EXPECT_THROW(parseConfig({{"linker", {{"threshold", "high"}}}}), WeaveError);
    EXPECT_THROW(parseConfig({{"linker", {{"max_connections", -1}}}}), WeaveError);
    EXPECT_THROW(parseConfig({{"hebbian", 7}}), WeaveError);
    EXPECT_THROW(parseConfig({{"persistence", {{"data_dir", 1}}}}), WeaveError);
    EXPECT_THROW(parseConfig({{"compression", {{"threshold", 0}}}}), WeaveError);
    EXPECT_THROW(parseConfig({{"compression", {{"target_reduction", 1.5}}}}), WeaveError);
    EXPECT_THROW(parseConfig({{"compression", {{"max_context_bytes", 0}}}}), WeaveError);
}

TEST(ConfigTest, LoadConfigFile) {
    auto path = std::filesystem::temp_directory_path() / ("weave_config_" + generateId() + ".json");
    {
        std::ofstream out(path);
        out << R"({"compression": {"max_context_bytes": 2048, "threshold": 0.9}})";
    }
    WeaveConfig c = loadConfigFile(path.string());
    EXPECT_DOUBLE_EQ(c.compression.max_context_bytes, 2048.0);
    EXPECT_DOUBLE_EQ(c.compression.threshold, 0.9);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ broken";
    }
    EXPECT_THROW(loadConfigFile(path.string()), WeaveError);
    std::filesystem::remove(path);

    EXPECT_THROW(loadConfigFile(path.string()), WeaveError);
}

TEST(ConfigTest, EnvironmentWins) {
    WeaveConfig c = parseConfig({{"persistence", {{"provider", "json"}, {"data_dir", "/srv/a"}}}});

    ::setenv("WEAVE_PROVIDER", "memory", 1);
    ::setenv("WEAVE_DATA_DIR", "/srv/b", 1);
    ::setenv("WEAVE_LOG_LEVEL", "warn", 1);
    applyEnvironment(c);
    ::unsetenv("WEAVE_PROVIDER");
    ::unsetenv("WEAVE_DATA_DIR");
    ::unsetenv("WEAVE_LOG_LEVEL");

    EXPECT_EQ(c.persistence.provider, "memory");
    EXPECT_EQ(c.persistence.data_dir, "/srv/b");
    EXPECT_EQ(c.log_level, "warn");
}

TEST(ConfigTest, EmptyEnvironmentChangesNothing) {
    ::setenv("WEAVE_PROVIDER", "", 1);
    ::unsetenv("WEAVE_DATA_DIR");
    WeaveConfig c;
    applyEnvironment(c);
    ::unsetenv("WEAVE_PROVIDER");
    EXPECT_TRUE(c.persistence.provider.empty());
    EXPECT_EQ(c.persistence.data_dir, "./weave-data");
}

TEST(ConfigTest, ConfigureAppliesFileEnvironmentAndLogLevel) {
    auto path = std::filesystem::temp_directory_path() / ("weave_config_" + generateId() + ".json");
    {
        std::ofstream out(path);
        out << R"({"log_level": "debug", "persistence": {"provider": "sqlite"}})";
    }

    ::setenv("WEAVE_LOG_LEVEL", "error", 1);
    WeaveConfig c = configure(path.string());
    ::unsetenv("WEAVE_LOG_LEVEL");
    std::filesystem::remove(path);

    EXPECT_EQ(c.persistence.provider, "sqlite");
    EXPECT_EQ(c.log_level, "error");
    EXPECT_EQ(log::get()->level(), spdlog::level::err);

    log::setLevel("info");
}

TEST(ConfigTest, ConfigureWithoutFileUsesDefaults) {
    ::unsetenv("WEAVE_LOG_LEVEL");
    ::unsetenv("WEAVE_PROVIDER");
    WeaveConfig c = configure();
    EXPECT_EQ(c.log_level, "info");
    EXPECT_EQ(log::get()->level(), spdlog::level::info);
}
