#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "config/config_loader.hpp"

using sandpool::config::ApplyConfigFromJson;
using sandpool::config::Config;
using sandpool::config::LoadConfig;

TEST(ConfigLoader, DefaultsMatchThePipeline) {
    Config config{};
    EXPECT_EQ(config.pool.pool_size, 4);
    EXPECT_TRUE(config.pool.use_build_cache);
    EXPECT_EQ(config.pool.fuzz_timeout_s, 60);
    EXPECT_EQ(config.runtime.shm_size, "2g");
    EXPECT_EQ(config.runtime.platform, "linux/amd64");
}

TEST(ConfigLoader, AppliesKnownKeys) {
    Config config{};
    const auto data = nlohmann::json::parse(R"({
        "ossFuzzDir": "/opt/oss-fuzz",
        "poolSize": 2,
        "systemCores": 8,
        "useBuildCache": false,
        "logLevel": "debug",
        "dockerBinary": "podman",
        "benchmark": {
            "project": "libpng",
            "language": "c",
            "targetName": "libpng_read_fuzzer",
            "targetPath": "/src/libpng_read_fuzzer.cc"
        }
    })");
    ApplyConfigFromJson(config, data);
    EXPECT_EQ(config.oss_fuzz_dir, "/opt/oss-fuzz");
    EXPECT_EQ(config.pool.pool_size, 2);
    EXPECT_EQ(config.pool.system_cores, 8);
    EXPECT_FALSE(config.pool.use_build_cache);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.runtime.docker_binary, "podman");
    EXPECT_EQ(config.benchmark.project, "libpng");
    EXPECT_EQ(config.benchmark.language, "c");
    EXPECT_EQ(config.benchmark.target_name, "libpng_read_fuzzer");
    EXPECT_EQ(config.benchmark.target_path, "/src/libpng_read_fuzzer.cc");
    EXPECT_EQ(sandpool::config::ResolveSystemCores(config), 8);
}

TEST(ConfigLoader, IgnoresMistypedKeys) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"poolSize": "many", "useBuildCache": 1})"));
    EXPECT_EQ(config.pool.pool_size, 4);
    EXPECT_TRUE(config.pool.use_build_cache);
}

TEST(ConfigLoader, DetectsCoresWhenUnset) {
    Config config{};
    EXPECT_GE(sandpool::config::ResolveSystemCores(config), 1);
}

TEST(ConfigLoader, RoundTripsThroughJson) {
    Config config{};
    config.pool.pool_size = 3;
    config.benchmark.project = "zlib";
    Config copy{};
    ApplyConfigFromJson(copy, sandpool::config::ConfigToJson(config));
    EXPECT_EQ(copy.pool.pool_size, 3);
    EXPECT_EQ(copy.benchmark.project, "zlib");
}

TEST(ConfigLoader, UnstattableConfigPathFallsBackToDefaults) {
    // A path component past NAME_MAX makes stat() fail with ENAMETOOLONG.
    const std::string path = "/tmp/" + std::string(300, 'x') + "/config.json";
    ::setenv("SANDPOOL_CONFIG", path.c_str(), 1);
    ::unsetenv("SANDPOOL_POOL_SIZE");
    Config config{};
    EXPECT_NO_THROW(config = LoadConfig());
    ::unsetenv("SANDPOOL_CONFIG");
    EXPECT_EQ(config.pool.pool_size, 4);
}
