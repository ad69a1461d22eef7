#pragma once

#include <string>

namespace sandpool::config {

struct BenchmarkConfig {
    std::string project;
    std::string language = "c++";
    std::string target_name;
    std::string target_path;
};

struct RuntimeConfig {
    std::string docker_binary = "docker";
    std::string python_binary = "python3";
    std::string shm_size = "2g";
    std::string platform = "linux/amd64";
};

struct PoolConfig {
    int pool_size = 4;
    // 0 means the host's hardware concurrency.
    int system_cores = 0;
    bool use_build_cache = true;
    int fuzz_timeout_s = 60;
};

struct Config {
    std::string oss_fuzz_dir = "oss-fuzz";
    std::string cache_registry = "us-central1-docker.pkg.dev/oss-fuzz/oss-fuzz-gen";
    std::string log_level = "info";
    BenchmarkConfig benchmark;
    RuntimeConfig runtime;
    PoolConfig pool;
};

}  // namespace sandpool::config
