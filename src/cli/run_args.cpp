#include "cli/run_args.hpp"

#include <iostream>
#include <stdexcept>

namespace sandpool::cli {
namespace {

int ParsePositive(const std::string& value) {
    std::size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size() || parsed < 1) {
        throw std::invalid_argument("expected a positive integer");
    }
    return parsed;
}

}  // namespace

bool ParseRunArgs(const std::vector<std::string>& flags, config::Config& config, RunArgs& args) {
    for (std::size_t i = 0; i < flags.size(); ++i) {
        const auto& flag = flags[i];
        if (flag == "--no-cache") {
            config.pool.use_build_cache = false;
            continue;
        }
        if (i + 1 >= flags.size()) {
            std::cout << "Missing value for " << flag << std::endl;
            return false;
        }
        const auto& value = flags[++i];
        try {
            if (flag == "--project") {
                config.benchmark.project = value;
            } else if (flag == "--target-name") {
                config.benchmark.target_name = value;
            } else if (flag == "--target-path") {
                config.benchmark.target_path = value;
            } else if (flag == "--language") {
                config.benchmark.language = value;
            } else if (flag == "--pool-size") {
                config.pool.pool_size = ParsePositive(value);
            } else if (flag == "--fuzz-timeout") {
                config.pool.fuzz_timeout_s = ParsePositive(value);
            } else if (flag == "--corpus") {
                args.corpus_dir = value;
            } else if (flag == "--log") {
                args.log_dir = value;
            } else if (flag == "--driver") {
                args.driver_path = value;
            } else if (flag == "--build-script") {
                args.build_script_path = value;
            } else {
                std::cout << "Unknown flag " << flag << std::endl;
                return false;
            }
        } catch (const std::exception&) {
            std::cout << "Invalid value for " << flag << ": " << value << std::endl;
            return false;
        }
    }
    if (config.benchmark.project.empty() || config.benchmark.target_name.empty() ||
        config.benchmark.target_path.empty()) {
        std::cout << "--project, --target-name and --target-path are required" << std::endl;
        return false;
    }
    // Values from the config file or environment are held to the same bounds.
    if (config.pool.pool_size < 1 || config.pool.fuzz_timeout_s < 1) {
        std::cout << "pool size and fuzz timeout must be at least 1" << std::endl;
        return false;
    }
    return true;
}

}  // namespace sandpool::cli
