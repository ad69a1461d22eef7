#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace sandpool::cli {

struct RunArgs {
    std::string corpus_dir;
    std::string log_dir = ".";
    std::optional<std::string> driver_path;
    std::optional<std::string> build_script_path;
};

// Parses the flags following "sandpool run" on top of |config|. Prints the
// reason and returns false on bad input.
bool ParseRunArgs(const std::vector<std::string>& flags, config::Config& config, RunArgs& args);

}  // namespace sandpool::cli
