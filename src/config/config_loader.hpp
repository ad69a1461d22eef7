#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace sandpool::config {

std::filesystem::path GetConfigPath();

// Defaults, then the JSON file, then SANDPOOL_* environment overrides.
Config LoadConfig();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

nlohmann::json ConfigToJson(const Config& config);

int ResolveSystemCores(const Config& config);

}  // namespace sandpool::config
