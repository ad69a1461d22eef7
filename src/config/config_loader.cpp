#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <thread>

#include "utils/logging.hpp"

namespace sandpool::config {
namespace {

constexpr int kFallbackSystemCores = 24;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void OverrideString(const char* name, std::string& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(const char* name, int& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideBool(const char* name, bool& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("SANDPOOL_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".sandpool" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "ossFuzzDir", config.oss_fuzz_dir);
    ReadString(data, "cacheRegistry", config.cache_registry);
    ReadString(data, "logLevel", config.log_level);

    ReadString(data, "dockerBinary", config.runtime.docker_binary);
    ReadString(data, "pythonBinary", config.runtime.python_binary);
    ReadString(data, "shmSize", config.runtime.shm_size);
    ReadString(data, "platform", config.runtime.platform);

    ReadInt(data, "poolSize", config.pool.pool_size);
    ReadInt(data, "systemCores", config.pool.system_cores);
    ReadBool(data, "useBuildCache", config.pool.use_build_cache);
    ReadInt(data, "fuzzTimeoutS", config.pool.fuzz_timeout_s);

    if (data.contains("benchmark") && data["benchmark"].is_object()) {
        const auto& benchmark = data["benchmark"];
        ReadString(benchmark, "project", config.benchmark.project);
        ReadString(benchmark, "language", config.benchmark.language);
        ReadString(benchmark, "targetName", config.benchmark.target_name);
        ReadString(benchmark, "targetPath", config.benchmark.target_path);
    }
}

nlohmann::json ConfigToJson(const Config& config) {
    return {
        {"ossFuzzDir", config.oss_fuzz_dir},
        {"cacheRegistry", config.cache_registry},
        {"logLevel", config.log_level},
        {"dockerBinary", config.runtime.docker_binary},
        {"pythonBinary", config.runtime.python_binary},
        {"shmSize", config.runtime.shm_size},
        {"platform", config.runtime.platform},
        {"poolSize", config.pool.pool_size},
        {"systemCores", ResolveSystemCores(config)},
        {"useBuildCache", config.pool.use_build_cache},
        {"fuzzTimeoutS", config.pool.fuzz_timeout_s},
        {"benchmark", {
            {"project", config.benchmark.project},
            {"language", config.benchmark.language},
            {"targetName", config.benchmark.target_name},
            {"targetPath", config.benchmark.target_path}
        }}
    };
}

int ResolveSystemCores(const Config& config) {
    if (config.pool.system_cores > 0) {
        return config.pool.system_cores;
    }
    const auto detected = static_cast<int>(std::thread::hardware_concurrency());
    return detected > 0 ? detected : kFallbackSystemCores;
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config") << "ignoring " << config_path.string() << ": " << ex.what();
        }
    } else if (ec) {
        utils::LogWarn("config") << "cannot read " << config_path.string() << ": " << ec.message();
    }

    OverrideString("SANDPOOL_OSS_FUZZ_DIR", config.oss_fuzz_dir);
    OverrideString("SANDPOOL_CACHE_REGISTRY", config.cache_registry);
    OverrideString("SANDPOOL_LOG_LEVEL", config.log_level);
    OverrideString("SANDPOOL_DOCKER_BINARY", config.runtime.docker_binary);
    OverrideString("SANDPOOL_PYTHON_BINARY", config.runtime.python_binary);
    OverrideString("SANDPOOL_SHM_SIZE", config.runtime.shm_size);
    OverrideString("SANDPOOL_PLATFORM", config.runtime.platform);
    OverrideInt("SANDPOOL_POOL_SIZE", config.pool.pool_size);
    OverrideInt("SANDPOOL_SYSTEM_CORES", config.pool.system_cores);
    OverrideBool("SANDPOOL_USE_BUILD_CACHE", config.pool.use_build_cache);
    OverrideInt("SANDPOOL_FUZZ_TIMEOUT_S", config.pool.fuzz_timeout_s);
    OverrideString("SANDPOOL_BENCHMARK_PROJECT", config.benchmark.project);
    OverrideString("SANDPOOL_BENCHMARK_LANGUAGE", config.benchmark.language);
    OverrideString("SANDPOOL_BENCHMARK_TARGET_NAME", config.benchmark.target_name);
    OverrideString("SANDPOOL_BENCHMARK_TARGET_PATH", config.benchmark.target_path);

    return config;
}

}  // namespace sandpool::config
