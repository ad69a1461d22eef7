#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/run_args.hpp"
#include "config/config_loader.hpp"
#include "pool/sandbox_pool.hpp"
#include "process/command_runner.hpp"
#include "sandbox/compile_patch.hpp"
#include "sandbox/image_provider.hpp"
#include "sandbox/sandbox.hpp"
#include "utils/logging.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  sandpool run --project P --target-name N --target-path F [--language L]\n"
              << "               [--pool-size C] [--corpus DIR] [--fuzz-timeout S] [--driver FILE]\n"
              << "               [--build-script FILE] [--log DIR] [--no-cache]\n"
              << "  sandpool config\n"
              << "  sandpool patch-compile FILE" << std::endl;
}

std::optional<std::string> ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

bool WriteSources(sandpool::sandbox::Sandbox& sandbox,
                  const std::optional<std::string>& driver,
                  const std::optional<std::string>& build_script) {
    if (driver && !sandbox.RewriteDriver(*driver).Succeeded()) {
        return false;
    }
    if (build_script && !sandbox.RewriteBuildScript(*build_script).Succeeded()) {
        return false;
    }
    return true;
}

int RunTrial(int argc, char** argv) {
    auto config = sandpool::config::LoadConfig();
    sandpool::cli::RunArgs args{};
    if (!sandpool::cli::ParseRunArgs(std::vector<std::string>(argv + 2, argv + argc), config, args)) {
        PrintUsage();
        return 1;
    }
    sandpool::utils::SetLogConfig({sandpool::utils::ParseLogLevel(config.log_level,
                                                                  sandpool::utils::LogLevel::kInfo)});

    std::optional<std::string> driver;
    std::optional<std::string> build_script;
    if (args.driver_path) {
        driver = ReadFile(*args.driver_path);
        if (!driver) {
            std::cout << "Cannot read " << *args.driver_path << std::endl;
            return 1;
        }
    }
    if (args.build_script_path) {
        build_script = ReadFile(*args.build_script_path);
        if (!build_script) {
            std::cout << "Cannot read " << *args.build_script_path << std::endl;
            return 1;
        }
    }

    const std::filesystem::path log_dir(args.log_dir);
    std::filesystem::path corpus_dir = args.corpus_dir.empty()
        ? log_dir / "corpus"
        : std::filesystem::path(args.corpus_dir);
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    std::filesystem::create_directories(corpus_dir, ec);
    corpus_dir = std::filesystem::absolute(corpus_dir, ec);

    sandpool::process::SubprocessRunner runner;
    sandpool::sandbox::OssFuzzImageProvider images(
        runner,
        {config.oss_fuzz_dir, config.runtime.docker_binary, config.runtime.python_binary,
         config.cache_registry});

    auto factory = [&config, &images, &runner](sandpool::sandbox::Sanitizer sanitizer, int cpus) {
        sandpool::sandbox::SandboxOptions options{};
        options.project = config.benchmark.project;
        options.language = config.benchmark.language;
        options.target_name = config.benchmark.target_name;
        options.target_path = config.benchmark.target_path;
        options.sanitizer = sandpool::sandbox::ToString(sanitizer);
        options.cpus = cpus;
        options.use_build_cache = config.pool.use_build_cache;
        options.oss_fuzz_dir = config.oss_fuzz_dir;
        options.docker_binary = config.runtime.docker_binary;
        options.python_binary = config.runtime.python_binary;
        options.shm_size = config.runtime.shm_size;
        options.platform = config.runtime.platform;
        return std::make_unique<sandpool::sandbox::Sandbox>(options, images, runner);
    };

    std::unique_ptr<sandpool::pool::SandboxPool> pool;
    try {
        pool = std::make_unique<sandpool::pool::SandboxPool>(
            sandpool::pool::PoolOptions{config.pool.pool_size, sandpool::config::ResolveSystemCores(config)},
            factory);
    } catch (const std::exception& ex) {
        std::cout << "Failed to initialize sandbox pool: " << ex.what() << std::endl;
        return 1;
    }

    int exit_code = 0;
    auto& pair = pool->Acquire();
    if (!WriteSources(*pair.address, driver, build_script) ||
        !WriteSources(*pair.coverage, driver, build_script)) {
        std::cout << "Failed to write sources into the sandboxes." << std::endl;
        exit_code = 1;
    } else {
        const auto address_build = pair.address->Compile("", log_dir / "build-address.log");
        const auto coverage_build = pair.coverage->Compile("", log_dir / "build-coverage.log");
        std::cout << address_build.summary << " address exit=" << address_build.exit_code << std::endl;
        std::cout << coverage_build.summary << " coverage exit=" << coverage_build.exit_code << std::endl;
        if (address_build.Succeeded() && coverage_build.Succeeded()) {
            const auto fuzz_log = log_dir / "fuzz.log";
            const auto fuzz = pair.address->Fuzz(config.pool.fuzz_timeout_s, fuzz_log, corpus_dir.string());
            std::cout << "fuzz exit=" << fuzz.exit_code
                      << " timeout=" << (fuzz.timed_out ? "true" : "false")
                      << " log=" << fuzz_log.string() << std::endl;
            const auto coverage = pair.coverage->GetCoverage(corpus_dir.string(), config.benchmark.target_name);
            std::cout << "coverage exit=" << coverage.exit_code
                      << " timeout=" << (coverage.timed_out ? "true" : "false") << std::endl;
        } else {
            exit_code = 1;
        }
    }
    pool->Release(pair);

    if (!pool->Shutdown()) {
        std::cout << "Some containers could not be removed." << std::endl;
    }
    return exit_code;
}

int PrintConfig() {
    const auto config = sandpool::config::LoadConfig();
    std::cout << sandpool::config::ConfigToJson(config).dump(2) << std::endl;
    return 0;
}

int PatchCompile(const std::string& path) {
    const auto contents = ReadFile(path);
    if (!contents) {
        std::cout << "Cannot read " << path << std::endl;
        return 1;
    }
    const auto patch = sandpool::sandbox::PatchCompileScript(*contents);
    std::cout << patch.contents;
    if (!patch.applied) {
        std::cerr << "[patch] expected COPY_SOURCES_CMD not found in " << path << std::endl;
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "run") {
        return RunTrial(argc, argv);
    }
    if (argc >= 2 && std::string(argv[1]) == "config") {
        return PrintConfig();
    }
    if (argc >= 3 && std::string(argv[1]) == "patch-compile") {
        return PatchCompile(argv[2]);
    }
    PrintUsage();
    return 1;
}
