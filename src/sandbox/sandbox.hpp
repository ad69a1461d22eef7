#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "process/command_runner.hpp"
#include "sandbox/image_provider.hpp"
#include "sandbox/project_layout.hpp"
#include "sandbox/runtime_tracker.hpp"
#include "sandbox/sanitizer.hpp"

namespace sandpool::sandbox {

struct SandboxOptions {
    std::string project;
    std::string language = "c++";
    std::string target_name;
    std::string target_path;
    // "address" or "coverage"; anything else fails construction.
    std::string sanitizer;
    int cpus = 1;
    bool use_build_cache = true;
    std::string oss_fuzz_dir;
    std::string docker_binary = "docker";
    std::string python_binary = "python3";
    std::string shm_size = "2g";
    std::string platform = "linux/amd64";
};

enum class SandboxState {
    kReady,
    kCompiling,
    kFuzzing,
    kCollectingCoverage,
    kTerminated
};

const char* ToString(SandboxState state);

// A long-lived project container. Construction provisions and prepares the
// container and throws on any failure; every operation afterwards reports
// its outcome as a CommandResult and leaves the sandbox usable.
//
// Not synchronized: a sandbox has one user between acquire and release.
class Sandbox {
public:
    static constexpr const char* kBuildScriptPath = "/src/build.sh";
    static constexpr const char* kBuildScriptBackupPath = "/src/build.bk.sh";
    static constexpr const char* kCompileScriptPath = "/usr/local/bin/compile";
    static constexpr const char* kMkdirShimPath = "/etc/profile.d/mkdir.sh";
    static constexpr const char* kCompileSummary = "# Compiles the fuzz target.";
    static constexpr int kFuzzWaitMarginS = 5;

    Sandbox(SandboxOptions options, ImageProvider& images, process::CommandRunner& runner);

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Runs |command| with bash inside the container. With |log_path|, stderr
    // is written there and the result's error text points to the file.
    process::CommandResult Execute(const std::string& command,
                                   const std::optional<std::filesystem::path>& log_path = std::nullopt);

    process::CommandResult Compile(const std::string& extra_args = "",
                                   const std::optional<std::filesystem::path>& log_path = std::nullopt);

    // Runs the fuzzer through the host-side helper. Output goes to
    // |log_path|. Expiry of the run_timeout_s + kFuzzWaitMarginS deadline is
    // a soft timeout: the result is marked timed_out and nothing is thrown.
    process::CommandResult Fuzz(int run_timeout_s,
                                const std::filesystem::path& log_path,
                                const std::string& corpus_dir);

    process::CommandResult GetCoverage(const std::string& corpus_dir,
                                       const std::string& harness_name = "");

    process::CommandResult RewriteDriver(const std::string& content);
    process::CommandResult RewriteBuildScript(const std::string& content);
    process::CommandResult WriteFile(const std::string& content, const std::string& container_path);

    // Stops and removes the container. Returns false if the runtime refused.
    bool Terminate();

    Sanitizer sanitizer() const { return sanitizer_; }
    const std::string& project() const { return options_.project; }
    const std::string& image() const { return image_; }
    const std::string& generated_name() const { return generated_name_; }
    const std::string& container_id() const { return container_id_; }
    const std::string& project_dir() const { return project_dir_; }
    const ProjectLayout& layout() const { return layout_; }
    bool warm_from_cache() const { return warm_from_cache_; }
    bool compile_script_patched() const { return compile_script_patched_; }
    int cpus() const { return options_.cpus; }
    SandboxState state() const { return state_; }
    const RuntimeTracker& coverage_runtime() const { return coverage_runtime_; }

private:
    class StateScope;

    std::string StartContainer();
    void BackupBuildScript();
    std::string QueryProjectDir();
    void InstallMkdirShim();
    void PatchCompileStep();
    process::CommandResult TerminatedResult(const std::string& command) const;

    SandboxOptions options_;
    process::CommandRunner& runner_;
    Sanitizer sanitizer_;
    std::string image_;
    bool warm_from_cache_ = false;
    std::string generated_name_;
    ProjectLayout layout_;
    std::string container_id_;
    std::string project_dir_;
    bool compile_script_patched_ = false;
    SandboxState state_ = SandboxState::kReady;
    RuntimeTracker coverage_runtime_;
};

}  // namespace sandpool::sandbox
