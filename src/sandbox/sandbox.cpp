#include "sandbox/sandbox.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <unistd.h>

#include "sandbox/compile_patch.hpp"
#include "sandbox/helper_commands.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandpool::sandbox {
namespace {

constexpr const char* kMkdirShim =
    "mkdir() { command mkdir -p \"$@\"; }\n"
    "export -f mkdir\n";

Sanitizer ValidateSanitizer(const std::string& value) {
    const auto sanitizer = ParseSanitizer(value);
    if (!sanitizer) {
        throw std::invalid_argument(
            "Supplied sanitizer '" + value + "' is invalid. Please provide 'address' or 'coverage'");
    }
    return *sanitizer;
}

std::filesystem::path UploadStagingPath() {
    static std::atomic<unsigned long> counter{0};
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir /
           ("sandpool_upload_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
}

std::size_t CountEntries(const std::string& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }
    std::size_t count = 0;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        ++count;
    }
    return count;
}

}  // namespace

const char* ToString(SandboxState state) {
    switch (state) {
        case SandboxState::kReady: return "ready";
        case SandboxState::kCompiling: return "compiling";
        case SandboxState::kFuzzing: return "fuzzing";
        case SandboxState::kCollectingCoverage: return "collecting-coverage";
        case SandboxState::kTerminated: return "terminated";
    }
    return "unknown";
}

class Sandbox::StateScope {
public:
    StateScope(Sandbox& sandbox, SandboxState state) : sandbox_(sandbox) {
        sandbox_.state_ = state;
    }
    ~StateScope() { sandbox_.state_ = SandboxState::kReady; }

    StateScope(const StateScope&) = delete;
    StateScope& operator=(const StateScope&) = delete;

private:
    Sandbox& sandbox_;
};

Sandbox::Sandbox(SandboxOptions options, ImageProvider& images, process::CommandRunner& runner)
    : options_(std::move(options)),
      runner_(runner),
      sanitizer_(ValidateSanitizer(options_.sanitizer)) {
    const auto image = images.PrepareImage(options_.project, sanitizer_, options_.use_build_cache);
    if (!image || image->empty()) {
        throw std::runtime_error("Failed to build image for " + options_.project);
    }
    image_ = *image;

    warm_from_cache_ = IsCachedImage(image_);
    if (warm_from_cache_) {
        utils::LogInfo("sandbox") << "using cached build image " << image_;
    }
    generated_name_ = GeneratedProjectName(image_);

    // Bind mounts need absolute host paths.
    layout_ = MakeProjectLayout(std::filesystem::absolute(options_.oss_fuzz_dir), generated_name_);
    CreateLayoutDirectories(layout_);

    container_id_ = StartContainer();
    BackupBuildScript();
    project_dir_ = QueryProjectDir();
    if (!warm_from_cache_) {
        InstallMkdirShim();
    }
    PatchCompileStep();

    utils::LogInfo("sandbox") << "image " << image_ << " (" << ToString(sanitizer_)
                              << ") running as container " << container_id_
                              << " linked to " << layout_.project_dir.string();
}

std::string Sandbox::StartContainer() {
    ContainerSpec spec{};
    spec.docker_binary = options_.docker_binary;
    spec.image = image_;
    spec.platform = options_.platform;
    spec.shm_size = options_.shm_size;
    spec.cpus = options_.cpus;
    spec.project_name = generated_name_;
    spec.language = options_.language;
    spec.layout = layout_;

    process::CommandRequest request{};
    request.argv = DockerRunCommand(spec);
    const auto result = runner_.Run(request);
    const auto container_id = utils::Trim(result.output);
    if (!result.Succeeded() || container_id.empty()) {
        utils::LogError("sandbox") << "failed to start container of image " << image_
                                   << " exit=" << result.exit_code << "\n" << result.error;
        throw std::runtime_error("Failed to start container of image " + image_);
    }
    return container_id;
}

void Sandbox::BackupBuildScript() {
    const auto result = Execute(std::string("cp ") + kBuildScriptPath + " " + kBuildScriptBackupPath);
    if (!result.Succeeded()) {
        utils::LogError("sandbox") << "failed to back up " << kBuildScriptPath << " in " << image_;
    }
}

std::string Sandbox::QueryProjectDir() {
    const auto result = Execute("pwd");
    if (!result.Succeeded()) {
        utils::LogError("sandbox") << "failed to get the WORKDIR of " << image_;
        return {};
    }
    return utils::Trim(result.output);
}

void Sandbox::InstallMkdirShim() {
    const auto result = WriteFile(kMkdirShim, kMkdirShimPath);
    if (!result.Succeeded()) {
        utils::LogError("sandbox") << "failed to install " << kMkdirShimPath
                                   << " in container " << container_id_;
    }
}

void Sandbox::PatchCompileStep() {
    const auto current = Execute(std::string("cat ") + kCompileScriptPath);
    if (!current.Succeeded()) {
        utils::LogWarn("sandbox") << "could not read " << kCompileScriptPath
                                  << " in container " << container_id_ << ", leaving it unpatched";
        return;
    }
    const auto patch = PatchCompileScript(current.output);
    if (!patch.applied) {
        utils::LogWarn("sandbox") << kCompileScriptPath << " in " << image_
                                  << " has no expected COPY_SOURCES_CMD; sources are copied on every build";
        return;
    }
    const auto written = WriteFile(patch.contents, kCompileScriptPath);
    compile_script_patched_ = written.Succeeded();
    if (!compile_script_patched_) {
        utils::LogError("sandbox") << "failed to write patched " << kCompileScriptPath
                                   << " in container " << container_id_;
    }
}

process::CommandResult Sandbox::TerminatedResult(const std::string& command) const {
    utils::LogError("sandbox") << "container " << container_id_
                               << " is terminated, not running: " << command;
    return process::MakeFailure(command, "sandbox terminated");
}

process::CommandResult Sandbox::Execute(const std::string& command,
                                        const std::optional<std::filesystem::path>& log_path) {
    if (state_ == SandboxState::kTerminated) {
        return TerminatedResult(command);
    }
    utils::LogDebug("sandbox") << "executing (" << command << ") in " << container_id_;
    process::CommandRequest request{};
    request.argv = DockerExecCommand(options_.docker_binary, container_id_, command);
    request.stderr_path = log_path;
    auto result = runner_.Run(request);
    result.command = command;
    result.summary = command;
    return result;
}

process::CommandResult Sandbox::Compile(const std::string& extra_args,
                                        const std::optional<std::filesystem::path>& log_path) {
    if (state_ == SandboxState::kTerminated) {
        return TerminatedResult("compile");
    }
    auto command = std::string("SANITIZER=") + ToString(sanitizer_) + " compile";
    if (!extra_args.empty()) {
        command += " " + extra_args;
    }
    if (!warm_from_cache_) {
        command = std::string("source ") + kMkdirShimPath + "; " + command;
    }

    StateScope scope(*this, SandboxState::kCompiling);
    const auto started = std::chrono::steady_clock::now();
    auto result = Execute(command, log_path);
    // Consumers see the outcome only, never the literal invocation.
    result.summary = kCompileSummary;
    utils::LogDebug("sandbox") << "container " << container_id_ << ": compiled fuzz target with sanitizer "
                               << ToString(sanitizer_) << " in " << utils::SecondsSince(started)
                               << " seconds, exit=" << result.exit_code;
    return result;
}

process::CommandResult Sandbox::Fuzz(int run_timeout_s,
                                     const std::filesystem::path& log_path,
                                     const std::string& corpus_dir) {
    const auto argv = RunFuzzerCommand(options_.python_binary, generated_name_,
                                       options_.target_name, corpus_dir, run_timeout_s);
    if (state_ == SandboxState::kTerminated) {
        return TerminatedResult(process::DescribeCommand(argv));
    }

    StateScope scope(*this, SandboxState::kFuzzing);
    process::CommandRequest request{};
    request.argv = argv;
    request.working_dir = options_.oss_fuzz_dir;
    request.timeout = std::chrono::seconds(run_timeout_s + kFuzzWaitMarginS);
    request.stdout_path = log_path;
    request.merge_stderr = true;
    const auto result = runner_.Run(request);

    if (result.timed_out) {
        // Soft timeout: whatever reached the log is still parsed downstream.
        utils::LogInfo("sandbox") << layout_.project_dir.string() << " timed out during fuzzing";
    }
    if (result.exit_code != 0) {
        utils::LogDebug("sandbox") << "container " << container_id_
                                   << ": fuzzing trial terminated with non-zero exit code "
                                   << result.exit_code;
    } else {
        utils::LogDebug("sandbox") << "container " << container_id_ << ": fuzzing trial was successful";
    }
    return result;
}

process::CommandResult Sandbox::GetCoverage(const std::string& corpus_dir,
                                            const std::string& harness_name) {
    const auto argv = CoverageCommand(options_.python_binary, generated_name_,
                                      options_.target_name, corpus_dir);
    if (state_ == SandboxState::kTerminated) {
        return TerminatedResult(process::DescribeCommand(argv));
    }

    const auto corpus_size = CountEntries(corpus_dir);
    if (corpus_size == 0) {
        utils::LogWarn("sandbox") << "provided corpus path (" << corpus_dir << ") has no seeds in it";
    }
    utils::LogDebug("sandbox") << "corpus " << corpus_dir << " has size " << corpus_size;

    StateScope scope(*this, SandboxState::kCollectingCoverage);
    const auto budget_s = coverage_runtime_.BudgetSeconds();
    process::CommandRequest request{};
    request.argv = argv;
    request.working_dir = options_.oss_fuzz_dir;
    request.timeout = coverage_runtime_.Budget();
    const auto result = runner_.Run(request);

    if (result.timed_out) {
        utils::LogInfo("sandbox") << "coverage timed out in " << budget_s
                                  << " seconds for harness " << harness_name;
    } else if (!result.Succeeded()) {
        utils::LogInfo("sandbox") << "failed to generate coverage for " << generated_name_
                                  << " exit=" << result.exit_code
                                  << ":\n" << result.output << "\n" << result.error;
    } else {
        coverage_runtime_.Record(result.elapsed_s);
        utils::LogDebug("sandbox") << "coverage stdout:\n" << result.output;
    }
    return result;
}

process::CommandResult Sandbox::RewriteDriver(const std::string& content) {
    return WriteFile(content, options_.target_path);
}

process::CommandResult Sandbox::RewriteBuildScript(const std::string& content) {
    return WriteFile(content, kBuildScriptPath);
}

process::CommandResult Sandbox::WriteFile(const std::string& content, const std::string& container_path) {
    if (state_ == SandboxState::kTerminated) {
        return TerminatedResult("write " + container_path);
    }

    // The content travels as a file, so its bytes never meet a shell parser.
    const auto staging = UploadStagingPath();
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            utils::LogError("sandbox") << "cannot create staging file " << staging.string();
            return process::MakeFailure("write " + container_path, "cannot create staging file");
        }
        output << content;
    }

    const auto remote_staging = "/tmp/" + staging.filename().string();
    process::CommandRequest copy{};
    copy.argv = DockerCopyCommand(options_.docker_binary, staging.string(), container_id_, remote_staging);
    auto result = runner_.Run(copy);

    std::error_code ec;
    std::filesystem::remove(staging, ec);

    if (!result.Succeeded()) {
        utils::LogError("sandbox") << "failed to copy content for " << container_path
                                   << " into container " << container_id_ << "\n" << result.error;
        return result;
    }
    // Writing through the existing file keeps its mode and owner.
    return Execute("cat " + utils::ShellQuote(remote_staging) + " > " + utils::ShellQuote(container_path) +
                   " && rm -f " + utils::ShellQuote(remote_staging));
}

bool Sandbox::Terminate() {
    if (state_ == SandboxState::kTerminated) {
        return true;
    }
    process::CommandRequest request{};
    request.argv = DockerRemoveCommand(options_.docker_binary, container_id_);
    const auto result = runner_.Run(request);
    if (!result.Succeeded()) {
        utils::LogError("sandbox") << "failed to remove container " << container_id_
                                   << " exit=" << result.exit_code << "\n" << result.error;
        return false;
    }
    state_ = SandboxState::kTerminated;
    utils::LogInfo("sandbox") << "terminated container " << container_id_;
    return true;
}

}  // namespace sandpool::sandbox
