#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandpool::process {

struct CommandRequest {
    std::vector<std::string> argv;
    // Empty means the caller's working directory.
    std::string working_dir;
    std::optional<std::chrono::milliseconds> timeout;
    // When set, the stream is written to this file instead of being captured.
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
    // stderr shares the stdout destination.
    bool merge_stderr = false;
};

struct CommandResult {
    // Text of the command that was executed, for logs.
    std::string command;
    // Text shown to whoever consumes the result. Defaults to |command|.
    std::string summary;
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    // Set when the command could not be run at all.
    std::optional<std::string> failure;
    double elapsed_s = 0.0;

    bool Succeeded() const { return !failure && !timed_out && exit_code == 0; }
};

CommandResult MakeFailure(const std::string& command, const std::string& reason);

std::string DescribeCommand(const std::vector<std::string>& argv);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Never throws. Faults are reported through CommandResult::failure.
    virtual CommandResult Run(const CommandRequest& request) = 0;
};

class SubprocessRunner : public CommandRunner {
public:
    explicit SubprocessRunner(std::chrono::milliseconds kill_grace = std::chrono::seconds(2));

    CommandResult Run(const CommandRequest& request) override;

private:
    std::chrono::milliseconds kill_grace_;
};

}  // namespace sandpool::process
