#include "process/command_runner.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif

#include <atomic>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandpool::process {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

enum class WaitOutcome {
    kExited,
    kDeadline,
    kLost
};

std::filesystem::path TempCapturePath(const char* stream) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto name = std::string("sandpool_") + stream + "_" + std::to_string(::getpid()) +
                      "_" + std::to_string(counter++) + "_" + stamp + ".log";
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir / name;
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    return bp::search_path(name).string();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

WaitOutcome WaitForChild(pid_t pid,
                         int& status,
                         const std::optional<std::chrono::steady_clock::time_point>& deadline) {
    if (!deadline) {
        while (true) {
            const auto waited = ::waitpid(pid, &status, 0);
            if (waited == pid) {
                return WaitOutcome::kExited;
            }
            if (waited < 0 && errno != EINTR) {
                return WaitOutcome::kLost;
            }
        }
    }
    while (std::chrono::steady_clock::now() < *deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return WaitOutcome::kExited;
        }
        if (waited < 0 && errno != EINTR) {
            return WaitOutcome::kLost;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return WaitOutcome::kDeadline;
}

}  // namespace

CommandResult MakeFailure(const std::string& command, const std::string& reason) {
    CommandResult result{};
    result.command = command;
    result.summary = command;
    result.exit_code = 1;
    result.failure = reason;
    return result;
}

std::string DescribeCommand(const std::vector<std::string>& argv) {
    return utils::Join(argv, " ");
}

SubprocessRunner::SubprocessRunner(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace) {}

CommandResult SubprocessRunner::Run(const CommandRequest& request) {
    const auto command = DescribeCommand(request.argv);
    if (request.argv.empty()) {
        utils::LogError("exec") << "refusing to run an empty command";
        return MakeFailure(command, "empty command");
    }

    const auto stdout_path = request.stdout_path.value_or(TempCapturePath("stdout"));
    const auto stderr_path = request.stderr_path.value_or(TempCapturePath("stderr"));
    const bool capture_stdout = !request.stdout_path.has_value();
    const bool capture_stderr = !request.merge_stderr && !request.stderr_path.has_value();

    CommandResult result{};
    result.command = command;
    result.summary = command;

    utils::LogDebug("exec") << "run: " << command;
    const auto started = std::chrono::steady_clock::now();
    try {
        const auto exe = ResolveExecutable(request.argv.front());
        if (exe.empty()) {
            throw std::runtime_error("executable not found: " + request.argv.front());
        }
        const std::vector<std::string> args(request.argv.begin() + 1, request.argv.end());
        const auto start_dir = request.working_dir.empty()
            ? std::filesystem::current_path().string()
            : request.working_dir;

        // Helpers such as run_fuzzer start the real workload as grandchildren;
        // the group lets a deadline reach all of them.
        bp::group group;
        auto launch = [&]() {
            if (request.merge_stderr) {
                return bp::child(
                    bp::exe = exe,
                    bp::args = args,
                    bp::start_dir = start_dir,
                    bp::std_in < bp::null,
                    (bp::std_out & bp::std_err) > stdout_path.string(),
                    group);
            }
            return bp::child(
                bp::exe = exe,
                bp::args = args,
                bp::start_dir = start_dir,
                bp::std_in < bp::null,
                bp::std_out > stdout_path.string(),
                bp::std_err > stderr_path.string(),
                group);
        };
        bp::child child_process = launch();
        const pid_t pid = child_process.id();

        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (request.timeout) {
            deadline = started + *request.timeout;
        }
        int status = 0;
        auto outcome = WaitForChild(pid, status, deadline);
        if (outcome == WaitOutcome::kDeadline) {
            result.timed_out = true;
            ::killpg(group.native_handle(), SIGTERM);
            outcome = WaitForChild(pid, status, std::chrono::steady_clock::now() + kill_grace_);
            std::error_code kill_ec;
            group.terminate(kill_ec);
            if (kill_ec && kill_ec.value() != ESRCH) {
                utils::LogWarn("exec") << "could not kill process group of (" << command
                                       << "): " << kill_ec.message();
            }
            if (outcome == WaitOutcome::kDeadline) {
                outcome = WaitForChild(pid, status, std::nullopt);
            }
        } else {
            // Background processes the command meant to leave behind survive.
            group.detach();
        }
        // The child is reaped here; keep boost from waiting on it again.
        child_process.detach();

        if (outcome == WaitOutcome::kExited) {
            result.exit_code = result.timed_out ? 124 : DecodeStatus(status);
        } else {
            result.exit_code = 1;
            result.failure = "lost track of child process";
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = 1;
        result.failure = std::string("exec failed: ") + ex.what();
    } catch (const std::exception& ex) {
        result.exit_code = 1;
        result.failure = std::string("exec failed: ") + ex.what();
    }
    result.elapsed_s = utils::SecondsSince(started);

    if (result.failure) {
        utils::LogError("exec") << "command (" << command << ") failed: " << *result.failure;
        result.output.clear();
        result.error.clear();
    } else {
        result.output = capture_stdout ? ReadCapture(stdout_path) : "Logged in " + stdout_path.string();
        if (capture_stderr) {
            result.error = ReadCapture(stderr_path);
        } else if (request.stderr_path) {
            result.error = "Logged in " + stderr_path.string();
        }
    }

    std::error_code ec;
    if (capture_stdout) {
        std::filesystem::remove(stdout_path, ec);
    }
    if (capture_stderr) {
        std::filesystem::remove(stderr_path, ec);
    }

    utils::LogDebug("exec") << "done: " << command
                            << " exit=" << result.exit_code
                            << " timeout=" << (result.timed_out ? "true" : "false")
                            << " elapsed=" << result.elapsed_s << "s"
                            << "\n[exec] stdout\n" << result.output
                            << "\n[exec] stderr\n" << result.error;
    return result;
}

}  // namespace sandpool::process
