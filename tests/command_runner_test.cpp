#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

#include "process/command_runner.hpp"
#include "test_helpers.hpp"
#include "utils/common.hpp"

using sandpool::process::CommandRequest;
using sandpool::process::SubprocessRunner;

namespace {

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

CommandRequest Shell(const std::string& script) {
    CommandRequest request{};
    request.argv = {"/bin/sh", "-c", script};
    return request;
}

}  // namespace

TEST(SubprocessRunner, CapturesStdoutAndStderr) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("echo out; echo err 1>&2"));
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_EQ(result.command, "/bin/sh -c echo out; echo err 1>&2");
    EXPECT_EQ(result.summary, result.command);
}

TEST(SubprocessRunner, ReportsExitCode) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("exit 3"));
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.failure.has_value());
}

TEST(SubprocessRunner, SearchesPath) {
    SubprocessRunner runner;
    CommandRequest request{};
    request.argv = {"sh", "-c", "printf ok"};
    const auto result = runner.Run(request);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "ok");
}

TEST(SubprocessRunner, UnstartableCommandIsAResult) {
    SubprocessRunner runner;
    CommandRequest request{};
    request.argv = {"/nonexistent/sandpool-binary", "--flag"};
    sandpool::process::CommandResult result;
    ASSERT_NO_THROW(result = runner.Run(request));
    EXPECT_NE(result.exit_code, 0);
    EXPECT_TRUE(result.failure.has_value());
    EXPECT_TRUE(result.output.empty());
    EXPECT_TRUE(result.error.empty());
}

TEST(SubprocessRunner, MissingExecutableOnPathIsAResult) {
    SubprocessRunner runner;
    CommandRequest request{};
    request.argv = {"sandpool-no-such-tool"};
    const auto result = runner.Run(request);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_TRUE(result.failure.has_value());
}

TEST(SubprocessRunner, EmptyCommandIsAResult) {
    SubprocessRunner runner;
    const auto result = runner.Run(CommandRequest{});
    EXPECT_NE(result.exit_code, 0);
    EXPECT_TRUE(result.failure.has_value());
}

TEST(SubprocessRunner, BadWorkingDirectoryIsAResult) {
    SubprocessRunner runner;
    auto request = Shell("true");
    request.working_dir = "/nonexistent/sandpool-dir";
    const auto result = runner.Run(request);
    EXPECT_FALSE(result.Succeeded());
}

TEST(SubprocessRunner, RunsInWorkingDirectory) {
    sandpool::testing::TempDir dir;
    SubprocessRunner runner;
    auto request = Shell("pwd -P");
    request.working_dir = dir.path().string();
    const auto result = runner.Run(request);
    ASSERT_TRUE(result.Succeeded());
    EXPECT_EQ(std::filesystem::path(sandpool::utils::Trim(result.output)),
              std::filesystem::canonical(dir.path()));
}

TEST(SubprocessRunner, StderrToLogFile) {
    sandpool::testing::TempDir dir;
    const auto log = dir.path() / "stderr.log";
    SubprocessRunner runner;
    auto request = Shell("echo visible; echo hidden 1>&2");
    request.stderr_path = log;
    const auto result = runner.Run(request);
    ASSERT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "visible\n");
    EXPECT_EQ(result.error, "Logged in " + log.string());
    EXPECT_EQ(Slurp(log), "hidden\n");
}

TEST(SubprocessRunner, MergedOutputToLogFile) {
    sandpool::testing::TempDir dir;
    const auto log = dir.path() / "combined.log";
    SubprocessRunner runner;
    auto request = Shell("echo one; echo two 1>&2");
    request.stdout_path = log;
    request.merge_stderr = true;
    const auto result = runner.Run(request);
    ASSERT_TRUE(result.Succeeded());
    const auto contents = Slurp(log);
    EXPECT_NE(contents.find("one"), std::string::npos);
    EXPECT_NE(contents.find("two"), std::string::npos);
}

TEST(SubprocessRunner, DeadlineKillsAndKeepsPartialLog) {
    sandpool::testing::TempDir dir;
    const auto log = dir.path() / "fuzz.log";
    SubprocessRunner runner(std::chrono::milliseconds(200));
    auto request = Shell("echo partial; sleep 30");
    request.stdout_path = log;
    request.merge_stderr = true;
    request.timeout = std::chrono::milliseconds(300);

    const auto started = std::chrono::steady_clock::now();
    const auto result = runner.Run(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    ASSERT_TRUE(std::filesystem::exists(log));
    EXPECT_EQ(Slurp(log), "partial\n");
}

TEST(SubprocessRunner, DeadlineReachesGrandchildren) {
    sandpool::testing::TempDir dir;
    const auto log = dir.path() / "fuzz.log";
    SubprocessRunner runner(std::chrono::milliseconds(200));
    auto request = Shell("(sleep 1; echo late); echo done");
    request.stdout_path = log;
    request.merge_stderr = true;
    request.timeout = std::chrono::milliseconds(300);

    const auto result = runner.Run(request);
    EXPECT_TRUE(result.timed_out);

    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    const auto contents = Slurp(log);
    EXPECT_EQ(contents.find("late"), std::string::npos) << contents;
    EXPECT_EQ(contents.find("done"), std::string::npos) << contents;
}

TEST(SubprocessRunner, BackgroundWorkSurvivesNormalExit) {
    sandpool::testing::TempDir dir;
    const auto marker = dir.path() / "marker";
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("(sleep 0.3; touch '" + marker.string() + "') >/dev/null 2>&1 &"));
    ASSERT_TRUE(result.Succeeded());
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    EXPECT_TRUE(std::filesystem::exists(marker));
}

TEST(SubprocessRunner, RecordsElapsedTime) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("sleep 0.2"));
    ASSERT_TRUE(result.Succeeded());
    EXPECT_GE(result.elapsed_s, 0.15);
}
