#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/dispatch_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/process_runner.hpp"

namespace {

using cidispatch::core::errors::get_error;
using cidispatch::core::errors::get_value;
using cidispatch::core::errors::is_error;
using cidispatch::policy::PolicyGuard;
using cidispatch::tools::ProcessRequest;
using cidispatch::tools::ProcessRunner;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_process_runner_" + cidispatch::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

ProcessRequest shell(const std::string& script, std::uint32_t timeout_ms = 5000) {
    ProcessRequest request;
    request.executable = "/bin/sh";
    request.arguments = {"-c", script};
    request.timeout_ms = timeout_ms;
    request.environment = PolicyGuard().child_environment();
    return request;
}

// True once the pid is gone or only a zombie waiting for its new parent.
bool process_gone(const std::string& pid) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        std::ifstream stat("/proc/" + pid + "/stat");
        if (!stat.is_open()) {
            return true;
        }
        std::string line;
        std::getline(stat, line);
        const auto close_paren = line.rfind(')');
        if (close_paren != std::string::npos && close_paren + 2 < line.size() &&
            line[close_paren + 2] == 'Z') {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

std::string first_line(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    ProcessRunner runner;
    auto result = runner.run(shell("echo out; echo err >&2; exit 3"));
    ASSERT_FALSE(is_error(result));

    const auto& process = get_value(result);
    EXPECT_EQ(process.exit_code, 3);
    EXPECT_EQ(process.stdout_text, "out\n");
    EXPECT_EQ(process.stderr_text, "err\n");
    EXPECT_FALSE(process.timed_out);
    EXPECT_FALSE(process.cancelled);
}

TEST(ProcessRunnerTest, NonZeroExitIsNotAnError) {
    ProcessRunner runner;
    auto result = runner.run(shell("exit 1"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 1);
}

TEST(ProcessRunnerTest, MissingBinaryIsAnError) {
    ProcessRunner runner;
    ProcessRequest request;
    request.executable = "cidispatch-definitely-not-installed";
    request.environment = PolicyGuard().child_environment();
    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "binary_not_found");
}

TEST(ProcessRunnerTest, NonExecutableFileIsPermissionDenied) {
    TempWorkspace workspace;
    const auto script = workspace.root() / "tool.sh";
    std::ofstream(script) << "#!/bin/sh\necho hi\n";
    std::filesystem::permissions(script, std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_write);

    ProcessRunner runner;
    ProcessRequest request;
    request.executable = script.string();
    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "permission_denied");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    TempWorkspace workspace;
    ProcessRunner runner;
    auto request = shell("pwd");
    request.working_directory = workspace.root();
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));

    const auto reported = std::filesystem::canonical(first_line(get_value(result).stdout_text));
    EXPECT_EQ(reported, std::filesystem::canonical(workspace.root()));
}

TEST(ProcessRunnerTest, FeedsStdin) {
    ProcessRunner runner;
    auto request = shell("tr a-z A-Z");
    request.stdin_text = "hello";
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "HELLO");
}

TEST(ProcessRunnerTest, StdinDefaultsToEmpty) {
    ProcessRunner runner;
    auto result = runner.run(shell("cat; echo done"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "done\n");
}

TEST(ProcessRunnerTest, TruncatesLargeOutput) {
    ProcessRunner runner;
    auto request = shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
    request.max_output_bytes = 100;
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));

    const auto& process = get_value(result);
    EXPECT_TRUE(process.stdout_truncated);
    EXPECT_EQ(process.stdout_text.rfind("0123456789", 0), 0u);
    EXPECT_NE(process.stdout_text.find("[output truncated: 2100 bytes dropped]"),
              std::string::npos);
}

TEST(ProcessRunnerTest, TimeoutKillsWholeProcessGroup) {
    ProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();
    auto result = runner.run(shell("sleep 30 & echo $!; wait", 300));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));

    const auto& process = get_value(result);
    EXPECT_TRUE(process.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    const std::string background_pid = first_line(process.stdout_text);
    ASSERT_FALSE(background_pid.empty());
    EXPECT_TRUE(process_gone(background_pid));
}

TEST(ProcessRunnerTest, BackgroundChildDoesNotOutliveCall) {
    ProcessRunner runner;
    auto result = runner.run(shell("sleep 30 >/dev/null 2>&1 & echo $!"));
    ASSERT_FALSE(is_error(result));

    const std::string background_pid = first_line(get_value(result).stdout_text);
    ASSERT_FALSE(background_pid.empty());
    EXPECT_TRUE(process_gone(background_pid));
}

TEST(ProcessRunnerTest, CancelTokenStopsProcess) {
    ProcessRunner runner;
    auto request = shell("sleep 30", 60000);
    request.cancel_token = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([token = request.cancel_token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token->store(true);
    });
    auto result = runner.run(request);
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_FALSE(get_value(result).timed_out);
}

TEST(ProcessRunnerTest, CancelledBeforeStartNeverSpawns) {
    ProcessRunner runner;
    auto request = shell("echo should-not-run");
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_TRUE(get_value(result).stdout_text.empty());
}

TEST(ProcessRunnerTest, ChildSeesOnlyGivenEnvironment) {
    ProcessRunner runner;
    auto request = shell("echo \"[$CIDISPATCH_ONLY_PARENT][$EXTRA]\"");
    ASSERT_EQ(setenv("CIDISPATCH_ONLY_PARENT", "leak", 1), 0);
    request.environment = PolicyGuard().child_environment({{"EXTRA", "given"}});
    auto result = runner.run(request);
    ASSERT_EQ(unsetenv("CIDISPATCH_ONLY_PARENT"), 0);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "[][given]\n");
}

TEST(ProcessRunnerTest, ResolvesExecutableOnPath) {
    auto resolved = ProcessRunner::resolve_executable("sh", {{"PATH", "/nonexistent:/bin"}});
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), std::filesystem::path("/bin/sh"));
}

}  // namespace
