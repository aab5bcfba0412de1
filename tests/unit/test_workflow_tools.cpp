#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/dispatch_errors.hpp"
#include "session/workspace_gate.hpp"
#include "tools/tool_context.hpp"
#include "tools/tool_handlers.hpp"

namespace {

using cidispatch::core::errors::DispatchError;
using cidispatch::core::errors::ErrorCategory;
using cidispatch::core::errors::Result;
using cidispatch::protocol::ProcessResult;
using cidispatch::protocol::Severity;
using cidispatch::protocol::ToolStatus;
using cidispatch::tools::ProcessRequest;
using nlohmann::json;

// Replays canned process results and records what was asked for.
class ScriptedRunner : public cidispatch::tools::CommandRunner {
public:
    void push(int exit_code, std::string stdout_text, std::string stderr_text = "") {
        ProcessResult result;
        result.exit_code = exit_code;
        result.stdout_text = std::move(stdout_text);
        result.stderr_text = std::move(stderr_text);
        script_.push_back(result);
    }

    void push_error(const std::string& message) { script_.push_back(message); }

    void push_timeout() {
        ProcessResult result;
        result.timed_out = true;
        script_.push_back(result);
    }

    Result<ProcessResult> run(const ProcessRequest& request) override {
        requests.push_back(request);
        std::this_thread::sleep_for(delay);
        if (script_.empty()) {
            return DispatchError{ErrorCategory::Internal, "unexpected call", "unexpected_call"};
        }
        auto next = script_.front();
        script_.pop_front();
        if (const auto* message = std::get_if<std::string>(&next)) {
            return DispatchError{ErrorCategory::Execution, *message, "binary_not_found"};
        }
        return std::get<ProcessResult>(next);
    }

    std::vector<ProcessRequest> requests;
    std::chrono::milliseconds delay{0};

private:
    std::deque<std::variant<ProcessResult, std::string>> script_;
};

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_workflow_tools_" + cidispatch::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    void write(const std::filesystem::path& relative, const std::string& content) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

private:
    std::filesystem::path root_;
};

class WorkflowToolsTest : public ::testing::Test {
protected:
    WorkflowToolsTest() {
        config_.workspace_root = workspace_.root();
        config_.vcs.executable = "gh";
    }

    cidispatch::tools::ToolContext context() {
        return cidispatch::tools::ToolContext{config_, runner_, gate_,
                                              std::make_shared<std::atomic_bool>(false),
                                              std::nullopt, "test"};
    }

    TempWorkspace workspace_;
    cidispatch::core::config::ServerConfig config_;
    ScriptedRunner runner_;
    cidispatch::session::WorkspaceGate gate_;
};

std::optional<std::string> env_value(const ProcessRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.environment) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

const char* kTwoRuns = R"([
    {"databaseId": 11, "workflowName": "CI", "headBranch": "main", "status": "completed",
     "conclusion": "failure", "createdAt": "2024-05-01T10:00:00Z", "url": "u11"},
    {"databaseId": 10, "workflowName": "CI", "headBranch": "main", "status": "completed",
     "conclusion": "success", "createdAt": "2024-04-30T10:00:00Z", "url": "u10"}
])";

TEST_F(WorkflowToolsTest, FailedRunMakesFailure) {
    runner_.push(0, "");
    runner_.push(0, kTwoRuns);

    const auto result = cidispatch::tools::check_workflow_runs(context(), json{{"limit", 2}});
    EXPECT_EQ(result.status, ToolStatus::Failure);
    ASSERT_EQ(result.details.size(), 2u);
    EXPECT_EQ(result.details[0].severity, Severity::Error);
    EXPECT_EQ(result.details[1].severity, Severity::Info);

    ASSERT_EQ(runner_.requests.size(), 2u);
    const auto& list = runner_.requests[1].arguments;
    const std::vector<std::string> expected = {
        "run", "list", "--limit", "2", "--json",
        "databaseId,workflowName,headBranch,status,conclusion,createdAt,url"};
    EXPECT_EQ(list, expected);
}

TEST_F(WorkflowToolsTest, TimeoutMessageUsesTheRequestedLimit) {
    runner_.push_timeout();
    runner_.delay = std::chrono::milliseconds(300);

    auto ctx = context();
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    const auto result = cidispatch::tools::check_workflow_runs(ctx, json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);

    ASSERT_EQ(runner_.requests.size(), 1u);
    const auto limit = runner_.requests[0].timeout_ms;
    EXPECT_GT(limit, 1u);
    EXPECT_EQ(result.summary, "gh timed out after " + std::to_string(limit) + " ms.");
}

TEST_F(WorkflowToolsTest, AllGreenIsSuccess) {
    runner_.push(0, "");
    runner_.push(0, R"([{"databaseId": 1, "status": "completed", "conclusion": "success"}])");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Success);
    ASSERT_EQ(result.details.size(), 1u);
}

TEST_F(WorkflowToolsTest, EmptyListingIsSuccess) {
    runner_.push(0, "");
    runner_.push(0, "[]");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Success);
    EXPECT_EQ(result.summary, "No workflow runs found.");
}

TEST_F(WorkflowToolsTest, UnauthenticatedCliIsAnError) {
    runner_.push(1, "", "You are not logged into any GitHub hosts.");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_NE(result.summary.find("not authenticated"), std::string::npos);
    EXPECT_NE(result.summary.find("GH_TOKEN"), std::string::npos);
    EXPECT_EQ(runner_.requests.size(), 1u);
}

TEST_F(WorkflowToolsTest, MissingCliIsAnError) {
    runner_.push_error("Executable not found: gh");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_NE(result.summary.find("GitHub CLI"), std::string::npos);
}

TEST_F(WorkflowToolsTest, ListingFailureReportsFirstStderrLine) {
    runner_.push(0, "");
    runner_.push(1, "", "\nHTTP 404: Not Found\nmore detail\n");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_EQ(result.summary, "Could not fetch workflow runs: HTTP 404: Not Found");
}

TEST_F(WorkflowToolsTest, UnparseableListingIsAnError) {
    runner_.push(0, "");
    runner_.push(0, "<html>");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
}

TEST_F(WorkflowToolsTest, TokenOnlyReachesChildEnvironment) {
    config_.vcs_token = "ghp_secret";
    runner_.push(0, "");
    runner_.push(0, "[]");
    const auto result = cidispatch::tools::check_workflow_runs(context(), json::object());
    ASSERT_EQ(result.status, ToolStatus::Success);

    for (const auto& request : runner_.requests) {
        EXPECT_EQ(env_value(request, "GH_TOKEN"), std::optional<std::string>("ghp_secret"));
        for (const auto& argument : request.arguments) {
            EXPECT_EQ(argument.find("ghp_secret"), std::string::npos);
        }
    }
    EXPECT_EQ(result.summary.find("ghp_secret"), std::string::npos);
}

TEST_F(WorkflowToolsTest, RunIdSelectsRunView) {
    runner_.push(0, "");
    runner_.push(0, R"({"databaseId": 99, "status": "completed", "conclusion": "timed_out"})");
    const auto result = cidispatch::tools::check_workflow_runs(
        context(), json{{"run_id", "99"}, {"repo", "octo/widgets"}});
    EXPECT_EQ(result.status, ToolStatus::Failure);
    ASSERT_EQ(runner_.requests.size(), 2u);
    const std::vector<std::string> expected = {
        "run", "view", "99", "--json",
        "databaseId,workflowName,headBranch,status,conclusion,createdAt,url", "--repo",
        "octo/widgets"};
    EXPECT_EQ(runner_.requests[1].arguments, expected);
}

TEST_F(WorkflowToolsTest, NonNumericRunIdIsRejectedBeforeRunning) {
    const auto result =
        cidispatch::tools::check_workflow_runs(context(), json{{"run_id", "12; rm -rf"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_TRUE(runner_.requests.empty());
}

TEST_F(WorkflowToolsTest, OptionLikeBranchIsRejected) {
    const auto result =
        cidispatch::tools::check_workflow_runs(context(), json{{"branch", "--web"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_TRUE(runner_.requests.empty());
}

TEST_F(WorkflowToolsTest, InlineContentIsValidated) {
    const auto result = cidispatch::tools::validate_workflow_yaml(
        context(), json{{"content", "name: build\non: push\njobs: {}"}});
    EXPECT_EQ(result.status, ToolStatus::Failure);
    ASSERT_EQ(result.details.size(), 1u);
    EXPECT_NE(result.details[0].message.find("steps"), std::string::npos);
}

TEST_F(WorkflowToolsTest, InlineGarbageIsAnError) {
    const auto result =
        cidispatch::tools::validate_workflow_yaml(context(), json{{"content", "{{{"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
    EXPECT_NE(result.summary.find("<inline>"), std::string::npos);
}

TEST_F(WorkflowToolsTest, ContentAndFileAreExclusive) {
    const auto result = cidispatch::tools::validate_workflow_yaml(
        context(), json{{"content", "on: push"}, {"workflow_file", "ci.yml"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
}

TEST_F(WorkflowToolsTest, WorkflowFileIsLookedUpInWorkflowsDirectory) {
    workspace_.write(".github/workflows/ci.yml",
                     "on: push\njobs:\n  b:\n    runs-on: x\n    steps:\n      - run: make\n");
    const auto result =
        cidispatch::tools::validate_workflow_yaml(context(), json{{"workflow_file", "ci.yml"}});
    EXPECT_EQ(result.status, ToolStatus::Success);
}

TEST_F(WorkflowToolsTest, MissingWorkflowFileIsAnError) {
    const auto result = cidispatch::tools::validate_workflow_yaml(
        context(), json{{"workflow_file", "absent.yml"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
}

TEST_F(WorkflowToolsTest, WorkflowFileOutsideWorkspaceIsAnError) {
    const auto result = cidispatch::tools::validate_workflow_yaml(
        context(), json{{"workflow_file", "../../../etc/hosts"}});
    EXPECT_EQ(result.status, ToolStatus::Error);
}

TEST_F(WorkflowToolsTest, ScansWorkflowsDirectory) {
    workspace_.write(".github/workflows/a.yml", "on: push\njobs: {}\n");
    workspace_.write(".github/workflows/b.yaml",
                     "on: push\njobs:\n  b:\n    runs-on: x\n    steps:\n      - run: make\n");
    workspace_.write(".github/workflows/notes.txt", "ignored");
    const auto result = cidispatch::tools::validate_workflow_yaml(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Failure);
    ASSERT_EQ(result.details.size(), 1u);
    EXPECT_EQ(*result.details[0].file, ".github/workflows/a.yml");
}

TEST_F(WorkflowToolsTest, BrokenDocumentDoesNotHideOthers) {
    workspace_.write(".github/workflows/a.yml", "jobs: [unclosed\n");
    workspace_.write(".github/workflows/b.yml", "on: push\n");
    const auto result = cidispatch::tools::validate_workflow_yaml(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
    ASSERT_EQ(result.details.size(), 2u);
    EXPECT_EQ(*result.details[0].rule, "yaml-syntax");
    EXPECT_EQ(*result.details[1].rule, "missing-jobs");
}

TEST_F(WorkflowToolsTest, MissingWorkflowsDirectoryIsAnError) {
    const auto result = cidispatch::tools::validate_workflow_yaml(context(), json::object());
    EXPECT_EQ(result.status, ToolStatus::Error);
}

}  // namespace
