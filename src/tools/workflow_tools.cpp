#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "tools/handler_support.hpp"
#include "tools/tool_handlers.hpp"
#include "workflow/workflow_runs.hpp"
#include "workflow/workflow_validator.hpp"

namespace cidispatch::tools {

using protocol::Finding;
using protocol::Severity;
using protocol::ToolResult;
using protocol::ToolStatus;

namespace {

constexpr const char* kCheckRuns = "check_workflow_runs";
constexpr const char* kValidateYaml = "validate_workflow_yaml";
const std::filesystem::path kWorkflowsDir = std::filesystem::path(".github") / "workflows";

constexpr const char* kAuthHint =
    "Set GH_TOKEN or GITHUB_TOKEN for the server, or run `gh auth login` as the server user. "
    "The token needs the repo, workflow and read:org scopes for private repositories.";

std::string first_line(const std::string& text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = text.find('\n', start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool is_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

Finding run_finding(const workflow::WorkflowRun& run) {
    Finding finding;
    const bool failed = workflow::is_failed_conclusion(run.conclusion);
    finding.severity = failed ? Severity::Error : Severity::Info;
    finding.message = run.workflow + " on " + run.branch + ": " + run.status;
    if (!run.conclusion.empty()) {
        finding.message += " (" + run.conclusion + ")";
    }
    finding.attributes = {{"id", std::to_string(run.id)},
                          {"workflow", run.workflow},
                          {"branch", run.branch},
                          {"status", run.status},
                          {"conclusion", run.conclusion},
                          {"created_at", run.created_at},
                          {"url", run.url}};
    return finding;
}

// Builds the `gh run ...` arguments, rejecting values gh would read as flags.
core::errors::Result<std::vector<std::string>> run_query_arguments(const nlohmann::json& args) {
    using core::errors::DispatchError;
    using core::errors::ErrorCategory;

    const policy::PolicyGuard policy_guard;
    for (const char* key : {"workflow_name", "repo", "branch"}) {
        if (!args.contains(key)) {
            continue;
        }
        auto checked = policy_guard.validate_file_argument(args.at(key).get<std::string>());
        if (core::errors::is_error(checked)) {
            auto err = core::errors::get_error(checked);
            err.message = std::string("Invalid ") + key + ": " + err.message;
            return err;
        }
    }

    std::vector<std::string> arguments;
    if (args.contains("run_id")) {
        const auto run_id = args.at("run_id").get<std::string>();
        if (!is_digits(run_id)) {
            return DispatchError{ErrorCategory::Input, "run_id must be a numeric run id.",
                                 "invalid_run_id"};
        }
        arguments = {"run", "view", run_id, "--json", workflow::kRunJsonFields};
    } else {
        arguments = {"run", "list", "--limit", std::to_string(args.value("limit", 10)),
                     "--json", workflow::kRunJsonFields};
        if (args.contains("workflow_name")) {
            arguments.push_back("--workflow");
            arguments.push_back(args.at("workflow_name").get<std::string>());
        }
        if (args.contains("branch")) {
            arguments.push_back("--branch");
            arguments.push_back(args.at("branch").get<std::string>());
        }
    }
    if (args.contains("repo")) {
        arguments.push_back("--repo");
        arguments.push_back(args.at("repo").get<std::string>());
    }
    return arguments;
}

}  // namespace

ToolResult check_workflow_runs(const ToolContext& context, const nlohmann::json& args) {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    result.tool_name = kCheckRuns;

    auto query = run_query_arguments(args);
    if (core::errors::is_error(query)) {
        result.status = ToolStatus::Error;
        result.summary = core::errors::get_error(query).message;
        return result;
    }

    // The token only ever reaches the gh child.
    policy::EnvironmentList extra;
    if (context.config.vcs_token) {
        extra.emplace_back("GH_TOKEN", *context.config.vcs_token);
    }
    const auto& vcs = context.config.vcs;

    const auto auth_request = make_process_request(context, vcs, {"auth", "status"}, extra);
    auto auth = context.runner.run(auth_request);
    if (core::errors::is_error(auth)) {
        const auto& err = core::errors::get_error(auth);
        result.status = ToolStatus::Error;
        result.summary = vcs.executable + " could not be run: " + err.message +
                         " Install the GitHub CLI (https://cli.github.com/).";
        result.duration_ms = elapsed_ms(started);
        return result;
    }
    const auto& auth_process = core::errors::get_value(auth);
    std::string interrupted =
        describe_interrupted(vcs.executable, auth_process, auth_request.timeout_ms);
    if (!interrupted.empty() || auth_process.exit_code != 0) {
        result.status = ToolStatus::Error;
        result.summary = interrupted.empty()
                             ? "GitHub CLI is not authenticated. " + std::string(kAuthHint)
                             : interrupted;
        result.raw_output = auth_process;
        result.duration_ms = elapsed_ms(started);
        return result;
    }

    const auto listing_request =
        make_process_request(context, vcs, core::errors::get_value(query), extra);
    auto listing = context.runner.run(listing_request);
    result.duration_ms = elapsed_ms(started);
    if (core::errors::is_error(listing)) {
        result.status = ToolStatus::Error;
        result.summary = vcs.executable + " could not be run: " +
                         core::errors::get_error(listing).message;
        return result;
    }
    const auto& process = core::errors::get_value(listing);
    result.raw_output = process;

    interrupted = describe_interrupted(vcs.executable, process, listing_request.timeout_ms);
    if (!interrupted.empty()) {
        result.status = ToolStatus::Error;
        result.summary = interrupted;
        return result;
    }
    if (process.exit_code != 0) {
        const std::string reason = first_line(process.stderr_text);
        result.status = ToolStatus::Error;
        result.summary = "Could not fetch workflow runs" +
                         (reason.empty() ? std::string(".") : ": " + reason);
        return result;
    }

    auto parsed = workflow::parse_workflow_runs(process.stdout_text);
    if (core::errors::is_error(parsed)) {
        result.status = ToolStatus::Error;
        result.summary = core::errors::get_error(parsed).message;
        return result;
    }
    const auto& runs = core::errors::get_value(parsed);

    std::size_t failed = 0;
    for (const auto& run : runs) {
        if (workflow::is_failed_conclusion(run.conclusion)) {
            ++failed;
        }
        result.details.push_back(run_finding(run));
    }

    if (runs.empty()) {
        result.summary = "No workflow runs found.";
    } else if (failed > 0) {
        result.status = ToolStatus::Failure;
        result.summary = plural(failed, "failed run") + " among the latest " +
                         plural(runs.size(), "run") + ".";
    } else {
        result.summary = "No failed runs among the latest " + plural(runs.size(), "run") + ".";
    }
    return result;
}

ToolResult validate_workflow_yaml(const ToolContext& context, const nlohmann::json& args) {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    result.tool_name = kValidateYaml;
    const auto& root = context.config.workspace_root;

    if (args.contains("content") && args.contains("workflow_file")) {
        result.status = ToolStatus::Error;
        result.summary = "Pass either content or workflow_file, not both.";
        return result;
    }

    // (display name, text) for every document to check.
    std::vector<std::pair<std::string, std::string>> documents;
    if (args.contains("content")) {
        documents.emplace_back("<inline>", args.at("content").get<std::string>());
    } else if (args.contains("workflow_file")) {
        const auto name = args.at("workflow_file").get<std::string>();
        const policy::PolicyGuard policy_guard;
        std::error_code ec;
        std::filesystem::path candidate = name;
        if (!std::filesystem::exists(root / candidate, ec)) {
            candidate = kWorkflowsDir / name;
        }
        auto checked = policy_guard.validate_path_in_workspace(root, candidate);
        if (core::errors::is_error(checked)) {
            result.status = ToolStatus::Error;
            result.summary = core::errors::get_error(checked).message;
            return result;
        }
        const auto text = read_text(core::errors::get_value(checked));
        if (!text) {
            result.status = ToolStatus::Error;
            result.summary = "Workflow file not found: " + name;
            return result;
        }
        documents.emplace_back(
            policy::PolicyGuard::display_path(root, core::errors::get_value(checked)), *text);
    } else {
        const auto directory = root / kWorkflowsDir;
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            result.status = ToolStatus::Error;
            result.summary = "No " + kWorkflowsDir.generic_string() + " directory found.";
            return result;
        }
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            const auto extension = entry.path().extension();
            if (entry.is_regular_file(ec) && (extension == ".yml" || extension == ".yaml")) {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            result.status = ToolStatus::Error;
            result.summary = "Unable to list " + kWorkflowsDir.generic_string() + ": " +
                             ec.message();
            return result;
        }
        std::sort(files.begin(), files.end());
        for (const auto& file : files) {
            const auto text = read_text(file);
            if (!text) {
                result.status = ToolStatus::Error;
                result.summary = "Unable to read " + policy::PolicyGuard::display_path(root, file);
                return result;
            }
            documents.emplace_back(policy::PolicyGuard::display_path(root, file), *text);
        }
        if (documents.empty()) {
            result.summary = "No workflow files found.";
            return result;
        }
    }

    // A document that does not parse makes the whole result an error, but
    // the other documents are still checked and reported.
    std::size_t unparseable = 0;
    std::size_t invalid = 0;
    for (const auto& [name, text] : documents) {
        auto validated = workflow::validate_workflow_document(text, name);
        if (core::errors::is_error(validated)) {
            ++unparseable;
            Finding finding;
            finding.file = name;
            finding.severity = Severity::Error;
            finding.message = core::errors::get_error(validated).message;
            finding.rule = "yaml-syntax";
            result.details.push_back(std::move(finding));
            continue;
        }
        const auto& findings = core::errors::get_value(validated);
        if (!findings.empty()) {
            ++invalid;
        }
        result.details.insert(result.details.end(), findings.begin(), findings.end());
    }
    result.duration_ms = elapsed_ms(started);
    LOG_DEBUG("validate_workflow_yaml: checked " + plural(documents.size(), "document"));

    if (unparseable > 0) {
        result.status = ToolStatus::Error;
        result.summary = plural(unparseable, "workflow document") + " could not be parsed as YAML.";
        if (documents.size() == 1) {
            result.summary = result.details.front().message;
        }
        return result;
    }
    if (invalid > 0) {
        result.status = ToolStatus::Failure;
        result.summary = plural(result.details.size(), "violation") + " in " +
                         std::to_string(invalid) + " of " +
                         plural(documents.size(), "workflow document") + ".";
        return result;
    }
    result.summary = "All " + plural(documents.size(), "workflow document") + " are valid.";
    return result;
}

}  // namespace cidispatch::tools
