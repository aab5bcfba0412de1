#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "tools/diagnostic_parser.hpp"
#include "tools/file_set.hpp"
#include "tools/handler_support.hpp"
#include "tools/tool_handlers.hpp"

namespace cidispatch::tools {

using protocol::Severity;
using protocol::ToolResult;
using protocol::ToolStatus;

namespace {

std::size_t count_severity(const std::vector<protocol::Finding>& findings,
                           const Severity severity) {
    std::size_t count = 0;
    for (const auto& finding : findings) {
        if (finding.severity == severity) {
            ++count;
        }
    }
    return count;
}

// lint and analyze differ only in the command line they build.
ToolResult run_analyzer(const ToolContext& context, const nlohmann::json& args,
                        const std::string& tool_name,
                        const core::config::ExternalCommand& command,
                        const std::vector<std::string>& mode_arguments) {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    result.tool_name = tool_name;

    auto resolved =
        resolve_file_set(context.config.workspace_root, file_set_request_from_args(context, args));
    if (core::errors::is_error(resolved)) {
        result.status = ToolStatus::Error;
        result.summary = core::errors::get_error(resolved).message;
        return result;
    }
    const auto& file_set = core::errors::get_value(resolved);
    if (file_set.empty()) {
        result.summary = "No matching files to analyze.";
        return result;
    }

    LOG_INFO(tool_name + ": running " + command.executable + " over " +
             plural(file_set.size(), "file"));
    auto run = run_over_files(context, command, mode_arguments, file_set.files);
    result.duration_ms = elapsed_ms(started);
    if (core::errors::is_error(run)) {
        const auto& err = core::errors::get_error(run);
        result.status = ToolStatus::Error;
        result.summary = command.executable + " could not be run: " + err.message;
        return result;
    }
    const auto& process = core::errors::get_value(run);
    result.raw_output = process;

    const std::string interrupted =
        describe_interrupted(command.executable, process, process.timeout_ms);
    if (!interrupted.empty()) {
        result.status = ToolStatus::Error;
        result.summary = interrupted;
        return result;
    }

    auto diagnostics = parse_diagnostics(process.stdout_text + "\n" + process.stderr_text);
    for (auto& finding : diagnostics.findings) {
        if (finding.file) {
            finding.file = policy::PolicyGuard::display_path(context.config.workspace_root,
                                                             *finding.file);
        }
    }
    result.details = std::move(diagnostics.findings);

    std::string unparsed_note;
    if (diagnostics.unparsed_lines > 0) {
        unparsed_note = " (" + plural(diagnostics.unparsed_lines, "unparsed line") + ")";
    }

    if (!result.details.empty()) {
        result.status = ToolStatus::Failure;
        result.summary = plural(result.details.size(), "finding") + " in " +
                         plural(file_set.size(), "file") + ": " +
                         std::to_string(count_severity(result.details, Severity::Error)) +
                         " errors, " +
                         std::to_string(count_severity(result.details, Severity::Warning)) +
                         " warnings" + unparsed_note + ".";
        return result;
    }

    if (process.exit_code != 0) {
        result.status = ToolStatus::Error;
        result.summary = command.executable + " exited with code " +
                         std::to_string(process.exit_code) + " and reported no findings" +
                         unparsed_note + ".";
        return result;
    }

    result.summary = "No findings in " + plural(file_set.size(), "file") + unparsed_note + ".";
    return result;
}

}  // namespace

ToolResult lint(const ToolContext& context, const nlohmann::json& args) {
    std::vector<std::string> mode_arguments;
    const auto database_dir =
        context.config.workspace_root / context.config.compile_commands_dir;
    std::error_code ec;
    if (std::filesystem::is_regular_file(database_dir / "compile_commands.json", ec)) {
        mode_arguments.push_back("-p");
        mode_arguments.push_back(database_dir.string());
    } else {
        LOG_DEBUG("lint: no compile_commands.json under " + database_dir.string());
    }
    return run_analyzer(context, args, "lint", context.config.linter, mode_arguments);
}

ToolResult analyze(const ToolContext& context, const nlohmann::json& args) {
    return run_analyzer(context, args, "analyze", context.config.analyzer, {});
}

}  // namespace cidispatch::tools
