#include <chrono>
#include <fstream>
#include <functional>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "tools/diagnostic_parser.hpp"
#include "tools/file_set.hpp"
#include "tools/handler_support.hpp"
#include "tools/tool_handlers.hpp"

namespace cidispatch::tools {

using protocol::Finding;
using protocol::Severity;
using protocol::ToolResult;
using protocol::ToolStatus;

namespace {

constexpr const char* kFormatCheck = "format_check";
constexpr const char* kFormatFix = "format_fix";

struct Fingerprint {
    std::size_t size = 0;
    std::size_t hash = 0;

    bool operator==(const Fingerprint& other) const {
        return size == other.size && hash == other.hash;
    }
};

std::optional<Fingerprint> fingerprint(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();
    return Fingerprint{content.size(), std::hash<std::string>{}(content)};
}

// Resolves the file set or explains why it could not be.
std::optional<FileSet> resolve_or_fail(const ToolContext& context, const nlohmann::json& args,
                                       ToolResult& result) {
    auto resolved =
        resolve_file_set(context.config.workspace_root, file_set_request_from_args(context, args));
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        result.status = ToolStatus::Error;
        result.summary = err.message;
        return std::nullopt;
    }
    return core::errors::get_value(resolved);
}

std::string formatter_name(const ToolContext& context) {
    return context.config.formatter.executable;
}

}  // namespace

ToolResult format_check(const ToolContext& context, const nlohmann::json& args) {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    result.tool_name = kFormatCheck;

    const auto file_set = resolve_or_fail(context, args, result);
    if (!file_set) {
        return result;
    }
    if (file_set->empty()) {
        result.summary = "No matching files to check.";
        return result;
    }

    LOG_INFO("format_check: checking " + plural(file_set->size(), "file"));
    auto run = run_over_files(context, context.config.formatter,
                              context.config.format_check_arguments, file_set->files);
    if (core::errors::is_error(run)) {
        result.status = ToolStatus::Error;
        result.summary = "Formatter could not be run: " + core::errors::get_error(run).message;
        result.duration_ms = elapsed_ms(started);
        return result;
    }
    const auto& process = core::errors::get_value(run);
    result.raw_output = process;
    result.duration_ms = elapsed_ms(started);

    const std::string interrupted =
        describe_interrupted(formatter_name(context), process, process.timeout_ms);
    if (!interrupted.empty()) {
        result.status = ToolStatus::Error;
        result.summary = interrupted;
        return result;
    }

    // One entry per file; the diff itself stays in raw_output.
    std::set<std::string> unformatted;
    const auto diagnostics = parse_diagnostics(process.stderr_text + "\n" + process.stdout_text);
    for (const auto& finding : diagnostics.findings) {
        if (finding.file) {
            unformatted.insert(policy::PolicyGuard::display_path(
                context.config.workspace_root, *finding.file));
        }
    }

    if (!unformatted.empty()) {
        result.status = ToolStatus::Failure;
        for (const auto& file : unformatted) {
            Finding finding;
            finding.file = file;
            finding.severity = Severity::Warning;
            finding.message = "File is not formatted.";
            result.details.push_back(std::move(finding));
        }
        result.summary = plural(unformatted.size(), "file") + " of " +
                         std::to_string(file_set->size()) + " need formatting.";
        return result;
    }

    if (process.exit_code != 0) {
        result.status = ToolStatus::Error;
        result.summary = formatter_name(context) + " exited with code " +
                         std::to_string(process.exit_code) + " without naming a file.";
        return result;
    }

    result.summary = "All " + plural(file_set->size(), "file") + " are formatted.";
    return result;
}

ToolResult format_fix(const ToolContext& context, const nlohmann::json& args) {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    result.tool_name = kFormatFix;

    const auto file_set = resolve_or_fail(context, args, result);
    if (!file_set) {
        return result;
    }
    if (file_set->empty()) {
        result.summary = "No matching files to format.";
        return result;
    }

    auto gate = context.gate.acquire(context.config.workspace_root, context.cancel_token);
    if (!gate) {
        result.status = ToolStatus::Error;
        result.summary = "Cancelled while waiting for the workspace.";
        return result;
    }

    std::vector<std::optional<Fingerprint>> before;
    before.reserve(file_set->size());
    for (const auto& file : file_set->files) {
        before.push_back(fingerprint(context.config.workspace_root / file));
    }

    LOG_INFO("format_fix: formatting " + plural(file_set->size(), "file"));
    auto run = run_over_files(context, context.config.formatter,
                              context.config.format_fix_arguments, file_set->files);
    if (core::errors::is_error(run)) {
        result.status = ToolStatus::Error;
        result.summary = "Formatter could not be run: " + core::errors::get_error(run).message;
        result.duration_ms = elapsed_ms(started);
        return result;
    }
    const auto& process = core::errors::get_value(run);
    result.raw_output = process;

    for (std::size_t i = 0; i < file_set->size(); ++i) {
        const auto after = fingerprint(context.config.workspace_root / file_set->files[i]);
        if (after == before[i]) {
            continue;
        }
        Finding finding;
        finding.file = file_set->files[i];
        finding.severity = Severity::Info;
        finding.message = "Reformatted.";
        result.details.push_back(std::move(finding));
    }
    result.duration_ms = elapsed_ms(started);

    const std::string interrupted =
        describe_interrupted(formatter_name(context), process, process.timeout_ms);
    if (!interrupted.empty()) {
        result.status = ToolStatus::Error;
        result.summary = interrupted + " " + plural(result.details.size(), "file") +
                         " were rewritten before it stopped.";
        return result;
    }
    if (process.exit_code != 0) {
        result.status = ToolStatus::Error;
        result.summary = formatter_name(context) + " exited with code " +
                         std::to_string(process.exit_code) + ".";
        return result;
    }

    result.summary = "Reformatted " + std::to_string(result.details.size()) + " of " +
                     plural(file_set->size(), "file") + ".";
    return result;
}

}  // namespace cidispatch::tools
