#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "policy/policy_guard.hpp"
#include "tools/handler_support.hpp"
#include "tools/tool_handlers.hpp"

namespace cidispatch::tools {

using protocol::Finding;
using protocol::Severity;
using protocol::ToolResult;
using protocol::ToolStatus;

ToolResult project_status(const ToolContext& context, const nlohmann::json& /*args*/) {
    const auto started = std::chrono::steady_clock::now();
    const auto& config = context.config;
    ToolResult result;
    result.tool_name = "project_status";

    const policy::PolicyGuard policy_guard;
    const auto environment = policy_guard.child_environment();

    const std::vector<std::pair<std::string, const core::config::ExternalCommand*>> binaries = {
        {"formatter", &config.formatter},
        {"linter", &config.linter},
        {"analyzer", &config.analyzer},
        {"vcs", &config.vcs}};

    std::size_t missing = 0;
    for (const auto& [role, command] : binaries) {
        Finding finding;
        finding.attributes.emplace_back("role", role);
        finding.attributes.emplace_back("executable", command->executable);
        auto resolved = ProcessRunner::resolve_executable(command->executable, environment);
        if (core::errors::is_error(resolved)) {
            ++missing;
            finding.severity = Severity::Warning;
            finding.message = role + " '" + command->executable +
                              "' is unavailable: " + core::errors::get_error(resolved).message;
        } else {
            const auto path = core::errors::get_value(resolved).string();
            finding.severity = Severity::Info;
            finding.message = role + " '" + command->executable + "' found at " + path;
            finding.attributes.emplace_back("path", path);
        }
        result.details.push_back(std::move(finding));
    }

    Finding workspace;
    workspace.severity = Severity::Info;
    workspace.message = "Workspace root is " + config.workspace_root.string();
    workspace.attributes = {{"workspace_root", config.workspace_root.string()},
                            {"config_version", std::to_string(core::config::kConfigVersion)},
                            {"vcs_token", config.vcs_token ? "present" : "absent"}};
    result.details.insert(result.details.begin(), std::move(workspace));

    result.duration_ms = elapsed_ms(started);
    if (missing > 0) {
        result.status = ToolStatus::Failure;
        result.summary = plural(missing, "external tool") + " missing from PATH.";
    } else {
        result.summary = "All external tools are available.";
    }
    return result;
}

}  // namespace cidispatch::tools
