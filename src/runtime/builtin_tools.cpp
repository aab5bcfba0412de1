#include "runtime/builtin_tools.hpp"

#include <optional>
#include <utility>
#include <vector>
#include "runtime/pipeline_orchestrator.hpp"
#include "tools/tool_handlers.hpp"

namespace cidispatch::runtime {

using nlohmann::json;
using protocol::ParamSpec;
using protocol::ParamType;
using protocol::ToolOutcome;
using protocol::ToolSpec;

namespace {

std::vector<ParamSpec> file_set_parameters() {
    return {
        {"path", ParamType::String, false, json("."),
         "Directory to scan, relative to the workspace root.", std::nullopt, std::nullopt},
        {"files", ParamType::StringArray, false, std::nullopt,
         "Explicit workspace-relative files. Overrides path.", std::nullopt, std::nullopt},
        {"extensions", ParamType::StringArray, false, std::nullopt,
         "File extensions to include when scanning, e.g. [\".cpp\", \".hpp\"].", std::nullopt,
         std::nullopt},
    };
}

// Adapts a plain ToolResult handler to the registry's handler type.
template <typename Handler>
ToolHandler wrap(Handler handler) {
    return [handler](const tools::ToolContext& context, const json& args) -> ToolOutcome {
        return handler(context, args);
    };
}

std::vector<std::pair<ToolSpec, ToolHandler>> builtin_tools(const ToolRegistry& registry) {
    std::vector<std::pair<ToolSpec, ToolHandler>> table;

    table.push_back({{"format_check",
                      "Check source files against the formatter without changing them.",
                      file_set_parameters()},
                     wrap(tools::format_check)});
    table.push_back({{"format_fix", "Rewrite source files in place with the formatter.",
                      file_set_parameters()},
                     wrap(tools::format_fix)});
    table.push_back({{"lint", "Run the linter over source files and report its diagnostics.",
                      file_set_parameters()},
                     wrap(tools::lint)});
    table.push_back({{"analyze", "Run deep static analysis over source files.",
                      file_set_parameters()},
                     wrap(tools::analyze)});

    const PipelineOrchestrator orchestrator(registry);
    table.push_back({{"full_ci",
                      "Run format_check, lint and analyze in order. Stops at the first stage "
                      "that cannot run.",
                      file_set_parameters()},
                     [orchestrator](const tools::ToolContext& context,
                                    const json& args) -> ToolOutcome {
                         return orchestrator.run(context, args);
                     }});

    table.push_back({{"check_workflow_runs",
                      "List recent CI workflow runs and flag failed ones.",
                      {{"limit", ParamType::Integer, false, json(10),
                        "Number of runs to fetch.", 1, 100},
                       {"workflow_name", ParamType::String, false, std::nullopt,
                        "Only runs of this workflow.", std::nullopt, std::nullopt},
                       {"run_id", ParamType::String, false, std::nullopt,
                        "Show a single run by its numeric id.", std::nullopt, std::nullopt},
                       {"repo", ParamType::String, false, std::nullopt,
                        "OWNER/REPO to query instead of the workspace's repository.",
                        std::nullopt, std::nullopt},
                       {"branch", ParamType::String, false, std::nullopt,
                        "Only runs on this branch.", std::nullopt, std::nullopt}}},
                     wrap(tools::check_workflow_runs)});

    table.push_back({{"validate_workflow_yaml",
                      "Validate CI workflow definitions. Checks every file under "
                      ".github/workflows when no argument is given.",
                      {{"content", ParamType::String, false, std::nullopt,
                        "Inline workflow YAML to validate.", std::nullopt, std::nullopt},
                       {"workflow_file", ParamType::String, false, std::nullopt,
                        "Workflow file, relative to the workspace or to .github/workflows.",
                        std::nullopt, std::nullopt}}},
                     wrap(tools::validate_workflow_yaml)});

    table.push_back({{"project_status",
                      "Report the workspace, the external tools found on PATH and whether a "
                      "VCS credential is configured.",
                      {}},
                     wrap(tools::project_status)});
    return table;
}

}  // namespace

core::errors::Result<bool> register_builtin_tools(ToolRegistry& registry) {
    for (auto& [spec, handler] : builtin_tools(registry)) {
        auto registered = registry.register_tool(std::move(spec), std::move(handler));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return true;
}

}  // namespace cidispatch::runtime
