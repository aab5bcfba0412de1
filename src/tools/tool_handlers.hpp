#pragma once

#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "tools/tool_context.hpp"

namespace cidispatch::tools {

// Every handler receives arguments already validated against its ToolSpec,
// with defaults filled in.

protocol::ToolResult format_check(const ToolContext& context, const nlohmann::json& args);
protocol::ToolResult format_fix(const ToolContext& context, const nlohmann::json& args);

protocol::ToolResult lint(const ToolContext& context, const nlohmann::json& args);
protocol::ToolResult analyze(const ToolContext& context, const nlohmann::json& args);

protocol::ToolResult check_workflow_runs(const ToolContext& context,
                                         const nlohmann::json& args);
protocol::ToolResult validate_workflow_yaml(const ToolContext& context,
                                            const nlohmann::json& args);

protocol::ToolResult project_status(const ToolContext& context, const nlohmann::json& args);

}  // namespace cidispatch::tools
