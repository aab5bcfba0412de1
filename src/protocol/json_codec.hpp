#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/dispatch_errors.hpp"
#include "protocol/pipeline_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_spec.hpp"

namespace cidispatch::protocol {

nlohmann::json finding_to_json(const Finding& finding);
nlohmann::json process_result_to_json(const ProcessResult& process);
nlohmann::json tool_result_to_json(const ToolResult& result);
nlohmann::json pipeline_report_to_json(const PipelineReport& report);
nlohmann::json outcome_to_json(const ToolOutcome& outcome);

// JSON Schema for a tool's arguments, as advertised by tools/list.
nlohmann::json input_schema_to_json(const ToolSpec& spec);

nlohmann::json error_to_json(const core::errors::DispatchError& error);

// Plain-text rendering for clients that only show text content.
std::string render_text(const ToolOutcome& outcome);

}  // namespace cidispatch::protocol
