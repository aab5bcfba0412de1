#include "protocol/json_codec.hpp"

#include <sstream>

namespace cidispatch::protocol {

using nlohmann::json;

namespace {

void render_finding(std::ostringstream& out, const Finding& finding) {
    out << "  ";
    if (finding.file) {
        out << *finding.file;
        if (finding.line) {
            out << ":" << *finding.line;
            if (finding.column) {
                out << ":" << *finding.column;
            }
        }
        out << ": ";
    }
    out << to_string(finding.severity) << ": " << finding.message;
    if (finding.rule) {
        out << " [" << *finding.rule << "]";
    }
    out << "\n";
}

void render_result(std::ostringstream& out, const ToolResult& result) {
    out << result.tool_name << ": " << to_string(result.status) << " - "
        << result.summary << "\n";
    for (const auto& finding : result.details) {
        render_finding(out, finding);
    }
}

}  // namespace

json finding_to_json(const Finding& finding) {
    json payload;
    payload["file"] = finding.file ? json(*finding.file) : json(nullptr);
    payload["line"] = finding.line ? json(*finding.line) : json(nullptr);
    payload["column"] = finding.column ? json(*finding.column) : json(nullptr);
    payload["severity"] = to_string(finding.severity);
    payload["message"] = finding.message;
    payload["rule"] = finding.rule ? json(*finding.rule) : json(nullptr);
    if (!finding.attributes.empty()) {
        json attributes = json::object();
        for (const auto& [key, value] : finding.attributes) {
            attributes[key] = value;
        }
        payload["attributes"] = attributes;
    }
    return payload;
}

json process_result_to_json(const ProcessResult& process) {
    json payload;
    payload["exit_code"] = process.exit_code;
    payload["stdout"] = process.stdout_text;
    payload["stderr"] = process.stderr_text;
    payload["duration_ms"] = process.duration_ms;
    payload["timed_out"] = process.timed_out;
    payload["cancelled"] = process.cancelled;
    payload["truncated"] = process.stdout_truncated || process.stderr_truncated;
    return payload;
}

json tool_result_to_json(const ToolResult& result) {
    json details = json::array();
    for (const auto& finding : result.details) {
        details.push_back(finding_to_json(finding));
    }

    json payload;
    payload["tool"] = result.tool_name;
    payload["status"] = to_string(result.status);
    payload["summary"] = result.summary;
    payload["details"] = details;
    payload["raw_output"] =
        result.raw_output ? process_result_to_json(*result.raw_output) : json(nullptr);
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

json pipeline_report_to_json(const PipelineReport& report) {
    json stages = json::array();
    for (const auto& stage : report.stages) {
        stages.push_back(tool_result_to_json(stage.result));
    }

    json payload;
    payload["tool"] = report.tool_name;
    payload["status"] = to_string(report.status);
    payload["summary"] = report.summary;
    payload["stages"] = stages;
    payload["skipped_stages"] = report.skipped_stages;
    payload["duration_ms"] = report.duration_ms;
    return payload;
}

json outcome_to_json(const ToolOutcome& outcome) {
    if (const auto* report = std::get_if<PipelineReport>(&outcome)) {
        return pipeline_report_to_json(*report);
    }
    return tool_result_to_json(std::get<ToolResult>(outcome));
}

json input_schema_to_json(const ToolSpec& spec) {
    json properties = json::object();
    json required = json::array();
    for (const auto& param : spec.parameters) {
        json property;
        property["type"] = to_string(param.type);
        if (param.type == ParamType::StringArray) {
            property["items"] = json{{"type", "string"}};
        }
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        if (param.default_value) {
            property["default"] = *param.default_value;
        }
        if (param.minimum) {
            property["minimum"] = *param.minimum;
        }
        if (param.maximum) {
            property["maximum"] = *param.maximum;
        }
        properties[param.name] = property;
        if (param.required) {
            required.push_back(param.name);
        }
    }

    json schema;
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = required;
    schema["additionalProperties"] = false;
    return schema;
}

json error_to_json(const core::errors::DispatchError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

std::string render_text(const ToolOutcome& outcome) {
    std::ostringstream out;
    if (const auto* report = std::get_if<PipelineReport>(&outcome)) {
        out << report->tool_name << ": " << to_string(report->status) << " - "
            << report->summary << "\n";
        for (const auto& stage : report->stages) {
            render_result(out, stage.result);
        }
        for (const auto& skipped : report->skipped_stages) {
            out << skipped << ": skipped\n";
        }
        return out.str();
    }
    render_result(out, std::get<ToolResult>(outcome));
    return out.str();
}

}  // namespace cidispatch::protocol
