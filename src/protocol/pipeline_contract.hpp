#pragma once

#include <string>
#include <variant>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace cidispatch::protocol {

struct PipelineStage {
    std::string tool_name;
    ToolResult result;
};

struct PipelineReport {
    std::string tool_name = "full_ci";
    ToolStatus status = ToolStatus::Success;
    std::vector<PipelineStage> stages;
    std::vector<std::string> skipped_stages;
    std::string summary;
    double duration_ms = 0.0;
};

// What a handler hands back: a single result, or a report for composite tools.
using ToolOutcome = std::variant<ToolResult, PipelineReport>;

// error beats failure beats success.
inline ToolStatus combine(const ToolStatus lhs, const ToolStatus rhs) {
    if (lhs == ToolStatus::Error || rhs == ToolStatus::Error) {
        return ToolStatus::Error;
    }
    if (lhs == ToolStatus::Failure || rhs == ToolStatus::Failure) {
        return ToolStatus::Failure;
    }
    return ToolStatus::Success;
}

inline ToolStatus status_of(const ToolOutcome& outcome) {
    if (const auto* report = std::get_if<PipelineReport>(&outcome)) {
        return report->status;
    }
    return std::get<ToolResult>(outcome).status;
}

inline const std::string& summary_of(const ToolOutcome& outcome) {
    if (const auto* report = std::get_if<PipelineReport>(&outcome)) {
        return report->summary;
    }
    return std::get<ToolResult>(outcome).summary;
}

}  // namespace cidispatch::protocol
