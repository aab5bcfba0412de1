#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cidispatch::protocol {

// What one external process did.
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
    bool timed_out = false;
    bool cancelled = false;
    // Limit the process ran under; 0 when none was set.
    std::uint32_t timeout_ms = 0;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

enum class Severity {
    Error,
    Warning,
    Info,
    Note
};

// One structured issue reported by a tool.
struct Finding {
    std::optional<std::string> file;
    std::optional<int> line;
    std::optional<int> column;
    Severity severity = Severity::Warning;
    std::string message;
    std::optional<std::string> rule;
    std::vector<std::pair<std::string, std::string>> attributes;
};

// success: ran and found nothing. failure: ran and found issues.
// error: could not run.
enum class ToolStatus {
    Success,
    Failure,
    Error
};

struct ToolResult {
    std::string tool_name;
    ToolStatus status = ToolStatus::Success;
    std::string summary;
    std::vector<Finding> details;
    std::optional<ProcessResult> raw_output;
    double duration_ms = 0.0;
};

inline std::string to_string(const ToolStatus status) {
    switch (status) {
        case ToolStatus::Success:
            return "success";
        case ToolStatus::Failure:
            return "failure";
        case ToolStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

inline std::string to_string(const Severity severity) {
    switch (severity) {
        case Severity::Error:
            return "error";
        case Severity::Warning:
            return "warning";
        case Severity::Info:
            return "info";
        case Severity::Note:
            return "note";
        default:
            return "unknown";
    }
}

inline ToolResult make_error_result(const std::string& tool_name, const std::string& summary) {
    ToolResult result;
    result.tool_name = tool_name;
    result.status = ToolStatus::Error;
    result.summary = summary;
    return result;
}

}  // namespace cidispatch::protocol
