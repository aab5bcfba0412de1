#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/dispatch_errors.hpp"

namespace cidispatch::workflow {

// Fields requested from `gh run list/view --json`.
inline constexpr const char* kRunJsonFields =
    "databaseId,workflowName,headBranch,status,conclusion,createdAt,url";

struct WorkflowRun {
    std::int64_t id = 0;
    std::string workflow;
    std::string branch;
    std::string status;
    std::string conclusion;  // empty while the run is still going
    std::string created_at;
    std::string url;
};

// Accepts the array printed by `gh run list` or the single object printed
// by `gh run view`.
core::errors::Result<std::vector<WorkflowRun>> parse_workflow_runs(const std::string& json_text);

// failure, timed_out and startup_failure count as failed; cancelled and
// skipped do not.
bool is_failed_conclusion(const std::string& conclusion);

}  // namespace cidispatch::workflow
