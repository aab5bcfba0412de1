#include "workflow/workflow_runs.hpp"

#include <nlohmann/json.hpp>

namespace cidispatch::workflow {

using core::errors::DispatchError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

WorkflowRun run_from_json(const json& object) {
    WorkflowRun run;
    const auto id = object.find("databaseId");
    if (id != object.end() && id->is_number_integer()) {
        run.id = id->get<std::int64_t>();
    }
    run.workflow = string_field(object, "workflowName");
    run.branch = string_field(object, "headBranch");
    run.status = string_field(object, "status");
    run.conclusion = string_field(object, "conclusion");
    run.created_at = string_field(object, "createdAt");
    run.url = string_field(object, "url");
    return run;
}

}  // namespace

core::errors::Result<std::vector<WorkflowRun>> parse_workflow_runs(const std::string& json_text) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return DispatchError{ErrorCategory::Execution,
                             "Workflow run listing is not valid JSON.", "invalid_vcs_output"};
    }

    std::vector<WorkflowRun> runs;
    if (document.is_object()) {
        runs.push_back(run_from_json(document));
        return runs;
    }
    if (!document.is_array()) {
        return DispatchError{ErrorCategory::Execution,
                             "Workflow run listing must be a JSON array or object.",
                             "invalid_vcs_output"};
    }
    for (const auto& item : document) {
        if (!item.is_object()) {
            return DispatchError{ErrorCategory::Execution,
                                 "Workflow run entry is not a JSON object.",
                                 "invalid_vcs_output"};
        }
        runs.push_back(run_from_json(item));
    }
    return runs;
}

bool is_failed_conclusion(const std::string& conclusion) {
    return conclusion == "failure" || conclusion == "timed_out" ||
           conclusion == "startup_failure";
}

}  // namespace cidispatch::workflow
