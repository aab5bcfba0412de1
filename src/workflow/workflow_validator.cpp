#include "workflow/workflow_validator.hpp"

#include <utility>
#include <yaml-cpp/yaml.h>

namespace cidispatch::workflow {

using core::errors::DispatchError;
using core::errors::ErrorCategory;
using protocol::Finding;
using protocol::Severity;

namespace {

class Collector {
public:
    explicit Collector(std::string source_name) : source_name_(std::move(source_name)) {}

    void add(const YAML::Node& node, const std::string& rule, const std::string& message) {
        Finding finding;
        finding.file = source_name_;
        finding.severity = Severity::Error;
        finding.message = message;
        finding.rule = rule;
        if (node.IsDefined()) {
            const YAML::Mark mark = node.Mark();
            if (mark.line >= 0) {
                finding.line = mark.line + 1;
                finding.column = mark.column + 1;
            }
        }
        findings_.push_back(std::move(finding));
    }

    std::vector<Finding> take() { return std::move(findings_); }

private:
    std::string source_name_;
    std::vector<Finding> findings_;
};

bool names_self_hosted(const YAML::Node& runs_on) {
    if (runs_on.IsScalar()) {
        return runs_on.Scalar() == "self-hosted";
    }
    if (runs_on.IsSequence()) {
        for (const auto& label : runs_on) {
            if (label.IsScalar() && label.Scalar() == "self-hosted") {
                return true;
            }
        }
    }
    if (runs_on.IsMap()) {
        const YAML::Node labels = runs_on["labels"];
        return labels.IsDefined() && names_self_hosted(labels);
    }
    return false;
}

void check_steps(const YAML::Node& job, const std::string& job_name, Collector& out) {
    const YAML::Node steps = job["steps"];
    if (!steps.IsSequence() || steps.size() == 0) {
        out.add(steps, "steps-not-sequence",
                "Job '" + job_name + "' 'steps' must be a non-empty list.");
        return;
    }
    std::size_t index = 0;
    for (const auto& step : steps) {
        ++index;
        const std::string label = "Step " + std::to_string(index) + " of job '" + job_name + "'";
        if (!step.IsMap()) {
            out.add(step, "step-not-mapping", label + " must be a mapping.");
            continue;
        }
        const bool has_run = step["run"].IsDefined();
        const bool has_uses = step["uses"].IsDefined();
        if (!has_run && !has_uses) {
            out.add(step, "step-missing-action", label + " needs either 'run' or 'uses'.");
        } else if (has_run && has_uses) {
            out.add(step, "step-run-and-uses", label + " cannot have both 'run' and 'uses'.");
        }
    }
}

void check_job(const std::string& job_name, const YAML::Node& job, const YAML::Node& key,
               Collector& out) {
    if (!job.IsMap()) {
        out.add(key, "job-not-mapping", "Job '" + job_name + "' must be a mapping.");
        return;
    }

    // A job that calls a reusable workflow has neither runs-on nor steps.
    const bool calls_workflow = job["uses"].IsDefined();
    const YAML::Node runs_on = job["runs-on"];
    if (!runs_on.IsDefined() && !calls_workflow) {
        out.add(key, "job-missing-runs-on", "Job '" + job_name + "' is missing 'runs-on'.");
    }
    if (!job["steps"].IsDefined()) {
        if (!calls_workflow) {
            out.add(key, "job-missing-steps", "Job '" + job_name + "' is missing 'steps'.");
        }
    } else {
        check_steps(job, job_name, out);
    }

    const YAML::Node container = job["container"];
    if (container.IsMap() && !container["image"].IsDefined()) {
        out.add(container, "container-missing-image",
                "Job '" + job_name + "' container is missing 'image'.");
    }
    if (runs_on.IsDefined() && names_self_hosted(runs_on) && !container.IsDefined()) {
        out.add(runs_on, "self-hosted-without-container",
                "Job '" + job_name + "' runs on a self-hosted runner without a container.");
    }
}

}  // namespace

core::errors::Result<std::vector<Finding>> validate_workflow_document(
    const std::string& text, const std::string& source_name) {
    YAML::Node loaded;
    try {
        loaded = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        std::string message = "Invalid YAML in " + source_name;
        if (!e.mark.is_null()) {
            message += " at line " + std::to_string(e.mark.line + 1) + ", column " +
                       std::to_string(e.mark.column + 1);
        }
        return DispatchError{ErrorCategory::Input, message + ": " + e.msg, "yaml_parse_error"};
    }

    // Lookups go through a const node so missing keys are never inserted.
    const YAML::Node& root = loaded;
    Collector out(source_name);
    if (!root.IsMap()) {
        out.add(root, "root-not-mapping", "Workflow document must be a mapping.");
        return out.take();
    }

    if (!root["on"].IsDefined()) {
        out.add(root, "missing-on", "Workflow is missing the 'on' trigger.");
    }

    const YAML::Node jobs = root["jobs"];
    if (!jobs.IsDefined()) {
        out.add(root, "missing-jobs", "Workflow is missing 'jobs'.");
        return out.take();
    }
    if (!jobs.IsMap()) {
        out.add(jobs, "jobs-not-mapping", "'jobs' must be a mapping of job ids to jobs.");
        return out.take();
    }
    if (jobs.size() == 0) {
        out.add(jobs, "no-job-steps", "'jobs' is empty, so the workflow has no job steps.");
        return out.take();
    }

    for (const auto& entry : jobs) {
        const std::string job_name = entry.first.IsScalar() ? entry.first.Scalar() : "?";
        check_job(job_name, entry.second, entry.first, out);
    }
    return out.take();
}

}  // namespace cidispatch::workflow
