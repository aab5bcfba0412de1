#include "runtime/pipeline_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace cidispatch::runtime {

using protocol::PipelineReport;
using protocol::PipelineStage;
using protocol::ToolResult;
using protocol::ToolStatus;

namespace {

// Arguments every stage understands; anything else stays with full_ci.
constexpr const char* kForwardedArguments[] = {"path", "files", "extensions"};

nlohmann::json stage_arguments(const nlohmann::json& args) {
    nlohmann::json forwarded = nlohmann::json::object();
    for (const char* key : kForwardedArguments) {
        if (args.contains(key)) {
            forwarded[key] = args.at(key);
        }
    }
    return forwarded;
}

std::string describe(const PipelineReport& report) {
    std::string text = "CI " + protocol::to_string(report.status) + ":";
    for (const auto& stage : report.stages) {
        text += " " + stage.tool_name + " " + protocol::to_string(stage.result.status) + ";";
    }
    for (const auto& skipped : report.skipped_stages) {
        text += " " + skipped + " skipped;";
    }
    text.pop_back();
    return text + ".";
}

}  // namespace

PipelineOrchestrator::PipelineOrchestrator(const ToolRegistry& registry)
    : registry_(registry) {}

bool PipelineOrchestrator::continue_after(const ToolStatus status) {
    return status != ToolStatus::Error;
}

ToolResult PipelineOrchestrator::run_stage(const char* stage,
                                           const tools::ToolContext& context,
                                           const nlohmann::json& stage_args) const {
    if (context.cancelled()) {
        return protocol::make_error_result(stage, "Cancelled before the stage started.");
    }
    if (context.deadline && std::chrono::steady_clock::now() >= *context.deadline) {
        return protocol::make_error_result(stage, "Pipeline timeout reached before the stage started.");
    }

    LOG_INFO(std::string("full_ci: starting ") + stage);
    auto dispatched = registry_.dispatch(protocol::ToolRequest{stage, stage_args}, context);
    if (core::errors::is_error(dispatched)) {
        const auto& err = core::errors::get_error(dispatched);
        return protocol::make_error_result(stage, "Stage rejected its arguments: " + err.message);
    }
    const auto& outcome = core::errors::get_value(dispatched);
    if (const auto* result = std::get_if<ToolResult>(&outcome)) {
        return *result;
    }
    return protocol::make_error_result(stage, "Stage returned a pipeline report.");
}

PipelineReport PipelineOrchestrator::run(const tools::ToolContext& context,
                                         const nlohmann::json& args) const {
    const auto started = std::chrono::steady_clock::now();
    PipelineReport report;

    std::chrono::steady_clock::time_point deadline =
        started + std::chrono::milliseconds(context.config.pipeline_timeout_ms);
    if (context.deadline) {
        deadline = std::min(deadline, *context.deadline);
    }
    const tools::ToolContext stage_context{context.config,       context.runner,
                                           context.gate,         context.cancel_token,
                                           deadline,             context.request_id};

    auto gate = context.gate.acquire(context.config.workspace_root, context.cancel_token);
    if (!gate) {
        report.status = ToolStatus::Error;
        report.skipped_stages.assign(kCiStages.begin(), kCiStages.end());
        report.summary = "Cancelled while waiting for the workspace.";
        return report;
    }

    const auto forwarded = stage_arguments(args);
    bool proceed = true;
    for (const char* stage : kCiStages) {
        if (!proceed) {
            report.skipped_stages.emplace_back(stage);
            continue;
        }
        ToolResult result = run_stage(stage, stage_context, forwarded);
        report.status = protocol::combine(report.status, result.status);
        proceed = continue_after(result.status);
        report.stages.push_back(PipelineStage{stage, std::move(result)});
    }

    report.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    report.summary = describe(report);
    LOG_INFO("full_ci: " + report.summary);
    return report;
}

}  // namespace cidispatch::runtime
