#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include "protocol/pipeline_contract.hpp"
#include "runtime/tool_registry.hpp"
#include "tools/tool_context.hpp"

namespace cidispatch::runtime {

// full_ci runs these in order. Each one is a registered tool.
inline constexpr std::array<const char*, 3> kCiStages = {"format_check", "lint", "analyze"};

class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(const ToolRegistry& registry);

    // Runs every stage in kCiStages order under the workspace gate, bounded
    // by the pipeline timeout. Never throws.
    protocol::PipelineReport run(const tools::ToolContext& context,
                                 const nlohmann::json& args) const;

    // The only abort policy: a stage that could not run stops the pipeline,
    // a stage that found issues does not.
    static bool continue_after(protocol::ToolStatus status);

private:
    protocol::ToolResult run_stage(const char* stage, const tools::ToolContext& context,
                                   const nlohmann::json& stage_args) const;

    const ToolRegistry& registry_;
};

}  // namespace cidispatch::runtime
