#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/dispatch_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/file_set.hpp"
#include "tools/tool_context.hpp"

namespace cidispatch::tools {

// path / files / extensions arguments shared by the file-set tools.
FileSetRequest file_set_request_from_args(const ToolContext& context,
                                          const nlohmann::json& args);

ProcessRequest make_process_request(const ToolContext& context,
                                    const core::config::ExternalCommand& command,
                                    std::vector<std::string> arguments,
                                    const policy::EnvironmentList& extra_environment = {});

// Runs `command mode_arguments batch...` once per batch of files and folds
// the results into one. Stops after a batch that timed out or was cancelled.
core::errors::Result<protocol::ProcessResult> run_over_files(
    const ToolContext& context, const core::config::ExternalCommand& command,
    const std::vector<std::string>& mode_arguments, const std::vector<std::string>& files);

// Status text for a process that did not finish on its own, empty otherwise.
std::string describe_interrupted(const std::string& executable,
                                 const protocol::ProcessResult& process,
                                 std::uint32_t timeout_ms);

double elapsed_ms(std::chrono::steady_clock::time_point started);

std::string plural(std::size_t count, const std::string& noun);

}  // namespace cidispatch::tools
