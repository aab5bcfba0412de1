#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/dispatch_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace cidispatch::tools {

struct ProcessRequest {
    std::string executable;
    std::vector<std::string> arguments;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;
    std::optional<std::string> stdin_text;
    // Complete child environment; see PolicyGuard::child_environment.
    policy::EnvironmentList environment;
    std::size_t max_output_bytes = 1024 * 1024;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Seam between handlers and real processes, so handlers can be tested
// against canned output.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Errors only when the process cannot be started. A non-zero exit,
    // a timeout or a cancellation are reported inside the ProcessResult.
    virtual core::errors::Result<protocol::ProcessResult> run(
        const ProcessRequest& request) = 0;
};

class ProcessRunner final : public CommandRunner {
public:
    core::errors::Result<protocol::ProcessResult> run(
        const ProcessRequest& request) override;

    // Looks `executable` up on the PATH found in `environment`.
    static core::errors::Result<std::filesystem::path> resolve_executable(
        const std::string& executable, const policy::EnvironmentList& environment);
};

}  // namespace cidispatch::tools
