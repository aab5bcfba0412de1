#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "core/config/server_config.hpp"
#include "session/workspace_gate.hpp"
#include "tools/process_runner.hpp"

namespace cidispatch::tools {

// Everything a handler may touch for one call. Built per request; nothing in
// it is shared with other requests except the read-only config.
struct ToolContext {
    const core::config::ServerConfig& config;
    CommandRunner& runner;
    session::WorkspaceGate& gate;
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::string request_id;

    bool cancelled() const { return cancel_token && cancel_token->load(); }

    // Per-process timeout: the tool timeout, shortened to what is left of
    // the deadline. Never zero, since zero would mean "no timeout".
    std::uint32_t timeout_ms() const {
        std::uint32_t timeout = config.tool_timeout_ms;
        if (deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       *deadline - std::chrono::steady_clock::now())
                                       .count();
            const auto clamped = std::max<std::int64_t>(1, remaining);
            timeout = static_cast<std::uint32_t>(
                std::min<std::int64_t>(timeout, clamped));
        }
        return timeout;
    }
};

}  // namespace cidispatch::tools
