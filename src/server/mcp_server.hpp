#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "runtime/tool_registry.hpp"
#include "session/request_manager.hpp"
#include "session/workspace_gate.hpp"
#include "tools/process_runner.hpp"

namespace cidispatch::server {

inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "cidispatch";
inline constexpr const char* kServerVersion = "0.1.0";

// MCP over newline-delimited JSON-RPC 2.0. tools/call requests run on up to
// max_concurrent_requests worker threads; everything else is answered on the
// reader thread.
//
// `shutdown_flag`, when given, is polled while serving; once it is set the
// server behaves as if the input had closed.
class McpServer {
public:
    McpServer(const runtime::ToolRegistry& registry, const core::config::ServerConfig& config,
              tools::CommandRunner& runner, std::istream& in, std::ostream& out,
              std::shared_ptr<std::atomic_bool> shutdown_flag = nullptr);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Answers one message on the calling thread. nullopt for notifications.
    std::optional<nlohmann::json> handle_message(const nlohmann::json& message);

    // Reads on its own thread until EOF, a read interrupted by a signal, or
    // the shutdown flag. At that point every in-flight call is cancelled,
    // calls still queued are answered without running anything, and serve()
    // returns once the workers are done.
    void serve();

    std::size_t in_flight_count() const { return requests_.in_flight_count(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    nlohmann::json handle_initialize(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json handle_tools_list(const nlohmann::json& id) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);
    void handle_cancelled(const nlohmann::json& params);

    void read_input();
    void close_input(const std::string& reason);
    bool shutdown_requested() const;

    void dispatch_async(nlohmann::json message);
    void reap_finished_workers();
    void join_workers();
    void write(const nlohmann::json& message);

    const runtime::ToolRegistry& registry_;
    const core::config::ServerConfig& config_;
    tools::CommandRunner& runner_;
    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<std::atomic_bool> shutdown_flag_;

    session::RequestManager requests_;
    session::WorkspaceGate gate_;

    std::mutex queue_mutex_;
    std::condition_variable queue_changed_;
    std::deque<nlohmann::json> pending_calls_;
    bool input_closed_ = false;
    std::atomic_bool closing_{false};

    std::mutex write_mutex_;
    std::mutex workers_mutex_;
    std::condition_variable slot_available_;
    std::size_t active_workers_ = 0;
    std::vector<Worker> workers_;
};

}  // namespace cidispatch::server
