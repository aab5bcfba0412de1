#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/errors/dispatch_errors.hpp"

namespace cidispatch::session {

enum class RequestState {
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RequestRecord {
    std::string key;         // JSON-RPC id as sent by the client
    std::string request_id;  // log correlation tag
    std::string tool_name;
    RequestState state = RequestState::Running;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Book-keeping for in-flight tool calls, so cancellation and disconnects can
// reach the subprocesses they spawned.
class RequestManager {
public:
    core::errors::Result<std::shared_ptr<std::atomic_bool>> start_request(
        const std::string& key, const std::string& request_id,
        const std::string& tool_name);
    core::errors::Result<RequestState> cancel_request(const std::string& key);

    core::errors::Result<RequestState> mark_completed(const std::string& key);
    core::errors::Result<RequestState> mark_failed(const std::string& key);

    // Drops the record once its response has been written.
    void release(const std::string& key);

    // Sets every in-flight token; returns how many requests were running.
    std::size_t cancel_all();

    std::size_t in_flight_count() const;

private:
    core::errors::Result<RequestState> transition_to_terminal(const std::string& key,
                                                              RequestState next_state);
    static bool is_terminal(RequestState state);
    static std::string to_string(RequestState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
};

}  // namespace cidispatch::session
