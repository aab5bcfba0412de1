#include "session/request_manager.hpp"
#include <utility>
#include "core/logging/logger.hpp"

namespace cidispatch::session {

using core::errors::DispatchError;
using core::errors::ErrorCategory;

bool RequestManager::is_terminal(const RequestState state) {
    return state == RequestState::Completed || state == RequestState::Failed ||
           state == RequestState::Cancelled;
}

std::string RequestManager::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Running:
            return "running";
        case RequestState::Completed:
            return "completed";
        case RequestState::Failed:
            return "failed";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RequestManager::start_request(
    const std::string& key, const std::string& request_id, const std::string& tool_name) {
    if (key.empty()) {
        return DispatchError{ErrorCategory::Schema, "Request id cannot be empty.",
                             "invalid_request_id"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.find(key) != requests_.end()) {
        return DispatchError{ErrorCategory::Schema,
                             "A request with id " + key + " is already in flight.",
                             "duplicate_request_id",
                             "Use a fresh id for every call."};
    }

    RequestRecord record;
    record.key = key;
    record.request_id = request_id;
    record.tool_name = tool_name;
    record.state = RequestState::Running;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = record.cancel_token;
    requests_.emplace(key, std::move(record));
    LOG_DEBUG("RequestManager: " + key + " (" + tool_name + ") running");
    return token;
}

core::errors::Result<RequestState> RequestManager::cancel_request(const std::string& key) {
    return transition_to_terminal(key, RequestState::Cancelled);
}

core::errors::Result<RequestState> RequestManager::mark_completed(const std::string& key) {
    return transition_to_terminal(key, RequestState::Completed);
}

core::errors::Result<RequestState> RequestManager::mark_failed(const std::string& key) {
    return transition_to_terminal(key, RequestState::Failed);
}

core::errors::Result<RequestState> RequestManager::transition_to_terminal(
    const std::string& key, const RequestState next_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(key);
    if (it == requests_.end()) {
        return DispatchError{ErrorCategory::Input, "Request not found: " + key,
                             "request_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return DispatchError{ErrorCategory::Input,
                             "Request is already terminal: " + to_string(it->second.state),
                             "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    if (next_state == RequestState::Cancelled) {
        it->second.cancel_token->store(true);
    }
    LOG_DEBUG("RequestManager: " + key + " transition " + prev + " -> " +
              to_string(next_state));
    return it->second.state;
}

void RequestManager::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.erase(key);
}

std::size_t RequestManager::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t cancelled = 0;
    for (auto& [key, record] : requests_) {
        if (is_terminal(record.state)) {
            continue;
        }
        record.state = RequestState::Cancelled;
        record.cancel_token->store(true);
        ++cancelled;
    }
    if (cancelled > 0) {
        LOG_WARN("RequestManager: cancelled " + std::to_string(cancelled) +
                 " in-flight request(s)");
    }
    return cancelled;
}

std::size_t RequestManager::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t running = 0;
    for (const auto& [key, record] : requests_) {
        if (!is_terminal(record.state)) {
            ++running;
        }
    }
    return running;
}

}  // namespace cidispatch::session
