#include "session/workspace_gate.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace cidispatch::session {

std::mutex& WorkspaceGate::lock_for(const std::filesystem::path& workspace_root) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks_[workspace_root.lexically_normal().string()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::optional<std::unique_lock<std::mutex>> WorkspaceGate::acquire(
    const std::filesystem::path& workspace_root,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    std::mutex& root_mutex = lock_for(workspace_root);
    std::unique_lock<std::mutex> lock(root_mutex, std::try_to_lock);
    if (lock.owns_lock()) {
        return std::make_optional(std::move(lock));
    }

    LOG_INFO("Waiting for another operation on " + workspace_root.string());
    while (!lock.try_lock()) {
        if (cancel_token && cancel_token->load()) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return std::make_optional(std::move(lock));
}

}  // namespace cidispatch::session
