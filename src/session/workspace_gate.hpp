#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace cidispatch::session {

// Serializes operations that rewrite or sweep a whole workspace
// (full_ci, format_fix) per workspace root.
class WorkspaceGate {
public:
    // Blocks until the root is free. Returns nullopt if the token is set
    // while waiting.
    std::optional<std::unique_lock<std::mutex>> acquire(
        const std::filesystem::path& workspace_root,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr);

private:
    std::mutex& lock_for(const std::filesystem::path& workspace_root);

    std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace cidispatch::session
