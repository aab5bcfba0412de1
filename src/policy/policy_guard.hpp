#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/dispatch_errors.hpp"

namespace cidispatch::policy {

using EnvironmentList = std::vector<std::pair<std::string, std::string>>;

// Parent variables a child process may see. Everything else is dropped.
struct EnvironmentPolicy {
    std::vector<std::string> passthrough = {
        "PATH", "HOME", "LANG", "LC_ALL", "TMPDIR", "USER"};
};

class PolicyGuard {
public:
    explicit PolicyGuard(EnvironmentPolicy environment_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Rejects values a tool would parse as an option instead of a file.
    core::errors::Result<std::string> validate_file_argument(
        const std::string& argument) const;

    // Allowlisted parent variables followed by `extra` (which wins on clashes).
    EnvironmentList child_environment(const EnvironmentList& extra = {}) const;

    // Workspace-relative spelling of `path` when it lies inside the root.
    static std::string display_path(const std::filesystem::path& workspace_root,
                                    const std::filesystem::path& path);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    EnvironmentPolicy environment_policy_;
};

}  // namespace cidispatch::policy
