#include "policy/policy_guard.hpp"

#include <cstdlib>
#include <iterator>
#include <system_error>
#include <utility>

namespace cidispatch::policy {

using core::errors::DispatchError;
using core::errors::ErrorCategory;

PolicyGuard::PolicyGuard(EnvironmentPolicy environment_policy)
    : environment_policy_(std::move(environment_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            // weakly_canonical keeps a trailing separator as an empty element.
            return root_it->empty() && std::next(root_it) == root.end();
        }
    }
    return root_it == root.end() ||
           (root_it->empty() && std::next(root_it) == root.end());
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return DispatchError{ErrorCategory::Input,
                             "Workspace root does not exist or is not a directory: " +
                                 workspace_root.string(),
                             "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return DispatchError{ErrorCategory::Input,
                             "Unable to resolve workspace root: " +
                                 workspace_root.string(),
                             "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.empty()) {
        candidate = ".";
    }
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    // Symlinks are resolved here, so a link pointing outside is caught too.
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return DispatchError{ErrorCategory::Input,
                             "Unable to resolve target path: " + target_path.string(),
                             "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return DispatchError{ErrorCategory::Policy,
                             "Path escapes workspace root: " + target_path.string(),
                             "path_outside_workspace",
                             "Pass paths relative to the workspace root."};
    }

    return canonical_candidate;
}

core::errors::Result<std::string> PolicyGuard::validate_file_argument(
    const std::string& argument) const {
    if (argument.empty()) {
        return DispatchError{ErrorCategory::Input, "File argument cannot be empty.",
                             "empty_path"};
    }
    if (argument.front() == '-') {
        return DispatchError{ErrorCategory::Policy,
                             "File argument looks like a command-line option: " + argument,
                             "option_like_path",
                             "Prefix the path with ./ if the file name starts with '-'."};
    }
    if (argument.find('\0') != std::string::npos) {
        return DispatchError{ErrorCategory::Input,
                             "File argument contains a NUL byte.", "invalid_path"};
    }
    return argument;
}

EnvironmentList PolicyGuard::child_environment(const EnvironmentList& extra) const {
    EnvironmentList env;
    for (const auto& name : environment_policy_.passthrough) {
        bool overridden = false;
        for (const auto& [key, value] : extra) {
            if (key == name) {
                overridden = true;
                break;
            }
        }
        if (overridden) {
            continue;
        }
        if (const char* value = std::getenv(name.c_str())) {
            env.emplace_back(name, value);
        }
    }
    for (const auto& entry : extra) {
        env.push_back(entry);
    }
    return env;
}

std::string PolicyGuard::display_path(const std::filesystem::path& workspace_root,
                                      const std::filesystem::path& path) {
    if (path.is_relative()) {
        return path.generic_string();
    }
    std::error_code ec;
    const auto relative = std::filesystem::relative(path, workspace_root, ec);
    if (ec || relative.empty() || *relative.begin() == "..") {
        return path.generic_string();
    }
    return relative.generic_string();
}

}  // namespace cidispatch::policy
