#include "tools/file_set.hpp"

#include <algorithm>
#include <system_error>
#include "policy/policy_guard.hpp"

namespace cidispatch::tools {

using core::errors::DispatchError;
using core::errors::ErrorCategory;

namespace {

std::string normalize_extension(std::string extension) {
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

bool has_extension(const std::filesystem::path& path,
                   const std::vector<std::string>& extensions) {
    const std::string extension = path.extension().string();
    for (const auto& wanted : extensions) {
        if (extension == normalize_extension(wanted)) {
            return true;
        }
    }
    return false;
}

bool is_excluded(const std::filesystem::path& directory,
                 const std::vector<std::string>& excluded) {
    const std::string name = directory.filename().string();
    return std::find(excluded.begin(), excluded.end(), name) != excluded.end();
}

std::string command_line_safe(const std::string& relative) {
    if (!relative.empty() && relative.front() == '-') {
        return "./" + relative;
    }
    return relative;
}

}  // namespace

core::errors::Result<FileSet> resolve_file_set(const std::filesystem::path& workspace_root,
                                               const FileSetRequest& request) {
    const policy::PolicyGuard policy_guard;
    std::vector<std::string> collected;
    std::error_code ec;

    if (!request.files.empty()) {
        for (const auto& file : request.files) {
            auto argument = policy_guard.validate_file_argument(file);
            if (core::errors::is_error(argument)) {
                return core::errors::get_error(argument);
            }
            auto resolved = policy_guard.validate_path_in_workspace(workspace_root, file);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }
            const auto& path = core::errors::get_value(resolved);
            if (!std::filesystem::is_regular_file(path, ec) || ec) {
                return DispatchError{ErrorCategory::Input, "File does not exist: " + file,
                                     "file_not_found"};
            }
            collected.push_back(
                command_line_safe(policy::PolicyGuard::display_path(workspace_root, path)));
        }
    } else {
        if (request.extensions.empty()) {
            return DispatchError{ErrorCategory::Input,
                                 "At least one file extension is required for a scan.",
                                 "empty_extension_filter"};
        }

        auto resolved = policy_guard.validate_path_in_workspace(workspace_root, request.scope);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        const auto& scope_path = core::errors::get_value(resolved);

        if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
            collected.push_back(command_line_safe(
                policy::PolicyGuard::display_path(workspace_root, scope_path)));
        } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
            const auto options = std::filesystem::directory_options::skip_permission_denied;
            std::filesystem::recursive_directory_iterator it(scope_path, options, ec);
            if (ec) {
                return DispatchError{ErrorCategory::Input,
                                     "Unable to scan directory: " + request.scope.string(),
                                     "scan_failed"};
            }
            for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    break;
                }
                const auto& entry = *it;
                if (entry.is_symlink(ec)) {
                    continue;
                }
                if (entry.is_directory(ec)) {
                    if (is_excluded(entry.path(), request.excluded_directories)) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (!entry.is_regular_file(ec) || ec) {
                    continue;
                }
                if (!has_extension(entry.path(), request.extensions)) {
                    continue;
                }
                collected.push_back(command_line_safe(
                    policy::PolicyGuard::display_path(workspace_root, entry.path())));
            }
            if (ec) {
                return DispatchError{ErrorCategory::Input,
                                     "Directory scan failed under " + request.scope.string() +
                                         ": " + ec.message(),
                                     "scan_failed"};
            }
        } else {
            return DispatchError{ErrorCategory::Input,
                                 "Path does not exist: " + request.scope.string(),
                                 "path_not_found"};
        }
    }

    std::sort(collected.begin(), collected.end());
    collected.erase(std::unique(collected.begin(), collected.end()), collected.end());

    FileSet file_set;
    file_set.files = std::move(collected);
    return file_set;
}

std::vector<std::vector<std::string>> make_batches(const std::vector<std::string>& files,
                                                   const std::size_t batch_size) {
    std::vector<std::vector<std::string>> batches;
    const std::size_t step = batch_size == 0 ? files.size() : batch_size;
    for (std::size_t i = 0; i < files.size(); i += step) {
        const std::size_t end = std::min(files.size(), i + step);
        batches.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(i),
                             files.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

}  // namespace cidispatch::tools
