#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/dispatch_errors.hpp"

namespace cidispatch::tools {

struct FileSetRequest {
    // Scan root, relative to the workspace. Ignored when `files` is non-empty.
    std::filesystem::path scope = ".";
    std::vector<std::string> files;
    std::vector<std::string> extensions;
    std::vector<std::string> excluded_directories;
};

// Sorted, de-duplicated, workspace-relative paths that are safe to put on a
// command line (never start with '-').
struct FileSet {
    std::vector<std::string> files;

    bool empty() const { return files.empty(); }
    std::size_t size() const { return files.size(); }
};

core::errors::Result<FileSet> resolve_file_set(const std::filesystem::path& workspace_root,
                                               const FileSetRequest& request);

// Splits `files` into consecutive chunks of at most `batch_size` entries.
std::vector<std::vector<std::string>> make_batches(const std::vector<std::string>& files,
                                                   std::size_t batch_size);

}  // namespace cidispatch::tools
