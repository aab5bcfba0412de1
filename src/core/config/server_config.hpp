#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/dispatch_errors.hpp"
#include "core/logging/logger.hpp"

namespace cidispatch::core::config {

inline constexpr int kConfigVersion = 1;

// An external program plus the arguments that always precede the file list.
struct ExternalCommand {
    std::string executable;
    std::vector<std::string> arguments;
};

struct ServerConfig {
    std::filesystem::path workspace_root = std::filesystem::current_path();

    ExternalCommand formatter{"clang-format", {}};
    std::vector<std::string> format_check_arguments = {"--dry-run", "--Werror"};
    std::vector<std::string> format_fix_arguments = {"-i"};

    ExternalCommand linter{"clang-tidy", {"--quiet"}};
    // Relative to the workspace root. Passed as -p when it holds
    // compile_commands.json.
    std::filesystem::path compile_commands_dir = "build";

    ExternalCommand analyzer{
        "cppcheck",
        {"--quiet", "--enable=warning,style,performance,portability",
         "--inline-suppr",
         "--template={file}:{line}:{column}: {severity}: {message} [{id}]"}};

    ExternalCommand vcs{"gh", {}};

    std::vector<std::string> source_extensions = {
        ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx"};
    std::vector<std::string> excluded_directories = {".git", "build"};

    std::uint32_t tool_timeout_ms = 300000;
    std::uint32_t pipeline_timeout_ms = 600000;
    std::size_t max_output_bytes = 1024 * 1024;
    std::size_t max_files_per_invocation = 200;
    std::size_t max_concurrent_requests = 4;

    // Token for the VCS CLI. Never logged or echoed back.
    std::optional<std::string> vcs_token;

    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Overlays the keys present in a JSON config file onto `base`.
errors::Result<ServerConfig> load_config_file(const std::filesystem::path& path,
                                              ServerConfig base);

// Applies GH_TOKEN / GITHUB_TOKEN and CIDISPATCH_LOG_LEVEL.
errors::Result<ServerConfig> apply_environment(ServerConfig config);

// Checks the workspace root and numeric limits and canonicalizes the root.
errors::Result<ServerConfig> finalize(ServerConfig config);

}  // namespace cidispatch::core::config
