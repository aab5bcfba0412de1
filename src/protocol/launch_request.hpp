#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace cidispatch::protocol {

    enum class LaunchMode {
        Serve,  // MCP server on stdio
        Call,   // run one tool and exit
        List    // print the tool catalogue and exit
    };

    // Validated command line. Unset options fall back to the config file,
    // then the environment, then the built-in defaults.
    struct LaunchRequest {
        LaunchMode mode = LaunchMode::Serve;
        std::string tool_name;
        nlohmann::json arguments = nlohmann::json::object();
        std::optional<std::filesystem::path> workspace;
        std::optional<std::filesystem::path> config_file;
        std::optional<core::logging::LogLevel> log_level;
        std::optional<std::size_t> max_concurrency;
    };

} // namespace cidispatch::protocol
