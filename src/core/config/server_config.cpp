#include "core/config/server_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace cidispatch::core::config {

using errors::DispatchError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

DispatchError config_error(const std::string& message,
                           const std::string& code = "invalid_config") {
    return DispatchError{ErrorCategory::Input, message, code,
                         "Compare with config.example.json for the accepted keys."};
}

std::optional<DispatchError> read_string_list(const json& node, const std::string& key,
                                              std::vector<std::string>& out) {
    if (!node.is_array()) {
        return config_error("'" + key + "' must be an array of strings.");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.is_string()) {
            return config_error("'" + key + "' must be an array of strings.");
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

std::optional<DispatchError> read_command(const json& node, const std::string& key,
                                          ExternalCommand& out) {
    if (!node.is_object()) {
        return config_error("'" + key + "' must be an object with 'executable' and 'arguments'.");
    }
    ExternalCommand command = out;
    for (const auto& [field, value] : node.items()) {
        if (field == "executable") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                return config_error("'" + key + ".executable' must be a non-empty string.");
            }
            command.executable = value.get<std::string>();
        } else if (field == "arguments") {
            if (auto err = read_string_list(value, key + ".arguments", command.arguments)) {
                return err;
            }
        } else {
            return config_error("Unknown key '" + key + "." + field + "'.", "unknown_config_key");
        }
    }
    out = std::move(command);
    return std::nullopt;
}

template <typename T>
std::optional<DispatchError> read_positive(const json& node, const std::string& key, T& out) {
    if (!node.is_number_unsigned() || node.get<std::uint64_t>() == 0) {
        return config_error("'" + key + "' must be a positive integer.");
    }
    if constexpr (sizeof(T) < sizeof(std::uint64_t)) {
        if (node.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return config_error("'" + key + "' must not exceed " +
                                std::to_string(std::numeric_limits<T>::max()) + ".");
        }
    }
    out = static_cast<T>(node.get<std::uint64_t>());
    return std::nullopt;
}

}  // namespace

errors::Result<ServerConfig> load_config_file(const std::filesystem::path& path,
                                              ServerConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open config file: " + path.string(),
                            "config_open_failed");
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Config file is not valid JSON: " + path.string(),
                            "config_parse_failed");
    }
    if (!document.is_object()) {
        return config_error("Config file must contain a JSON object.");
    }

    const auto version = document.find("version");
    if (version == document.end() || !version->is_number_integer() ||
        version->get<int>() != kConfigVersion) {
        return config_error("Config file must declare \"version\": " +
                                std::to_string(kConfigVersion) + ".",
                            "unsupported_config_version");
    }

    for (const auto& [key, value] : document.items()) {
        std::optional<DispatchError> err;
        if (key == "version") {
            continue;
        } else if (key == "formatter") {
            err = read_command(value, key, base.formatter);
        } else if (key == "format_check_arguments") {
            err = read_string_list(value, key, base.format_check_arguments);
        } else if (key == "format_fix_arguments") {
            err = read_string_list(value, key, base.format_fix_arguments);
        } else if (key == "linter") {
            err = read_command(value, key, base.linter);
        } else if (key == "compile_commands_dir") {
            if (!value.is_string()) {
                err = config_error("'compile_commands_dir' must be a string.");
            } else {
                base.compile_commands_dir = value.get<std::string>();
            }
        } else if (key == "analyzer") {
            err = read_command(value, key, base.analyzer);
        } else if (key == "vcs") {
            err = read_command(value, key, base.vcs);
        } else if (key == "source_extensions") {
            err = read_string_list(value, key, base.source_extensions);
        } else if (key == "excluded_directories") {
            err = read_string_list(value, key, base.excluded_directories);
        } else if (key == "tool_timeout_ms") {
            err = read_positive(value, key, base.tool_timeout_ms);
        } else if (key == "pipeline_timeout_ms") {
            err = read_positive(value, key, base.pipeline_timeout_ms);
        } else if (key == "max_output_bytes") {
            err = read_positive(value, key, base.max_output_bytes);
        } else if (key == "max_files_per_invocation") {
            err = read_positive(value, key, base.max_files_per_invocation);
        } else if (key == "max_concurrent_requests") {
            err = read_positive(value, key, base.max_concurrent_requests);
        } else if (key == "log_level") {
            const auto level = value.is_string()
                                   ? logging::parse_log_level(value.get<std::string>())
                                   : std::nullopt;
            if (!level) {
                err = config_error("'log_level' must be one of debug, info, warn, error.");
            } else {
                base.log_level = *level;
            }
        } else {
            err = config_error("Unknown config key '" + key + "'.", "unknown_config_key");
        }

        if (err) {
            return *err;
        }
    }

    return base;
}

errors::Result<ServerConfig> apply_environment(ServerConfig config) {
    for (const char* name : {"GH_TOKEN", "GITHUB_TOKEN"}) {
        const char* value = std::getenv(name);
        if (value != nullptr && value[0] != '\0') {
            config.vcs_token = std::string(value);
            break;
        }
    }

    if (const char* level_text = std::getenv("CIDISPATCH_LOG_LEVEL")) {
        const auto level = logging::parse_log_level(level_text);
        if (!level) {
            return config_error(std::string("CIDISPATCH_LOG_LEVEL has an unknown value: ") +
                                    level_text,
                                "invalid_log_level");
        }
        config.log_level = *level;
    }

    return config;
}

errors::Result<ServerConfig> finalize(ServerConfig config) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config.workspace_root, ec) || ec) {
        return DispatchError{ErrorCategory::Input,
                             "Workspace root does not exist or is not a directory: " +
                                 config.workspace_root.string(),
                             "invalid_workspace_root"};
    }

    auto canonical = std::filesystem::canonical(config.workspace_root, ec);
    if (ec) {
        return DispatchError{ErrorCategory::Input,
                             "Failed to canonicalize workspace root: " +
                                 config.workspace_root.string(),
                             "invalid_workspace_root"};
    }
    config.workspace_root = std::move(canonical);

    if (config.source_extensions.empty()) {
        return config_error("At least one source extension is required.");
    }
    if (config.pipeline_timeout_ms < config.tool_timeout_ms) {
        config.pipeline_timeout_ms = config.tool_timeout_ms;
    }
    return config;
}

}  // namespace cidispatch::core::config
