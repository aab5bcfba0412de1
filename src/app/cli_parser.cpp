#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace cidispatch::app::cli {

    using namespace cidispatch::core::errors;
    using cidispatch::protocol::LaunchMode;
    using cidispatch::protocol::LaunchRequest;

    namespace {
        constexpr std::size_t kMaxConcurrency = 64;

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> workspace;
            std::optional<std::string> config;
            std::optional<std::string> log_level;
            std::optional<std::string> max_concurrency;
            std::optional<std::string> args;
        };
    }

    std::string usage() {
        return "Usage: cidispatch [serve|list] [--workspace DIR] [--config FILE] "
               "[--log-level debug|info|warn|error] [--max-concurrency N]\n"
               "       cidispatch call <tool> [--args '<json object>'] [options]";
    }

    Result<LaunchRequest> parse_and_validate(int argc, char* argv[]) {
        LaunchRequest req;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // No command means serve, which is how MCP clients launch the server.
        size_t next = 0;
        if (!args.empty() && args[0].rfind("--", 0) != 0) {
            const std::string& command = args[0];
            if (command == "serve") {
                req.mode = LaunchMode::Serve;
            } else if (command == "list") {
                req.mode = LaunchMode::List;
            } else if (command == "call") {
                req.mode = LaunchMode::Call;
                if (args.size() < 2 || args[1].rfind("--", 0) == 0) {
                    return DispatchError{ErrorCategory::Input, "Missing tool name for 'call'.", "missing_tool_name", usage()};
                }
                req.tool_name = args[1];
                ++next;
            } else {
                return DispatchError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
            }
            ++next;
        }

        // 2. Parser Phase: Just read the raw strings
        RawCliOptions raw;
        for (size_t i = next; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (args[i] == "--workspace") slot = &raw.workspace;
            else if (args[i] == "--config") slot = &raw.config;
            else if (args[i] == "--log-level") slot = &raw.log_level;
            else if (args[i] == "--max-concurrency") slot = &raw.max_concurrency;
            else if (args[i] == "--args") slot = &raw.args;
            else if (args[i] == "--help" || args[i] == "-h") {
                return DispatchError{ErrorCategory::Input, "Help requested.", "help_requested", usage()};
            } else {
                return DispatchError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }

            if (i + 1 >= args.size()) {
                return DispatchError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *slot = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (raw.args) {
            if (req.mode != LaunchMode::Call) {
                return DispatchError{ErrorCategory::Input, "--args is only valid with 'call'.", "conflicting_flags"};
            }
            auto parsed = nlohmann::json::parse(*raw.args, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return DispatchError{ErrorCategory::Input, "--args must be a JSON object.", "invalid_args_json", "Example: --args '{\"path\": \"src\"}'"};
            }
            req.arguments = std::move(parsed);
        }

        if (raw.log_level) {
            req.log_level = cidispatch::core::logging::parse_log_level(*raw.log_level);
            if (!req.log_level) {
                return DispatchError{ErrorCategory::Input, "Invalid value for --log-level: " + *raw.log_level, "invalid_log_level", "Use debug, info, warn or error."};
            }
        }

        // Exception-free integer parsing
        if (raw.max_concurrency) {
            size_t workers = 0;
            const char* begin = raw.max_concurrency->data();
            const char* end = raw.max_concurrency->data() + raw.max_concurrency->size();
            auto [ptr, ec] = std::from_chars(begin, end, workers);
            if (ec != std::errc() || ptr != end) {
                return DispatchError{ErrorCategory::Input, "Invalid number for --max-concurrency", "invalid_integer", "Provide a positive integer."};
            }
            if (workers == 0 || workers > kMaxConcurrency) {
                return DispatchError{ErrorCategory::Input, "--max-concurrency out of bounds", "bounds_error", "Must be between 1 and 64."};
            }
            req.max_concurrency = workers;
        }

        if (raw.config) {
            req.config_file = std::filesystem::path(raw.config.value());
        }

        // Path validation
        if (raw.workspace) {
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return DispatchError{ErrorCategory::Input, "Workspace does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return DispatchError{ErrorCategory::Input, "Failed to canonicalize workspace", "invalid_path"};
            }
            req.workspace = std::move(canonical_path);
        }

        return req;
    }

} // namespace cidispatch::app::cli
