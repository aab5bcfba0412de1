#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/dispatch_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "runtime/builtin_tools.hpp"
#include "runtime/tool_registry.hpp"
#include "server/mcp_server.hpp"
#include "session/workspace_gate.hpp"
#include "tools/process_runner.hpp"
#include "tools/tool_context.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInputError = 2;
constexpr int kExitToolError = 3;

// Set once before the handlers are installed; the handler only stores to it.
std::atomic_bool* g_cancel_flag = nullptr;

void handle_shutdown_signal(int /*signal_number*/) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

// No SA_RESTART, so a blocking read on stdin returns and the serve loop
// winds down as if the client had disconnected. The server also polls the
// flag, which covers a signal that lands between two reads.
void install_signal_handlers(std::atomic_bool& cancel_flag) {
    g_cancel_flag = &cancel_flag;

    struct sigaction action {};
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));

    // A vanished client must surface as a failed write, not kill the server.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));
}

void report_error(const std::string& what, const cidispatch::core::errors::DispatchError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

cidispatch::core::errors::Result<cidispatch::core::config::ServerConfig> build_config(
    const cidispatch::protocol::LaunchRequest& req) {
    namespace config = cidispatch::core::config;
    namespace errors = cidispatch::core::errors;

    config::ServerConfig base;
    if (req.config_file) {
        auto loaded = config::load_config_file(*req.config_file, base);
        if (errors::is_error(loaded)) {
            return errors::get_error(loaded);
        }
        base = errors::get_value(loaded);
    }

    auto with_env = config::apply_environment(base);
    if (errors::is_error(with_env)) {
        return errors::get_error(with_env);
    }
    config::ServerConfig merged = errors::get_value(with_env);

    // Command-line flags win over everything else.
    if (req.workspace) merged.workspace_root = *req.workspace;
    if (req.log_level) merged.log_level = *req.log_level;
    if (req.max_concurrency) merged.max_concurrent_requests = *req.max_concurrency;
    return config::finalize(merged);
}

int exit_code_for(const cidispatch::protocol::ToolStatus status) {
    switch (status) {
        case cidispatch::protocol::ToolStatus::Success:
            return kExitSuccess;
        case cidispatch::protocol::ToolStatus::Failure:
            return kExitFailure;
        case cidispatch::protocol::ToolStatus::Error:
        default:
            return kExitToolError;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = cidispatch::core::errors;
    using cidispatch::protocol::LaunchMode;

    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    install_signal_handlers(*cancel_token);

    // 1. Parse CLI input and return normalized input errors
    auto parsed = cidispatch::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cerr << err.hint << std::endl;
            return kExitSuccess;
        }
        report_error("Input error", err);
        return kExitInputError;
    }
    const auto& req = errors::get_value(parsed);

    // 2. Resolve configuration: defaults, file, environment, flags
    auto configured = build_config(req);
    if (errors::is_error(configured)) {
        report_error("Configuration error", errors::get_error(configured));
        return kExitInputError;
    }
    const auto config = errors::get_value(configured);
    cidispatch::core::logging::Logger::get().set_min_level(config.log_level);

    // 3. Build and seal the tool table
    cidispatch::runtime::ToolRegistry registry;
    auto registered = cidispatch::runtime::register_builtin_tools(registry);
    if (errors::is_error(registered)) {
        report_error("Failed to register tools", errors::get_error(registered));
        return kExitToolError;
    }
    registry.seal();

    cidispatch::tools::ProcessRunner runner;

    if (req.mode == LaunchMode::List) {
        nlohmann::json catalogue = nlohmann::json::array();
        for (const auto& spec : registry.specs()) {
            catalogue.push_back({{"name", spec.name},
                                 {"description", spec.description},
                                 {"inputSchema", cidispatch::protocol::input_schema_to_json(spec)}});
        }
        std::cout << catalogue.dump(2) << std::endl;
        return kExitSuccess;
    }

    if (req.mode == LaunchMode::Call) {
        const std::string request_id = cidispatch::core::config::generate_request_id();
        cidispatch::core::logging::ScopedRequestTag tag(request_id);
        cidispatch::session::WorkspaceGate gate;
        const cidispatch::tools::ToolContext context{config,       runner,       gate,
                                                     cancel_token, std::nullopt, request_id};

        auto dispatched = registry.dispatch({req.tool_name, req.arguments}, context);
        if (errors::is_error(dispatched)) {
            const auto& err = errors::get_error(dispatched);
            report_error("Rejected call", err);
            std::cout << cidispatch::protocol::error_to_json(err).dump(2) << std::endl;
            return kExitInputError;
        }
        const auto& outcome = errors::get_value(dispatched);
        std::cout << cidispatch::protocol::outcome_to_json(outcome).dump(
                         2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return exit_code_for(cidispatch::protocol::status_of(outcome));
    }

    cidispatch::server::McpServer server(registry, config, runner, std::cin, std::cout,
                                         cancel_token);
    server.serve();
    LOG_INFO("Server stopped.");
    return kExitSuccess;
}
