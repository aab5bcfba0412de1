#include "server/mcp_server.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <pthread.h>
#include <exception>
#include <string>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "server/json_rpc.hpp"
#include "tools/tool_context.hpp"

namespace cidispatch::server {

using nlohmann::json;

namespace {

// How often the dispatcher looks at the shutdown flag while idle.
constexpr std::chrono::milliseconds kShutdownPoll{100};

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Key under which a request is tracked; the id exactly as the client sent it.
std::string request_key(const json& id) {
    return id.dump();
}

}  // namespace

McpServer::McpServer(const runtime::ToolRegistry& registry,
                     const core::config::ServerConfig& config, tools::CommandRunner& runner,
                     std::istream& in, std::ostream& out,
                     std::shared_ptr<std::atomic_bool> shutdown_flag)
    : registry_(registry),
      config_(config),
      runner_(runner),
      in_(in),
      out_(out),
      shutdown_flag_(std::move(shutdown_flag)) {}

McpServer::~McpServer() {
    requests_.cancel_all();
    join_workers();
}

std::optional<json> McpServer::handle_message(const json& message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::kInvalidRequest,
                                              "Request must be a JSON object.");
    }

    const std::string method = json_rpc::get_method(message);
    const json id = json_rpc::get_id(message);
    const json params = json_rpc::get_params(message);

    try {
        if (json_rpc::is_notification(message)) {
            if (method == "notifications/cancelled") {
                handle_cancelled(params);
            } else if (method != "notifications/initialized") {
                LOG_DEBUG("Ignoring notification: " + method);
            }
            return std::nullopt;
        }

        if (method.empty()) {
            return json_rpc::build_error_response(id, json_rpc::kInvalidRequest,
                                                  "Request has no method.");
        }
        if (method == "initialize") {
            return handle_initialize(id, params);
        }
        if (method == "ping") {
            return json_rpc::build_response(id, json::object());
        }
        if (method == "tools/list") {
            return handle_tools_list(id);
        }
        if (method == "tools/call") {
            return handle_tools_call(id, params);
        }
        return json_rpc::build_error_response(id, json_rpc::kMethodNotFound,
                                              "Unknown method: " + method);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle " + method + ": " + e.what());
        return json_rpc::build_error_response(id, json_rpc::kInternalError,
                                              std::string("Internal error: ") + e.what());
    }
}

json McpServer::handle_initialize(const json& id, const json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LOG_INFO("Client connected: " + params["clientInfo"].value("name", std::string("?")));
    }

    json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"]["tools"] = json::object();
    result["serverInfo"]["name"] = kServerName;
    result["serverInfo"]["version"] = kServerVersion;
    return json_rpc::build_response(id, result);
}

json McpServer::handle_tools_list(const json& id) const {
    json tools = json::array();
    for (const auto& spec : registry_.specs()) {
        json entry;
        entry["name"] = spec.name;
        entry["description"] = spec.description;
        entry["inputSchema"] = protocol::input_schema_to_json(spec);
        tools.push_back(entry);
    }
    json result;
    result["tools"] = tools;
    return json_rpc::build_response(id, result);
}

json McpServer::handle_tools_call(const json& id, const json& params) {
    const auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return json_rpc::build_error_response(id, json_rpc::kInvalidParams,
                                              "Missing or invalid 'name' in tools/call.");
    }

    protocol::ToolRequest request;
    request.tool_name = name->get<std::string>();
    request.arguments = params.contains("arguments") ? params.at("arguments") : json(nullptr);

    const std::string key = request_key(id);
    const std::string request_id = core::config::generate_request_id();
    auto started = requests_.start_request(key, request_id, request.tool_name);
    if (core::errors::is_error(started)) {
        const auto& err = core::errors::get_error(started);
        return json_rpc::build_error_response(id, json_rpc::kInvalidRequest, err.message,
                                              protocol::error_to_json(err));
    }
    const auto cancel_token = core::errors::get_value(started);

    core::logging::ScopedRequestTag tag(request_id);
    LOG_INFO("tools/call " + request.tool_name);
    // Queued before the input closed; the answer is still sent, nothing is run.
    if (closing_.load()) {
        auto cancelled = requests_.cancel_request(key);
        if (core::errors::is_error(cancelled)) {
            LOG_DEBUG(core::errors::get_error(cancelled).message);
        }
    }

    const tools::ToolContext context{config_,      runner_,      gate_,
                                     cancel_token, std::nullopt, request_id};
    auto dispatched = registry_.dispatch(request, context);

    json response;
    if (core::errors::is_error(dispatched)) {
        const auto& err = core::errors::get_error(dispatched);
        LOG_WARN("Rejected " + request.tool_name + ": " + err.message);
        if (!cancel_token->load()) {
            auto marked = requests_.mark_failed(key);
            if (core::errors::is_error(marked)) {
                LOG_DEBUG(core::errors::get_error(marked).message);
            }
        }
        response = json_rpc::build_error_response(id, json_rpc::kInvalidParams, err.message,
                                                  protocol::error_to_json(err));
    } else {
        const auto& outcome = core::errors::get_value(dispatched);
        const auto status = protocol::status_of(outcome);
        LOG_INFO(request.tool_name + " finished: " + protocol::to_string(status));
        if (!cancel_token->load()) {
            auto marked = requests_.mark_completed(key);
            if (core::errors::is_error(marked)) {
                LOG_DEBUG(core::errors::get_error(marked).message);
            }
        }

        json content = json::array();
        content.push_back({{"type", "text"}, {"text", protocol::render_text(outcome)}});
        json result;
        result["content"] = content;
        result["structuredContent"] = protocol::outcome_to_json(outcome);
        result["isError"] = status == protocol::ToolStatus::Error;
        response = json_rpc::build_response(id, result);
    }
    requests_.release(key);
    return response;
}

void McpServer::handle_cancelled(const json& params) {
    const auto target = params.find("requestId");
    if (target == params.end()) {
        return;
    }
    auto cancelled = requests_.cancel_request(request_key(*target));
    if (core::errors::is_error(cancelled)) {
        // Late or unknown cancellations are expected; the request may have finished.
        LOG_DEBUG("Cancellation ignored: " + core::errors::get_error(cancelled).message);
        return;
    }
    LOG_INFO("Cancelled request " + target->dump());
}

void McpServer::serve() {
    LOG_INFO(std::string(kServerName) + " serving on stdio, workspace " +
             config_.workspace_root.string());

    // The reader keeps the current signal mask so SIGINT/SIGTERM interrupt its
    // read. This thread blocks them, and the workers inherit that.
    std::thread reader([this] { read_input(); });
    sigset_t blocked;
    sigset_t previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    static_cast<void>(pthread_sigmask(SIG_BLOCK, &blocked, &previous));

    while (true) {
        if (shutdown_requested()) {
            close_input("Shutdown requested");
        }
        json message;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_changed_.wait_for(lock, kShutdownPoll, [this] {
                return !pending_calls_.empty() || input_closed_;
            });
            if (pending_calls_.empty()) {
                if (input_closed_) {
                    break;
                }
                continue;
            }
            message = std::move(pending_calls_.front());
            pending_calls_.pop_front();
        }
        dispatch_async(std::move(message));
    }

    join_workers();
    static_cast<void>(pthread_sigmask(SIG_SETMASK, &previous, nullptr));
    reader.join();
}

void McpServer::read_input() {
    std::string line;
    while (!shutdown_requested() && std::getline(in_, line)) {
        if (is_blank(line)) {
            continue;
        }
        json message = json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            LOG_WARN("Discarding malformed message");
            write(json_rpc::build_error_response(nullptr, json_rpc::kParseError,
                                                 "Parse error"));
            continue;
        }

        if (message.is_object() && !json_rpc::is_notification(message) &&
            json_rpc::get_method(message) == "tools/call") {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                pending_calls_.push_back(std::move(message));
            }
            queue_changed_.notify_one();
            continue;
        }
        if (auto response = handle_message(message)) {
            write(*response);
        }
    }
    close_input(in_.eof() ? "Input closed" : "Input interrupted");
}

// closing_ is set before cancel_all(), so a call that registers after the
// sweep sees it and cancels itself.
void McpServer::close_input(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (input_closed_) {
            return;
        }
        input_closed_ = true;
        closing_.store(true);
    }
    const std::size_t cancelled = requests_.cancel_all();
    LOG_INFO(reason + "; cancelled " + std::to_string(cancelled) +
             " in-flight request(s), shutting down");
    queue_changed_.notify_all();
}

bool McpServer::shutdown_requested() const {
    return shutdown_flag_ && shutdown_flag_->load();
}

void McpServer::dispatch_async(json message) {
    std::unique_lock<std::mutex> lock(workers_mutex_);
    slot_available_.wait(lock,
                         [this] { return active_workers_ < config_.max_concurrent_requests; });
    reap_finished_workers();
    ++active_workers_;

    auto done = std::make_shared<std::atomic_bool>(false);
    std::thread thread([this, done, message = std::move(message)] {
        if (auto response = handle_message(message)) {
            write(*response);
        }
        {
            std::lock_guard<std::mutex> guard(workers_mutex_);
            --active_workers_;
        }
        done->store(true);
        slot_available_.notify_one();
    });
    workers_.push_back(Worker{std::move(thread), done});
}

// Caller holds workers_mutex_.
void McpServer::reap_finished_workers() {
    auto finished = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& worker) { return !worker.done->load(); });
    for (auto it = finished; it != workers_.end(); ++it) {
        it->thread.join();
    }
    workers_.erase(finished, workers_.end());
}

void McpServer::join_workers() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void McpServer::write(const json& message) {
    // Tool output is not guaranteed to be UTF-8.
    const std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace cidispatch::server
