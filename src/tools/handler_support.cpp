#include "tools/handler_support.hpp"

#include <iterator>
#include <utility>

namespace cidispatch::tools {

using nlohmann::json;
using protocol::ProcessResult;

namespace {

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> out;
    for (const auto& item : value) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

void append_text(std::string& target, const std::string& text) {
    if (!target.empty() && !text.empty() && target.back() != '\n') {
        target.push_back('\n');
    }
    target += text;
}

}  // namespace

FileSetRequest file_set_request_from_args(const ToolContext& context, const json& args) {
    FileSetRequest request;
    request.scope = args.value("path", std::string("."));
    if (args.contains("files")) {
        request.files = string_list(args.at("files"));
    }
    request.extensions = args.contains("extensions") ? string_list(args.at("extensions"))
                                                     : context.config.source_extensions;
    request.excluded_directories = context.config.excluded_directories;
    return request;
}

ProcessRequest make_process_request(const ToolContext& context,
                                    const core::config::ExternalCommand& command,
                                    std::vector<std::string> arguments,
                                    const policy::EnvironmentList& extra_environment) {
    const policy::PolicyGuard policy_guard;

    ProcessRequest request;
    request.executable = command.executable;
    request.arguments = command.arguments;
    request.arguments.insert(request.arguments.end(),
                             std::make_move_iterator(arguments.begin()),
                             std::make_move_iterator(arguments.end()));
    request.working_directory = context.config.workspace_root;
    request.timeout_ms = context.timeout_ms();
    request.environment = policy_guard.child_environment(extra_environment);
    request.max_output_bytes = context.config.max_output_bytes;
    request.cancel_token = context.cancel_token;
    return request;
}

core::errors::Result<ProcessResult> run_over_files(
    const ToolContext& context, const core::config::ExternalCommand& command,
    const std::vector<std::string>& mode_arguments, const std::vector<std::string>& files) {
    ProcessResult merged;
    merged.exit_code = 0;

    for (const auto& batch :
         make_batches(files, context.config.max_files_per_invocation)) {
        std::vector<std::string> arguments = mode_arguments;
        arguments.insert(arguments.end(), batch.begin(), batch.end());

        const auto request = make_process_request(context, command, arguments);
        auto run = context.runner.run(request);
        if (core::errors::is_error(run)) {
            return core::errors::get_error(run);
        }
        const auto& process = core::errors::get_value(run);

        if (merged.exit_code == 0) {
            merged.exit_code = process.exit_code;
        }
        append_text(merged.stdout_text, process.stdout_text);
        append_text(merged.stderr_text, process.stderr_text);
        merged.duration_ms += process.duration_ms;
        merged.timeout_ms = request.timeout_ms;
        merged.timed_out = merged.timed_out || process.timed_out;
        merged.cancelled = merged.cancelled || process.cancelled;
        merged.stdout_truncated = merged.stdout_truncated || process.stdout_truncated;
        merged.stderr_truncated = merged.stderr_truncated || process.stderr_truncated;

        if (process.timed_out || process.cancelled) {
            break;
        }
    }
    return merged;
}

std::string describe_interrupted(const std::string& executable, const ProcessResult& process,
                                 const std::uint32_t timeout_ms) {
    if (process.cancelled) {
        return executable + " was cancelled.";
    }
    if (process.timed_out) {
        return executable + " timed out after " + std::to_string(timeout_ms) + " ms.";
    }
    return "";
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                     started)
        .count();
}

std::string plural(const std::size_t count, const std::string& noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

}  // namespace cidispatch::tools
