#include "runtime/tool_registry.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <utility>
#include "core/logging/logger.hpp"

namespace cidispatch::runtime {

using core::errors::DispatchError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ParamSpec;
using protocol::ParamType;

namespace {

DispatchError schema_error(const std::string& message, const std::string& code,
                           const std::string& hint = "") {
    return DispatchError{ErrorCategory::Schema, message, code, hint};
}

bool matches_type(const json& value, const ParamType type) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Integer:
            return value.is_number_integer();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::StringArray:
            if (!value.is_array()) {
                return false;
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return false;
                }
            }
            return true;
        default:
            return false;
    }
}

std::optional<DispatchError> check_bounds(const ParamSpec& param, const json& value) {
    if (param.type != ParamType::Integer) {
        return std::nullopt;
    }
    // Unsigned values above int64 range are out of any bound we declare.
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
        return schema_error("Parameter '" + param.name + "' is out of range.",
                            "parameter_out_of_range");
    }
    const auto number = value.get<std::int64_t>();
    if ((param.minimum && number < *param.minimum) ||
        (param.maximum && number > *param.maximum)) {
        std::string range = "[" + (param.minimum ? std::to_string(*param.minimum) : "") + ", " +
                            (param.maximum ? std::to_string(*param.maximum) : "") + "]";
        return schema_error("Parameter '" + param.name + "' must be within " + range + ".",
                            "parameter_out_of_range");
    }
    return std::nullopt;
}

}  // namespace

core::errors::Result<bool> ToolRegistry::register_tool(protocol::ToolSpec spec,
                                                       ToolHandler handler) {
    if (sealed_) {
        return DispatchError{ErrorCategory::Internal,
                             "Cannot register '" + spec.name + "' after the registry is sealed.",
                             "registry_sealed"};
    }
    if (entries_.count(spec.name) > 0) {
        return DispatchError{ErrorCategory::Internal,
                             "Tool already registered: " + spec.name, "duplicate_tool"};
    }
    if (!handler) {
        return DispatchError{ErrorCategory::Internal,
                             "Tool has no handler: " + spec.name, "missing_handler"};
    }
    const std::string name = spec.name;
    order_.push_back(name);
    entries_.emplace(name, Entry{std::move(spec), std::move(handler)});
    return true;
}

core::errors::Result<json> ToolRegistry::validate(const protocol::ToolRequest& request) const {
    const auto it = entries_.find(request.tool_name);
    if (it == entries_.end()) {
        return schema_error("Unknown tool: " + request.tool_name, "unknown_tool",
                            "Call tools/list for the available tools.");
    }
    const auto& spec = it->second.spec;

    // A missing arguments member arrives as null and means "no arguments".
    const json& arguments = request.arguments;
    if (!arguments.is_null() && !arguments.is_object()) {
        return schema_error("Arguments for '" + spec.name + "' must be a JSON object.",
                            "invalid_arguments");
    }

    json validated = json::object();
    if (arguments.is_object()) {
        for (const auto& [key, value] : arguments.items()) {
            const ParamSpec* param = spec.find_parameter(key);
            if (param == nullptr) {
                return schema_error("Unknown parameter '" + key + "' for tool '" + spec.name +
                                        "'.",
                                    "unknown_parameter");
            }
            if (!matches_type(value, param->type)) {
                return schema_error("Parameter '" + key + "' must be of type " +
                                        protocol::to_string(param->type) + ".",
                                    "invalid_parameter_type");
            }
            if (auto bounds = check_bounds(*param, value)) {
                return *bounds;
            }
            validated[key] = value;
        }
    }

    for (const auto& param : spec.parameters) {
        if (validated.contains(param.name)) {
            continue;
        }
        if (param.required) {
            return schema_error("Missing required parameter '" + param.name + "' for tool '" +
                                    spec.name + "'.",
                                "missing_parameter");
        }
        if (param.default_value) {
            validated[param.name] = *param.default_value;
        }
    }
    return validated;
}

core::errors::Result<protocol::ToolOutcome> ToolRegistry::dispatch(
    const protocol::ToolRequest& request, const tools::ToolContext& context) const {
    auto validated = validate(request);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    const auto& entry = entries_.at(request.tool_name);

    try {
        return entry.handler(context, core::errors::get_value(validated));
    } catch (const std::exception& e) {
        LOG_ERROR("Tool '" + request.tool_name + "' raised: " + e.what());
        return protocol::ToolOutcome{protocol::make_error_result(
            request.tool_name, std::string("Internal error: ") + e.what())};
    } catch (...) {
        LOG_ERROR("Tool '" + request.tool_name + "' raised a non-standard exception.");
        return protocol::ToolOutcome{protocol::make_error_result(
            request.tool_name, "Internal error: unknown exception.")};
    }
}

std::vector<protocol::ToolSpec> ToolRegistry::specs() const {
    std::vector<protocol::ToolSpec> out;
    out.reserve(order_.size());
    for (const auto& name : order_) {
        out.push_back(entries_.at(name).spec);
    }
    return out;
}

}  // namespace cidispatch::runtime
