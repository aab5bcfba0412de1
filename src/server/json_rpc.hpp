#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace cidispatch::server::json_rpc {

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

nlohmann::json build_response(const nlohmann::json& request_id, const nlohmann::json& result);

nlohmann::json build_error_response(const nlohmann::json& request_id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data = nullptr);

// Empty when the message has no string "method".
std::string get_method(const nlohmann::json& message);

// null for notifications.
nlohmann::json get_id(const nlohmann::json& message);

// An empty object when "params" is missing or not an object.
nlohmann::json get_params(const nlohmann::json& message);

bool is_notification(const nlohmann::json& message);

}  // namespace cidispatch::server::json_rpc
