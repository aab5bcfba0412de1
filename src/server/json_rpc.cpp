#include "server/json_rpc.hpp"

namespace cidispatch::server::json_rpc {

using nlohmann::json;

json build_response(const json& request_id, const json& result) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result;
    return response;
}

json build_error_response(const json& request_id, const int code, const std::string& message,
                          const json& data) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    if (!data.is_null()) {
        response["error"]["data"] = data;
    }
    return response;
}

std::string get_method(const json& message) {
    const auto it = message.find("method");
    if (it != message.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

json get_id(const json& message) {
    const auto it = message.find("id");
    return it == message.end() ? json(nullptr) : *it;
}

json get_params(const json& message) {
    const auto it = message.find("params");
    if (it != message.end() && it->is_object()) {
        return *it;
    }
    return json::object();
}

bool is_notification(const json& message) {
    return !message.contains("id");
}

}  // namespace cidispatch::server::json_rpc
