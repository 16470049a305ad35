#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    return json{{"jsonrpc", "2.0"}, {"id", request_id}, {"result", result_payload}};
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json error{{"code", error_code}, {"message", error_message}};
    if (!error_data.is_null()) {
        error["data"] = error_data;
    }
    return json{{"jsonrpc", "2.0"}, {"id", request_id}, {"error", error}};
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

bool is_valid_request(const json &message) {
    return message.is_object() && message.contains("jsonrpc") && message["jsonrpc"] == "2.0" &&
           !get_method(message).empty();
}

} // namespace json_rpc
