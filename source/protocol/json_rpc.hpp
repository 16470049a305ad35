#ifndef CDPDRIVE_JSON_RPC_HPP
#define CDPDRIVE_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers for the command service.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Server error codes (-32000..-32099) for driver failures.
constexpr int SPAWN_ERROR = -32010;
constexpr int PROCESS_NOT_RUNNING = -32011;
constexpr int CONNECTION_ERROR = -32012;
constexpr int PROTOCOL_ERROR = -32013;
constexpr int COMMAND_ERROR = -32014;
constexpr int JS_EXECUTION_ERROR = -32015;
constexpr int UNKNOWN_PROTOCOL_RESULT = -32016;
constexpr int TARGET_NOT_FOUND = -32017;
constexpr int PORT_IN_USE = -32018;
constexpr int OUT_OF_RETRIES = -32019;
constexpr int DRIVER_ERROR = -32020;

json build_response(const json &request_id, const json &result_payload);

// data is only included when it is not null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

// Empty if the message has no string "method".
std::string get_method(const json &message);

// Null json if missing (notification).
json get_id(const json &message);

// Empty object if missing or not an object.
json get_params(const json &message);

bool is_notification(const json &message);

// An object with "jsonrpc": "2.0" and a string method.
bool is_valid_request(const json &message);

} // namespace json_rpc

#endif // CDPDRIVE_JSON_RPC_HPP
