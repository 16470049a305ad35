#include "service/service.hpp"
#include "service/command_registry.hpp"
#include "protocol/json_rpc.hpp"
#include "browser/driver_errors.hpp"
#include "timing/retry_waiter.hpp"
#include "utils/debug_log.hpp"

namespace service_dispatch {

namespace {

struct ErrorClass {
    int code;
    const char *kind;
};

// Most specific class first.
ErrorClass classify(const std::exception &error) {
    using namespace driver_errors;
    if (dynamic_cast<const command_registry::InvalidParams *>(&error) ||
        dynamic_cast<const json::type_error *>(&error)) {
        return {json_rpc::INVALID_PARAMS, "InvalidParams"};
    }
    if (dynamic_cast<const retry::OutOfRetriesError *>(&error)) {
        return {json_rpc::OUT_OF_RETRIES, "OutOfRetries"};
    }
    if (dynamic_cast<const SpawnError *>(&error)) {
        return {json_rpc::SPAWN_ERROR, "SpawnError"};
    }
    if (dynamic_cast<const ProcessNotRunning *>(&error)) {
        return {json_rpc::PROCESS_NOT_RUNNING, "ProcessNotRunning"};
    }
    if (dynamic_cast<const ConnectionError *>(&error)) {
        return {json_rpc::CONNECTION_ERROR, "ConnectionError"};
    }
    if (dynamic_cast<const ProtocolError *>(&error)) {
        return {json_rpc::PROTOCOL_ERROR, "ProtocolError"};
    }
    if (dynamic_cast<const CommandError *>(&error)) {
        return {json_rpc::COMMAND_ERROR, "CommandError"};
    }
    if (dynamic_cast<const JsExecutionError *>(&error)) {
        return {json_rpc::JS_EXECUTION_ERROR, "JsExecutionError"};
    }
    if (dynamic_cast<const UnknownProtocolResult *>(&error)) {
        return {json_rpc::UNKNOWN_PROTOCOL_RESULT, "UnknownProtocolResult"};
    }
    if (dynamic_cast<const TargetNotFound *>(&error)) {
        return {json_rpc::TARGET_NOT_FOUND, "TargetNotFound"};
    }
    if (dynamic_cast<const PortInUse *>(&error)) {
        return {json_rpc::PORT_IN_USE, "PortInUse"};
    }
    if (dynamic_cast<const DriverError *>(&error)) {
        return {json_rpc::DRIVER_ERROR, "DriverError"};
    }
    return {json_rpc::INTERNAL_ERROR, "InternalError"};
}

json handle_list_commands(const json &request_id) {
    json result = command_registry::build_command_list();
    result["commands"].push_back({
        {"name", "list_commands"},
        {"description", "List the commands this service accepts."},
        {"params", {{"type", "object"}, {"properties", json::object()}}},
    });
    return json_rpc::build_response(request_id, result);
}

} // namespace

json build_error_for_exception(const json &request_id, const std::exception &error) {
    ErrorClass error_class = classify(error);
    return json_rpc::build_error_response(request_id, error_class.code, error.what(),
                                          json{{"kind", error_class.kind}});
}

json dispatch_message(const json &message, browser_driver::DriverManager &manager) {
    if (!json_rpc::is_valid_request(message)) {
        return json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INVALID_REQUEST,
                                              "Invalid JSON-RPC 2.0 request");
    }

    const std::string method = json_rpc::get_method(message);
    const json request_id = json_rpc::get_id(message);
    const json params = json_rpc::get_params(message);
    const bool notification = json_rpc::is_notification(message);

    if (method == "list_commands") {
        return notification ? json(nullptr) : handle_list_commands(request_id);
    }

    const command_registry::CommandDefinition *command = command_registry::find_command(method);
    if (command == nullptr) {
        if (notification) {
            return nullptr;
        }
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                              "Unknown method: " + method);
    }

    try {
        json result = command->handler(params, manager);
        return notification ? json(nullptr) : json_rpc::build_response(request_id, result);
    } catch (const std::exception &error) {
        debug_log::log(method + " failed: " + error.what());
        return notification ? json(nullptr) : build_error_for_exception(request_id, error);
    }
}

} // namespace service_dispatch
