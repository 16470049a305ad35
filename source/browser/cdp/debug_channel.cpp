#include "browser/cdp/debug_channel.hpp"
#include "browser/cdp/websocket_transport.hpp"
#include "browser/driver_errors.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_text.hpp"

namespace cdp_driver {

DebugChannel::DebugChannel(const std::string &websocket_url)
    : transport_(std::make_unique<WebSocketTransport>(websocket_url)) {}

DebugChannel::DebugChannel(std::unique_ptr<MessageTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw driver_errors::ConnectionError("DebugChannel needs a transport");
    }
}

json DebugChannel::run_command(json command) {
    command["id"] = kCorrelationId;
    const std::string method = command.value("method", std::string());

    if (!transport_->is_open()) {
        throw driver_errors::ProtocolError("Debug connection is closed; cannot send " + method);
    }
    if (!transport_->send_text(command.dump())) {
        throw driver_errors::ProtocolError("Failed to send CDP command " + method);
    }

    while (true) {
        std::optional<std::string> raw_message = transport_->receive_text();
        if (!raw_message) {
            throw driver_errors::ProtocolError("Debug connection dropped while waiting for " + method);
        }

        json response;
        try {
            response = json::parse(*raw_message);
        } catch (const json::parse_error &parse_error) {
            debug_log::log("Skipping unparseable CDP message: " + std::string(parse_error.what()) +
                           ", content: " + utf8_text::abbreviate(*raw_message, 200));
            continue;
        }

        // Events carry no id; responses to other requests carry a different one.
        if (!response.is_object() || !response.contains("id") || response["id"] != kCorrelationId) {
            debug_log::log("Discarding CDP message: " + utf8_text::abbreviate(response.dump(), 200));
            continue;
        }

        if (response.contains("error") && response["error"].is_object()) {
            const json &error = response["error"];
            throw driver_errors::CommandError(error.value("code", 0),
                                              error.value("message", std::string("unknown error")));
        }
        return response;
    }
}

json DebugChannel::run_js(const std::string &script) {
    json command;
    command["method"] = "Runtime.evaluate";
    command["params"]["expression"] = script;

    json response = run_command(std::move(command));
    if (!response.contains("result") || !response["result"].is_object() ||
        !response["result"].contains("result") || !response["result"]["result"].is_object()) {
        throw driver_errors::UnknownProtocolResult(response.dump());
    }
    return response["result"]["result"];
}

json DebugChannel::run_js_get_value(const std::string &script) {
    json result = run_js(script);
    if (result.contains("value")) {
        return result["value"];
    }

    if (result.contains("subtype") && result["subtype"].is_string()) {
        const std::string subtype = result["subtype"].get<std::string>();
        if (subtype == "node" && result.contains("objectId")) {
            return result["objectId"];
        }
        if (subtype == "error") {
            throw driver_errors::JsExecutionError(result.value("description", std::string("(no description)")));
        }
    }

    throw driver_errors::UnknownProtocolResult(result.dump());
}

bool DebugChannel::is_alive() const {
    return transport_->is_open();
}

void DebugChannel::kill() {
    transport_->close();
}

} // namespace cdp_driver
