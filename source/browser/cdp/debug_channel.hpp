#ifndef CDPDRIVE_DEBUG_CHANNEL_HPP
#define CDPDRIVE_DEBUG_CHANNEL_HPP

// Request/response channel to one CDP debug target.
//
// Every command is stamped with the same correlation id, so at most one
// command may be in flight per channel. Sending overlapping commands would
// need per-request ids and a pending-request map; callers that need
// concurrency open one channel per thread instead.

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

#include "browser/cdp/message_transport.hpp"

namespace cdp_driver {

using json = nlohmann::json;

class DebugChannel {
public:
    // Fixed correlation id stamped on every request.
    static constexpr int kCorrelationId = 77;

    // Opens a WebSocket connection to websocket_url immediately.
    // Throws driver_errors::ConnectionError if the endpoint is unreachable.
    explicit DebugChannel(const std::string &websocket_url);

    explicit DebugChannel(std::unique_ptr<MessageTransport> transport);

    DebugChannel(const DebugChannel &) = delete;
    DebugChannel &operator=(const DebugChannel &) = delete;

    // Sends command ({"method": ..., "params": ...}) and blocks until the
    // response carrying the correlation id arrives; other messages are dropped.
    // Throws ProtocolError if the connection drops, CommandError if the
    // response carries a protocol error object.
    json run_command(json command);

    // Runtime.evaluate; returns the nested result.result object.
    json run_js(const std::string &script);

    // Runtime.evaluate, interpreted:
    //   {"value": v}                          -> v
    //   {"subtype": "node", "objectId": id}   -> id
    //   {"subtype": "error", "description": d} -> throws JsExecutionError(d)
    //   anything else                         -> throws UnknownProtocolResult
    json run_js_get_value(const std::string &script);

    bool is_alive() const;
    void kill();

private:
    std::unique_ptr<MessageTransport> transport_;
};

} // namespace cdp_driver

#endif // CDPDRIVE_DEBUG_CHANNEL_HPP
