#include "browser/cdp/websocket_transport.hpp"
#include "browser/driver_errors.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <mutex>
#include <vector>

namespace cdp_driver {

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static void quiet_libwebsockets_logging() {
    static std::once_flag configured;
    std::call_once(configured, [] { lws_set_log_level(LLL_ERR | LLL_WARN, nullptr); });
}

// Each transport owns its context; the context user pointer leads back to it.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    struct lws_context *context = lws_get_context(websocket_instance);
    auto *transport = context ? static_cast<WebSocketTransport *>(lws_context_user(context)) : nullptr;
    if (transport == nullptr) {
        return 0;
    }
    return transport->handle_event(websocket_instance, static_cast<int>(reason), incoming_data, incoming_length);
}

WebSocketAddress parse_websocket_url(const std::string &websocket_url) {
    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.rfind("ws://", 0) == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    } else if (url_without_scheme.find("://") != std::string::npos) {
        throw driver_errors::ConnectionError("Unsupported debug URL scheme: " + websocket_url);
    }

    WebSocketAddress address;

    // Split host:port from path.
    std::string host_and_port = url_without_scheme;
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        address.path = url_without_scheme.substr(slash_position);
    }

    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        address.host = host_and_port.substr(0, colon_position);
        try {
            address.port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            throw driver_errors::ConnectionError("Failed to parse port from WebSocket URL: " + websocket_url);
        }
    } else if (!host_and_port.empty()) {
        address.host = host_and_port;
    }

    if (address.host.empty() || address.port <= 0 || address.port > 65535) {
        throw driver_errors::ConnectionError("Invalid WebSocket URL: " + websocket_url);
    }
    return address;
}

WebSocketTransport::WebSocketTransport(const std::string &websocket_url, int connect_timeout_milliseconds)
    : url_(websocket_url) {
    debug_log::log("Connecting to CDP WebSocket: " + websocket_url);
    WebSocketAddress address = parse_websocket_url(websocket_url);
    quiet_libwebsockets_logging();

    // Create libwebsockets context.
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        throw driver_errors::ConnectionError("Failed to create libwebsockets context.");
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = address.host.c_str();
    connect_info.port = address.port;
    connect_info.path = address.path.c_str();
    connect_info.host = address.host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (websocket_connection_ == nullptr) {
        destroy_context();
        throw driver_errors::ConnectionError("Failed to initiate WebSocket connection to " + websocket_url);
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!connected_) {
        lws_service(websocket_context_, 50);

        if (connection_failed_) {
            destroy_context();
            throw driver_errors::ConnectionError("WebSocket connection to " + websocket_url +
                                                 " failed: " + connection_error_);
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > connect_timeout_milliseconds) {
            destroy_context();
            throw driver_errors::ConnectionError("Timed out connecting to " + websocket_url + " after " +
                                                 std::to_string(connect_timeout_milliseconds) + " ms");
        }
    }
    debug_log::log("CDP WebSocket connected: " + websocket_url);
}

WebSocketTransport::~WebSocketTransport() {
    destroy_context();
}

int WebSocketTransport::handle_event(struct lws *websocket_instance, int reason,
                                     void *incoming_data, size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connected_ = true;
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        receive_buffer_.append(static_cast<const char *>(incoming_data), incoming_length);
        // A message may arrive in several fragments, each possibly split by the rx buffer.
        if (lws_is_final_fragment(websocket_instance) &&
            lws_remaining_packet_payload(websocket_instance) == 0) {
            inbox_.push_back(std::move(receive_buffer_));
            receive_buffer_.clear();
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        connection_error_ = incoming_data ? std::string(static_cast<const char *>(incoming_data), incoming_length)
                                          : std::string("unknown");
        debug_log::log("CDP WebSocket connection error: " + connection_error_);
        connected_ = false;
        connection_failed_ = true;
        closed_ = true;
        break;

    case LWS_CALLBACK_CLIENT_CLOSED:
        debug_log::log("CDP WebSocket closed: " + url_);
        connected_ = false;
        closed_ = true;
        websocket_connection_ = nullptr;
        break;

    default:
        break;
    }
    return 0;
}

bool WebSocketTransport::send_text(const std::string &message) {
    if (!is_open() || websocket_connection_ == nullptr) {
        return false;
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + message.size());
    memcpy(send_buffer.data() + LWS_PRE, message.data(), message.size());

    int bytes_written = lws_write(websocket_connection_, send_buffer.data() + LWS_PRE,
                                  message.size(), LWS_WRITE_TEXT);
    return bytes_written >= static_cast<int>(message.size());
}

std::optional<std::string> WebSocketTransport::receive_text() {
    while (inbox_.empty()) {
        if (closed_ || websocket_context_ == nullptr) {
            return std::nullopt;
        }
        lws_service(websocket_context_, 50);
    }
    std::string message = std::move(inbox_.front());
    inbox_.pop_front();
    return message;
}

bool WebSocketTransport::is_open() const {
    return connected_ && !closed_;
}

void WebSocketTransport::close() {
    destroy_context();
}

void WebSocketTransport::destroy_context() {
    if (websocket_context_ != nullptr) {
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
    }
    websocket_connection_ = nullptr;
    connected_ = false;
    closed_ = true;
}

} // namespace cdp_driver
