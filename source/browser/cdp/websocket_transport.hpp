#ifndef CDPDRIVE_WEBSOCKET_TRANSPORT_HPP
#define CDPDRIVE_WEBSOCKET_TRANSPORT_HPP

// libwebsockets client connection to a CDP debug target.

#include <cstddef>
#include <deque>
#include <string>

#include "browser/cdp/message_transport.hpp"

struct lws_context;
struct lws;

namespace cdp_driver {

// Parts of a ws:// URL.
struct WebSocketAddress {
    std::string host = "127.0.0.1";
    int port = 9222;
    std::string path = "/";
};

// Splits ws://host:port/path. Throws driver_errors::ConnectionError if the URL is unusable.
WebSocketAddress parse_websocket_url(const std::string &websocket_url);

class WebSocketTransport : public MessageTransport {
public:
    // Connects immediately; throws driver_errors::ConnectionError if the
    // endpoint is unreachable or the handshake does not finish in time.
    explicit WebSocketTransport(const std::string &websocket_url,
                                int connect_timeout_milliseconds = 20000);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport &) = delete;
    WebSocketTransport &operator=(const WebSocketTransport &) = delete;

    bool send_text(const std::string &message) override;
    std::optional<std::string> receive_text() override;
    bool is_open() const override;
    void close() override;

    // Entry point for the libwebsockets protocol callback.
    int handle_event(struct lws *websocket_instance, int reason, void *incoming_data, size_t incoming_length);

private:
    void destroy_context();

    std::string url_;
    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;
    bool connected_ = false;
    bool connection_failed_ = false;
    bool closed_ = false;
    std::string connection_error_;

    // Fragments of the message currently being received.
    std::string receive_buffer_;
    // Complete messages not yet handed to the caller.
    std::deque<std::string> inbox_;
};

} // namespace cdp_driver

#endif // CDPDRIVE_WEBSOCKET_TRANSPORT_HPP
