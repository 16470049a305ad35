#ifndef CDPDRIVE_MESSAGE_TRANSPORT_HPP
#define CDPDRIVE_MESSAGE_TRANSPORT_HPP

// A persistent, message-oriented duplex connection carrying text frames.
// WebSocketTransport is the production implementation; tests script their own.

#include <optional>
#include <string>

namespace cdp_driver {

class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    // Sends one complete text message. Returns false if it could not be written.
    virtual bool send_text(const std::string &message) = 0;

    // Blocks until one complete message is available. Messages already received
    // are still delivered after the peer closes; after that returns std::nullopt.
    virtual std::optional<std::string> receive_text() = 0;

    virtual bool is_open() const = 0;

    virtual void close() = 0;
};

} // namespace cdp_driver

#endif // CDPDRIVE_MESSAGE_TRANSPORT_HPP
