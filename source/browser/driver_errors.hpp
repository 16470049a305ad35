#ifndef CDPDRIVE_DRIVER_ERRORS_HPP
#define CDPDRIVE_DRIVER_ERRORS_HPP

// Error taxonomy of the browser driver.
// The low layers (ProcessHandle, DebugChannel) throw these and never retry;
// retry policy lives in retry::RetryWaiter and browser_driver::DriverManager.

#include <stdexcept>
#include <string>

namespace driver_errors {

class DriverError : public std::runtime_error {
public:
    explicit DriverError(const std::string &message) : std::runtime_error(message) {}
};

// The browser executable could not be found or started.
class SpawnError : public DriverError {
public:
    explicit SpawnError(const std::string &message) : DriverError(message) {}
};

// Base of the errors that suggest the browser crashed or went away.
// DriverManager::run_with_recovery respawns the browser on these.
class BrowserUnavailable : public DriverError {
public:
    explicit BrowserUnavailable(const std::string &message) : DriverError(message) {}
};

class ProcessNotRunning : public BrowserUnavailable {
public:
    explicit ProcessNotRunning(const std::string &message) : BrowserUnavailable(message) {}
};

// WebSocket or HTTP transport failure.
class ConnectionError : public BrowserUnavailable {
public:
    explicit ConnectionError(const std::string &message) : BrowserUnavailable(message) {}
};

// The debug connection failed while a command was in flight.
class ProtocolError : public BrowserUnavailable {
public:
    explicit ProtocolError(const std::string &message) : BrowserUnavailable(message) {}
};

// The browser answered a command with a protocol-level error object.
class CommandError : public DriverError {
public:
    CommandError(int code, const std::string &message)
        : DriverError("CDP command failed (" + std::to_string(code) + "): " + message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// The evaluated script threw; description is the engine's error description.
class JsExecutionError : public DriverError {
public:
    explicit JsExecutionError(const std::string &description)
        : DriverError(description), description_(description) {}

    const std::string &description() const { return description_; }

private:
    std::string description_;
};

// Response shape not recognized; raw_payload holds the JSON for diagnosis.
class UnknownProtocolResult : public DriverError {
public:
    explicit UnknownProtocolResult(const std::string &raw_payload)
        : DriverError("Unknown protocol result: " + raw_payload), raw_payload_(raw_payload) {}

    const std::string &raw_payload() const { return raw_payload_; }

private:
    std::string raw_payload_;
};

class TargetNotFound : public DriverError {
public:
    explicit TargetNotFound(const std::string &message) : DriverError(message) {}
};

// Another DriverManager in this process already owns the debugging port.
class PortInUse : public DriverError {
public:
    explicit PortInUse(int port)
        : DriverError("Remote debugging port " + std::to_string(port) + " is already owned by another driver manager"),
          port_(port) {}

    int port() const { return port_; }

private:
    int port_;
};

} // namespace driver_errors

#endif // CDPDRIVE_DRIVER_ERRORS_HPP
