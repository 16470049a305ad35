#ifndef CDPDRIVE_SERVICE_HPP
#define CDPDRIVE_SERVICE_HPP

// Stdio JSON-RPC service: message framing and dispatch.

#include <nlohmann/json.hpp>
#include <exception>
#include <istream>
#include <ostream>
#include <string>

#include "browser/driver_manager.hpp"

namespace service_stdio {

// Read a single complete JSON object from input.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Write one JSON message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

} // namespace service_stdio

namespace service_dispatch {

using json = nlohmann::json;

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message, browser_driver::DriverManager &manager);

// Maps an exception thrown while handling request_id to a JSON-RPC error response.
json build_error_for_exception(const json &request_id, const std::exception &error);

} // namespace service_dispatch

#endif // CDPDRIVE_SERVICE_HPP
