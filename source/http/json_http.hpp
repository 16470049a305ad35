#ifndef CDPDRIVE_JSON_HTTP_HPP
#define CDPDRIVE_JSON_HTTP_HPP

// Minimal HTTP GET + JSON parse over libcurl (used for target discovery).

#include <nlohmann/json.hpp>
#include <string>

namespace json_http {

using json = nlohmann::json;

constexpr int kDefaultTimeoutMilliseconds = 30000;

// GETs url and parses the body as JSON.
// Throws driver_errors::ConnectionError on transport failure or a non-2xx
// status, driver_errors::UnknownProtocolResult if the body is not JSON.
json get(const std::string &url, int timeout_milliseconds = kDefaultTimeoutMilliseconds);

} // namespace json_http

#endif // CDPDRIVE_JSON_HTTP_HPP
