#include "http/json_http.hpp"
#include "browser/driver_errors.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_text.hpp"

#include <curl/curl.h>
#include <mutex>

namespace json_http {

namespace {

size_t write_callback(char *data, size_t size, size_t count, void *userdata) {
    auto *body = static_cast<std::string *>(userdata);
    body->append(data, size * count);
    return size * count;
}

void ensure_curl_initialized() {
    static std::once_flag initialized;
    std::call_once(initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

json get(const std::string &url, int timeout_milliseconds) {
    ensure_curl_initialized();
    debug_log::log("HTTP GET " + url);

    CURL *curl = curl_easy_init();
    if (curl == nullptr) {
        throw driver_errors::ConnectionError("curl_easy_init failed");
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_milliseconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "cdpdrive/0.1");

    const CURLcode code = curl_easy_perform(curl);
    long status = 0;
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
        throw driver_errors::ConnectionError("GET " + url + " failed: " + curl_easy_strerror(code));
    }
    if (status < 200 || status >= 300) {
        throw driver_errors::ConnectionError("GET " + url + " returned HTTP " + std::to_string(status));
    }

    try {
        return json::parse(body);
    } catch (const json::parse_error &) {
        throw driver_errors::UnknownProtocolResult(utf8_text::abbreviate(body, 200));
    }
}

} // namespace json_http
