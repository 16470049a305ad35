#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static void write_line(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[cdpdrive] " << message << std::endl;
}

bool is_debug_enabled() {
    const char *value = std::getenv("CDPDRIVE_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(message);
}

void notice(const std::string &message) {
    write_line(message);
}

} // namespace debug_log
