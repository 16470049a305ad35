#include "service/service.hpp"

// Stdio framing: one JSON object per message, found by brace counting with
// string/escape awareness, so both newline-delimited and streamed JSON work.

namespace service_stdio {

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;

    char character;
    while (input.get(character)) {
        if (brace_depth == 0) {
            // Anything between objects (whitespace, newlines) is ignored.
            if (character == '{') {
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
        } else if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
        } else if (character == '"') {
            inside_string = true;
        } else if (character == '{') {
            brace_depth++;
        } else if (character == '}' && --brace_depth == 0) {
            return buffer;
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

} // namespace service_stdio
