#include "utils/utf8_text.hpp"

namespace utf8_text {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the sequence introduced by lead, or 0 if lead cannot start one.
std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

// Length of the valid sequence at position, or 0 if the bytes there are malformed.
std::size_t valid_sequence_at(const std::string &text, std::size_t position) {
    std::size_t length = sequence_length(static_cast<unsigned char>(text[position]));
    if (length == 0 || position + length > text.size()) {
        return 0;
    }
    for (std::size_t offset = 1; offset < length; ++offset) {
        unsigned char byte = static_cast<unsigned char>(text[position + offset]);
        if ((byte & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

// Copies up to max_code_points code points into output; returns true if text was cut.
bool copy_code_points(const std::string &text, std::size_t max_code_points, std::string &output) {
    output.reserve(text.size() < 256 ? text.size() : 256);
    std::size_t position = 0;
    std::size_t copied = 0;
    while (position < text.size()) {
        if (copied == max_code_points) {
            return true;
        }
        std::size_t length = valid_sequence_at(text, position);
        if (length == 0) {
            output += kReplacement;
            position += 1;
        } else {
            output.append(text, position, length);
            position += length;
        }
        ++copied;
    }
    return false;
}

} // namespace

std::string sanitize(const std::string &text) {
    std::string output;
    copy_code_points(text, text.size(), output);
    return output;
}

std::string truncate(const std::string &text, std::size_t max_code_points) {
    std::string output;
    copy_code_points(text, max_code_points, output);
    return output;
}

std::string abbreviate(const std::string &text, std::size_t max_code_points) {
    std::string output;
    if (copy_code_points(text, max_code_points, output)) {
        output += "...";
    }
    return output;
}

} // namespace utf8_text
