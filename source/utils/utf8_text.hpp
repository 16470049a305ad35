#ifndef CDPDRIVE_UTF8_TEXT_HPP
#define CDPDRIVE_UTF8_TEXT_HPP

// UTF-8 helpers for text that ends up in logs and error messages
// (script results, raw protocol payloads).

#include <cstddef>
#include <string>

namespace utf8_text {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
std::string sanitize(const std::string &text);

// Returns at most max_code_points code points of text, sanitized.
// A multi-byte sequence is never split.
std::string truncate(const std::string &text, std::size_t max_code_points);

// Same as truncate(), appending "..." when anything was cut off.
std::string abbreviate(const std::string &text, std::size_t max_code_points);

} // namespace utf8_text

#endif // CDPDRIVE_UTF8_TEXT_HPP
