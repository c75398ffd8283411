#ifndef CMCPS_UTF8_SANITIZE_HPP
#define CMCPS_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Returns true if text is well-formed UTF-8 (no overlong lead bytes, no truncated sequences).
bool is_valid(const std::string &text);

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// In-place version. Command output and file content pass through here before they
// are placed in a JSON envelope, since nlohmann::json refuses to dump invalid UTF-8.
void sanitize(std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // CMCPS_UTF8_SANITIZE_HPP
