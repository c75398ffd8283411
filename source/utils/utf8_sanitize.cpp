#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
size_t utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Length of the well-formed sequence starting at position, or 0 if it is malformed.
size_t valid_sequence_length(const std::string &text, size_t position) {
    unsigned char lead = static_cast<unsigned char>(text[position]);
    size_t length = utf8_lead_length(lead);
    if (length == 0 || position + length > text.size()) {
        return 0;
    }
    if (length == 1) {
        return 1;
    }

    // Second byte ranges that exclude overlong forms, surrogates and code points above U+10FFFF.
    unsigned char second = static_cast<unsigned char>(text[position + 1]);
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;
    if (lead == 0xE0u) {
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        second_high = 0x9Fu;
    } else if (lead == 0xF0u) {
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        second_high = 0x8Fu;
    }
    if (second < second_low || second > second_high) {
        return 0;
    }

    for (size_t offset = 2; offset < length; ++offset) {
        if (!is_continuation(static_cast<unsigned char>(text[position + offset]))) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    size_t position = 0;
    while (position < text.size()) {
        size_t length = valid_sequence_length(text, position);
        if (length == 0) {
            return false;
        }
        position += length;
    }
    return true;
}

void sanitize(std::string &text) {
    // Most output is plain ASCII or already valid; skip the copy.
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + kReplacementLength);

    size_t position = 0;
    while (position < text.size()) {
        size_t length = valid_sequence_length(text, position);
        if (length == 0) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8_sanitize
