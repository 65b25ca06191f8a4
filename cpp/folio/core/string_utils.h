#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio {

// =============================================================================
// ASCII helpers
// =============================================================================

inline std::string trimWhitespace(std::string_view input) {
    std::size_t begin = 0;
    std::size_t end = input.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(input[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
    return std::string(input.substr(begin, end - begin));
}

inline std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// =============================================================================
// UTF-8
// =============================================================================

// Byte length of the sequence starting at pos. Malformed or truncated
// sequences count as one byte so scanning always advances.
inline std::size_t utf8SequenceLength(std::string_view content, std::size_t pos) {
    const std::size_t n = content.size();
    if (pos >= n) return 0;

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    std::size_t len = 1;
    if ((c0 & 0x80) == 0) return 1;
    if ((c0 & 0xE0) == 0xC0) len = 2;
    else if ((c0 & 0xF0) == 0xE0) len = 3;
    else if ((c0 & 0xF8) == 0xF0) len = 4;
    else return 1;

    if (pos + len > n) return 1;
    for (std::size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(content[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

inline std::size_t utf8CodepointCount(std::string_view content) {
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < content.size(); pos += utf8SequenceLength(content, pos)) ++count;
    return count;
}

// First maxCodepoints code points of content, never splitting a sequence.
inline std::string utf8Prefix(std::string_view content, std::size_t maxCodepoints) {
    std::size_t pos = 0;
    for (std::size_t count = 0; count < maxCodepoints && pos < content.size(); ++count) {
        pos += utf8SequenceLength(content, pos);
    }
    return std::string(content.substr(0, pos));
}

} // namespace folio
