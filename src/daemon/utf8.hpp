#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// UTF-8 helpers for keystroke synthesis. Malformed input never splits a
// sequence: each invalid byte becomes U+FFFD.
namespace utf8 {

inline constexpr char32_t REPLACEMENT = 0xFFFD;

struct CodePoint {
    char32_t value;
    std::string_view bytes; // original bytes, or empty for a replacement
};

// Decodes the code point starting at text[pos] and advances pos.
inline CodePoint next(std::string_view text, size_t& pos) {
    auto b0 = static_cast<uint8_t>(text[pos]);
    size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;

    if (b0 < 0x80) {
        return {b0, text.substr(pos++, 1)};
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2; cp = b0 & 0x1F; min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; cp = b0 & 0x0F; min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; cp = b0 & 0x07; min = 0x10000;
    } else {
        pos++;
        return {REPLACEMENT, {}};
    }

    if (pos + len > text.size()) {
        pos++;
        return {REPLACEMENT, {}};
    }
    for (size_t i = 1; i < len; i++) {
        auto b = static_cast<uint8_t>(text[pos + i]);
        if ((b & 0xC0) != 0x80) {
            pos++;
            return {REPLACEMENT, {}};
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        pos++;
        return {REPLACEMENT, {}};
    }

    CodePoint out{cp, text.substr(pos, len)};
    pos += len;
    return out;
}

inline std::string encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

inline size_t length(std::string_view text) {
    size_t n = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        next(text, pos);
        n++;
    }
    return n;
}

} // namespace utf8
