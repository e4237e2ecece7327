#ifndef TCL_UTF8_H
#define TCL_UTF8_H

#include <cstddef>
#include <string_view>

namespace tcllite {

// Reported for bytes that do not start a well-formed UTF-8 sequence.
// Such bytes are consumed one at a time and treated as printable.
constexpr char32_t kInvalidCodePoint = 0xFFFFFFFF;

struct CodePoint {
    char32_t value;
    size_t length;  // bytes consumed, at least 1
};

inline bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Decode the code point starting at s[pos].  pos must be < s.size().
inline CodePoint decode_code_point(std::string_view s, size_t pos) {
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        return {lead, 1};
    }

    size_t len;
    char32_t value;
    char32_t min_value;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        value = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        value = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        value = lead & 0x07;
        min_value = 0x10000;
    } else {
        return {kInvalidCodePoint, 1};
    }

    if (s.size() - pos < len) {
        return {kInvalidCodePoint, 1};
    }
    for (size_t i = 1; i < len; i++) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!is_continuation_byte(c)) {
            return {kInvalidCodePoint, 1};
        }
        value = (value << 6) | (c & 0x3F);
    }

    // Overlong forms, encoded surrogates and values past U+10FFFF
    if (value < min_value || value > 0x10FFFF ||
        (value >= 0xD800 && value <= 0xDFFF)) {
        return {kInvalidCodePoint, 1};
    }
    return {value, len};
}

// Control characters below space, and DEL
inline bool is_unprintable_ascii(char32_t cp) {
    return cp < 32 || cp == 127;
}

} // namespace tcllite

#endif // TCL_UTF8_H
