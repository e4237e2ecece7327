#ifndef TCL_LIST_DECODER_HPP
#define TCL_LIST_DECODER_HPP

// Minimal Tcl list splitter used as a round-trip oracle in the tests.
// Follows the list syntax of Tcl 8.6 (Tcl_SplitList): braced elements are
// taken literally, bare and quoted elements get backslash substitution,
// \x takes at most two hex digits.

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tcllite {
namespace test_support {

inline bool is_list_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline void append_utf8(std::string& out, char32_t cp) {
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
}

// Substitute the backslash sequence at s[i]; returns the index after it
inline size_t substitute_backslash(std::string_view s, size_t i, std::string& out) {
    if (i + 1 >= s.size()) {
        out += '\\';
        return i + 1;
    }
    char c = s[i + 1];
    size_t next = i + 2;
    switch (c) {
        case 'a': out += '\a'; return next;
        case 'b': out += '\b'; return next;
        case 'f': out += '\f'; return next;
        case 'n': out += '\n'; return next;
        case 'r': out += '\r'; return next;
        case 't': out += '\t'; return next;
        case 'v': out += '\v'; return next;
        case 'x':
        case 'u': {
            size_t max_digits = (c == 'x') ? 2 : 4;
            char32_t value = 0;
            size_t digits = 0;
            while (digits < max_digits && next < s.size() && hex_value(s[next]) >= 0) {
                value = value * 16 + static_cast<char32_t>(hex_value(s[next]));
                next++;
                digits++;
            }
            if (digits == 0) {
                out += c;
            } else {
                append_utf8(out, value);
            }
            return next;
        }
        case '\n': {
            while (next < s.size() && (s[next] == ' ' || s[next] == '\t')) {
                next++;
            }
            out += ' ';
            return next;
        }
        default:
            break;
    }
    if (c >= '0' && c <= '7') {
        char32_t value = static_cast<char32_t>(c - '0');
        size_t digits = 1;
        while (digits < 3 && next < s.size() && s[next] >= '0' && s[next] <= '7') {
            value = value * 8 + static_cast<char32_t>(s[next] - '0');
            next++;
            digits++;
        }
        append_utf8(out, value & 0xFF);
        return next;
    }
    out += c;
    return next;
}

inline std::vector<std::string> decode_list(std::string_view s) {
    std::vector<std::string> elements;
    size_t i = 0;
    const size_t n = s.size();

    while (true) {
        while (i < n && is_list_space(s[i])) {
            i++;
        }
        if (i >= n) {
            break;
        }

        std::string elem;
        if (s[i] == '{') {
            int depth = 1;
            size_t start = ++i;
            while (true) {
                if (i >= n) {
                    throw std::runtime_error("unmatched open brace in list");
                }
                char c = s[i];
                if (c == '\\') {
                    i += 2;
                    continue;
                }
                if (c == '{') {
                    depth++;
                } else if (c == '}' && --depth == 0) {
                    break;
                }
                i++;
            }
            elem.assign(s.substr(start, i - start));
            i++;
            if (i < n && !is_list_space(s[i])) {
                throw std::runtime_error("list element in braces followed by extra characters");
            }
        } else if (s[i] == '"') {
            i++;
            while (true) {
                if (i >= n) {
                    throw std::runtime_error("unmatched open quote in list");
                }
                if (s[i] == '"') {
                    break;
                }
                if (s[i] == '\\') {
                    i = substitute_backslash(s, i, elem);
                } else {
                    elem += s[i++];
                }
            }
            i++;
            if (i < n && !is_list_space(s[i])) {
                throw std::runtime_error("list element in quotes followed by extra characters");
            }
        } else {
            while (i < n && !is_list_space(s[i])) {
                if (s[i] == '\\') {
                    i = substitute_backslash(s, i, elem);
                } else {
                    elem += s[i++];
                }
            }
        }
        elements.push_back(std::move(elem));
    }
    return elements;
}

} // namespace test_support
} // namespace tcllite

#endif // TCL_LIST_DECODER_HPP
