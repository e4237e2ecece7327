#include "tcl_quote.hpp"
#include "tcl_utf8.h"

namespace tcllite {

QuoteStyle classify_element(std::string_view s) {
    if (s.empty()) {
        return QuoteStyle::BRACE;
    }

    bool need_backslash = false;
    bool need_brace = false;
    int brace_depth = 0;

    size_t pos = 0;
    while (pos < s.size() && !need_backslash) {
        CodePoint cp = decode_code_point(s, pos);
        pos += cp.length;

        // Multi-byte and malformed sequences never need quoting
        if (cp.length > 1 || cp.value == kInvalidCodePoint) {
            continue;
        }
        if (is_unprintable_ascii(cp.value)) {
            need_backslash = true;
            break;
        }

        switch (cp.value) {
            case ' ':
            case '"':
                need_brace = true;
                break;
            case '\\':
                if (pos == s.size()) {
                    // A trailing backslash would escape the closing brace
                    need_backslash = true;
                } else {
                    // The escaped character is protected; skip it
                    need_brace = true;
                    pos += decode_code_point(s, pos).length;
                }
                break;
            case '{':
                need_brace = true;
                brace_depth++;
                break;
            case '}':
                need_brace = true;
                if (brace_depth > 0) {
                    brace_depth--;
                } else {
                    need_backslash = true;
                }
                break;
            default:
                break;
        }
    }

    if (brace_depth != 0) {
        need_backslash = true;
    }

    if (need_backslash) {
        return QuoteStyle::BACKSLASH;
    }
    if (need_brace) {
        return QuoteStyle::BRACE;
    }
    return QuoteStyle::UNQUOTED;
}

void append_backslash_escaped(WriteBuffer& buf, std::string_view s) {
    size_t pos = 0;
    while (pos < s.size()) {
        CodePoint cp = decode_code_point(s, pos);
        std::string_view raw = s.substr(pos, cp.length);
        pos += cp.length;

        if (cp.length > 1 || cp.value == kInvalidCodePoint) {
            buf.append(raw);
            continue;
        }

        // No named escape for \a: BEL goes out as \x07
        switch (cp.value) {
            case '\b': buf.append("\\b", 2); break;
            case '\f': buf.append("\\f", 2); break;
            case '\n': buf.append("\\n", 2); break;
            case '\r': buf.append("\\r", 2); break;
            case '\t': buf.append("\\t", 2); break;
            case '\v': buf.append("\\v", 2); break;
            case ' ':
            case '"':
            case '\\':
            case '{':
            case '}':
                buf.append_char('\\');
                buf.append_char(static_cast<char>(cp.value));
                break;
            default:
                if (is_unprintable_ascii(cp.value)) {
                    buf.append_hex_escape(static_cast<unsigned char>(cp.value));
                } else {
                    buf.append_char(static_cast<char>(cp.value));
                }
                break;
        }
    }
}

void append_quoted_element(WriteBuffer& buf, std::string_view s) {
    switch (classify_element(s)) {
        case QuoteStyle::UNQUOTED:
            buf.append(s);
            break;
        case QuoteStyle::BRACE:
            buf.append_char('{');
            buf.append(s);
            buf.append_char('}');
            break;
        case QuoteStyle::BACKSLASH:
            append_backslash_escaped(buf, s);
            break;
    }
}

std::string quote_element(std::string_view s) {
    WriteBuffer buf(s.size() + 2);
    append_quoted_element(buf, s);
    return buf.str();
}

const char* quote_style_name(QuoteStyle style) {
    switch (style) {
        case QuoteStyle::UNQUOTED: return "unquoted";
        case QuoteStyle::BRACE: return "brace";
        case QuoteStyle::BACKSLASH: return "backslash";
    }
    return "unknown";
}

} // namespace tcllite
