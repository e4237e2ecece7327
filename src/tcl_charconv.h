#ifndef TCL_CHARCONV_H
#define TCL_CHARCONV_H

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

namespace tcllite {

// Locale-independent number formatting.  Doubles use the shortest
// representation that reads back to the same value, so 1.0 prints as "1"
// and 1e21 as "1e+21".  Non-finite values print as "nan", "inf", "-inf".

inline std::string format_int64(int64_t value) {
    char buf[24];
    std::to_chars_result res = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, res.ptr);
}

inline std::string format_double(double value) {
    // Longest shortest-form output is "-2.2250738585072014e-308"
    char buf[32];
    std::to_chars_result res = std::to_chars(buf, buf + sizeof(buf), value);
    if (res.ec != std::errc()) {
        return std::string();
    }
    return std::string(buf, res.ptr);
}

}  // namespace tcllite

#endif  // TCL_CHARCONV_H
