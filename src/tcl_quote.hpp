#ifndef TCL_QUOTE_HPP
#define TCL_QUOTE_HPP

#include <string>
#include <string_view>
#include "tcl_io.h"

namespace tcllite {

// How a string has to be written to stay a single list element
enum class QuoteStyle {
    UNQUOTED,   // emitted as is
    BRACE,      // wrapped in { }
    BACKSLASH   // special characters escaped one by one
};

// Pick the least intrusive style that round-trips s.  The empty string
// classifies as BRACE ("{}").
QuoteStyle classify_element(std::string_view s);

// Quote s as one list element.  Total over all inputs, never throws.
std::string quote_element(std::string_view s);

// Same as quote_element, written into buf
void append_quoted_element(WriteBuffer& buf, std::string_view s);

// Escape every special character of s with a backslash, without
// classifying first.  Used for the BACKSLASH style.
void append_backslash_escaped(WriteBuffer& buf, std::string_view s);

const char* quote_style_name(QuoteStyle style);

} // namespace tcllite

#endif // TCL_QUOTE_HPP
