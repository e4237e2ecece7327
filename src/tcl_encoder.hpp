#ifndef TCL_ENCODER_HPP
#define TCL_ENCODER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include "tcl_errors.hpp"
#include "tcl_io.h"
#include "tcl_value.hpp"

namespace tcllite {

constexpr int kDefaultMaxDepth = 1000;

// Encoder options
struct EncodeOptions {
    bool strict = false;               // reject NaN/Inf instead of writing them
    int max_depth = kDefaultMaxDepth;  // list levels, outermost list included
};

// Builds one list, one element at a time
class ListWriter {
public:
    ListWriter(size_t initial_capacity = WriteBuffer::DEFAULT_CAPACITY);

    // Quote s and append it as the next element
    void add_text(std::string_view s);

    // Append an element that is already safe to embed (numbers, "1"/"0",
    // output of quote_element)
    void add_raw_element(std::string_view element);

    size_t count() const { return count_; }
    std::string_view view() const { return buf_.view(); }
    std::string str() const { return buf_.str(); }
    void clear();

private:
    void separate();

    WriteBuffer buf_;
    size_t count_ = 0;
};

// Encoder class
class Encoder {
public:
    Encoder(const EncodeOptions& opts = EncodeOptions());

    // Encode values as one list, elements separated by single spaces
    std::string encode(const std::vector<Value>& values);

    // Encode a single value as it would appear as a list element
    std::string encode_element(const Value& value);

    // Get warnings accumulated by the last encode call
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    void encode_items(const std::vector<Value>& items, ListWriter& out, int depth);
    void encode_value(const Value& value, ListWriter& out, int depth);
    std::string encode_double(double val, int depth);
    void check_depth(int depth);
    std::string path_string() const;

    EncodeOptions opts_;
    std::vector<Warning> warnings_;
    std::vector<size_t> path_;
};

// encodeList: encode values with default options
std::string encode_list(const std::vector<Value>& values,
                        const EncodeOptions& opts = EncodeOptions());

} // namespace tcllite

#endif // TCL_ENCODER_HPP
