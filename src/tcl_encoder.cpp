#include "tcl_encoder.hpp"
#include "tcl_charconv.h"
#include "tcl_quote.hpp"
#include <cmath>

namespace tcllite {

ListWriter::ListWriter(size_t initial_capacity) : buf_(initial_capacity) {}

void ListWriter::separate() {
    if (count_ > 0) {
        buf_.append_char(' ');
    }
    count_++;
}

void ListWriter::add_text(std::string_view s) {
    separate();
    append_quoted_element(buf_, s);
}

void ListWriter::add_raw_element(std::string_view element) {
    separate();
    buf_.append(element);
}

void ListWriter::clear() {
    buf_.clear();
    count_ = 0;
}

Encoder::Encoder(const EncodeOptions& opts) : opts_(opts) {
    if (opts_.max_depth <= 0) {
        opts_.max_depth = kDefaultMaxDepth;
    }
}

std::string Encoder::encode(const std::vector<Value>& values) {
    warnings_.clear();
    path_.clear();

    ListWriter out;
    encode_items(values, out, 1);
    return out.str();
}

std::string Encoder::encode_element(const Value& value) {
    warnings_.clear();
    path_.clear();

    ListWriter out;
    path_.push_back(0);
    encode_value(value, out, 1);
    path_.pop_back();
    return out.str();
}

void Encoder::check_depth(int depth) {
    if (depth > opts_.max_depth) {
        throw EncodeError("nesting too deep (limit " +
                              std::to_string(opts_.max_depth) + " levels)",
                          ErrorType::DEPTH_ERROR, depth, path_);
    }
}

void Encoder::encode_items(const std::vector<Value>& items, ListWriter& out, int depth) {
    check_depth(depth);
    for (size_t i = 0; i < items.size(); i++) {
        path_.push_back(i);
        encode_value(items[i], out, depth);
        path_.pop_back();
    }
}

void Encoder::encode_value(const Value& value, ListWriter& out, int depth) {
    switch (value.kind) {
        case ValueKind::V_TEXT:
            out.add_text(value.text_val);
            break;
        case ValueKind::V_INT:
            out.add_raw_element(format_int64(value.int_val));
            break;
        case ValueKind::V_DOUBLE:
            out.add_raw_element(encode_double(value.double_val, depth));
            break;
        case ValueKind::V_BOOL:
            out.add_raw_element(value.bool_val ? "1" : "0");
            break;
        case ValueKind::V_LIST: {
            // The nested list always goes through the quoter so it stays
            // one element of the enclosing list
            ListWriter nested;
            encode_items(value.list_items, nested, depth + 1);
            out.add_text(nested.view());
            break;
        }
    }
}

std::string Encoder::encode_double(double val, int depth) {
    if (!std::isfinite(val)) {
        const char* what = std::isnan(val) ? "NaN" : "Inf/-Inf";
        if (opts_.strict) {
            throw EncodeError(std::string(what) + " values not allowed in strict mode",
                              ErrorType::ENCODING_ERROR, depth, path_);
        }
        std::string text = format_double(val);
        warnings_.emplace_back("non_finite",
            std::string(what) + " value at element " + path_string() +
            " written as '" + text + "'");
        return text;
    }
    return format_double(val);
}

std::string Encoder::path_string() const {
    std::string s;
    for (size_t index : path_) {
        s += "[" + std::to_string(index + 1) + "]";
    }
    return s;
}

std::string encode_list(const std::vector<Value>& values, const EncodeOptions& opts) {
    Encoder encoder(opts);
    return encoder.encode(values);
}

} // namespace tcllite
