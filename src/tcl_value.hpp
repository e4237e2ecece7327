#ifndef TCL_VALUE_HPP
#define TCL_VALUE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace tcllite {

// Value kinds
enum class ValueKind {
    V_TEXT,
    V_INT,
    V_DOUBLE,
    V_BOOL,
    V_LIST
};

// One encodable value: a scalar or a nested list of values
struct Value {
    ValueKind kind = ValueKind::V_TEXT;

    // Value storage
    bool bool_val = false;
    int64_t int_val = 0;
    double double_val = 0.0;
    std::string text_val;

    // Items for V_LIST
    std::vector<Value> list_items;

    // Factory methods
    static Value make_text(const std::string& v);
    static Value make_text(std::string_view v);
    static Value make_text(const char* v);
    static Value make_int(int64_t v);
    static Value make_double(double v);
    static Value make_bool(bool v);
    static Value make_list();
    static Value make_list(std::vector<Value> items);

    // Append to a V_LIST value; returns *this for chaining
    Value& push_back(Value item);

    bool is_list() const { return kind == ValueKind::V_LIST; }

    // 0 for scalars, 1 + deepest item for lists
    int depth() const;
};

// Zero-based label index for a one-based factor code; throws TYPE_ERROR
// when the code falls outside 1..level_count
size_t factor_level_index(int code, size_t level_count, int depth = 0,
                          const std::vector<size_t>& path = {});

} // namespace tcllite

#endif // TCL_VALUE_HPP
