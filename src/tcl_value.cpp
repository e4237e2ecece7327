#include "tcl_value.hpp"
#include "tcl_errors.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace tcllite {

Value Value::make_text(const std::string& v) {
    Value value;
    value.kind = ValueKind::V_TEXT;
    value.text_val = v;
    return value;
}

Value Value::make_text(std::string_view v) {
    return make_text(std::string(v));
}

Value Value::make_text(const char* v) {
    return make_text(std::string(v));
}

Value Value::make_int(int64_t v) {
    Value value;
    value.kind = ValueKind::V_INT;
    value.int_val = v;
    return value;
}

Value Value::make_double(double v) {
    Value value;
    value.kind = ValueKind::V_DOUBLE;
    value.double_val = v;
    return value;
}

Value Value::make_bool(bool v) {
    Value value;
    value.kind = ValueKind::V_BOOL;
    value.bool_val = v;
    return value;
}

Value Value::make_list() {
    Value value;
    value.kind = ValueKind::V_LIST;
    return value;
}

Value Value::make_list(std::vector<Value> items) {
    Value value;
    value.kind = ValueKind::V_LIST;
    value.list_items = std::move(items);
    return value;
}

Value& Value::push_back(Value item) {
    if (kind != ValueKind::V_LIST) {
        throw EncodeError("push_back on a non-list value", ErrorType::TYPE_ERROR);
    }
    list_items.push_back(std::move(item));
    return *this;
}

int Value::depth() const {
    if (kind != ValueKind::V_LIST) {
        return 0;
    }
    int deepest = 0;
    for (const auto& item : list_items) {
        deepest = std::max(deepest, item.depth());
    }
    return deepest + 1;
}

size_t factor_level_index(int code, size_t level_count, int depth,
                          const std::vector<size_t>& path) {
    if (code < 1 || static_cast<size_t>(code) > level_count) {
        throw EncodeError("Invalid factor code " + std::to_string(code) + " (factor has " +
                              std::to_string(level_count) + " levels)",
                          ErrorType::TYPE_ERROR, depth, path);
    }
    return static_cast<size_t>(code) - 1;
}

} // namespace tcllite
