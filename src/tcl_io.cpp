#include "tcl_io.h"

namespace tcllite {

WriteBuffer::WriteBuffer(size_t initial_capacity) {
    data_.reserve(initial_capacity);
}

void WriteBuffer::append(const char* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

void WriteBuffer::append(const std::string& s) {
    append(s.data(), s.size());
}

void WriteBuffer::append(std::string_view sv) {
    append(sv.data(), sv.size());
}

void WriteBuffer::append_char(char c) {
    data_.push_back(c);
}

void WriteBuffer::append_hex_escape(unsigned char c) {
    static const char digits[] = "0123456789abcdef";
    char buf[4] = {'\\', 'x', digits[c >> 4], digits[c & 0x0f]};
    append(buf, sizeof(buf));
}

std::string_view WriteBuffer::view() const {
    return std::string_view(data_.data(), data_.size());
}

std::string WriteBuffer::str() const {
    return std::string(data_.begin(), data_.end());
}

void WriteBuffer::clear() {
    data_.clear();
}

} // namespace tcllite
