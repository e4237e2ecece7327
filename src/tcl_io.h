#ifndef TCL_IO_HPP
#define TCL_IO_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace tcllite {

// Write buffer for building list text
class WriteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    WriteBuffer(size_t initial_capacity = DEFAULT_CAPACITY);

    void append(const char* data, size_t len);
    void append(const std::string& s);
    void append(std::string_view sv);
    void append_char(char c);

    // Append \xHH for a byte value, lowercase hex
    void append_hex_escape(unsigned char c);

    // Get current content
    std::string_view view() const;
    std::string str() const;

    void clear();
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

private:
    std::vector<char> data_;
};

} // namespace tcllite

#endif // TCL_IO_HPP
