#ifndef TCL_ERRORS_HPP
#define TCL_ERRORS_HPP

#include <string>
#include <stdexcept>
#include <cstddef>
#include <vector>

namespace tcllite {

// Error types
enum class ErrorType {
    ENCODING_ERROR,
    DEPTH_ERROR,
    TYPE_ERROR
};

// Encode error with the position of the offending value
class EncodeError : public std::runtime_error {
public:
    EncodeError(const std::string& message,
                ErrorType type = ErrorType::ENCODING_ERROR,
                int depth = 0,
                const std::vector<size_t>& path = {})
        : std::runtime_error(message),
          type_(type),
          depth_(depth),
          path_(path) {}

    ErrorType type() const { return type_; }
    int depth() const { return depth_; }

    // Zero-based element indices from the outermost list inwards
    const std::vector<size_t>& path() const { return path_; }

    std::string formatted_message() const {
        std::string msg = what();
        if (depth_ > 0) {
            msg += "\n  Depth: " + std::to_string(depth_);
        }
        if (!path_.empty()) {
            msg += "\n  Element: ";
            for (size_t i = 0; i < path_.size(); i++) {
                msg += "[" + std::to_string(path_[i] + 1) + "]";
            }
        }
        return msg;
    }

private:
    ErrorType type_;
    int depth_;
    std::vector<size_t> path_;
};

// Warning information for aggregated warnings
struct Warning {
    std::string type;
    std::string message;

    Warning(const std::string& t, const std::string& m) : type(t), message(m) {}
};

} // namespace tcllite

#endif // TCL_ERRORS_HPP
