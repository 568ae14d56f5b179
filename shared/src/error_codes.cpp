#include "checkkit/error_codes.hpp"

namespace checkkit {

error_code::error_code(uint32_t code, const std::string &what)
    :_code(code), _what(what) {}

bool error_code::operator==(const error_code &rhs) const {
    return _code == rhs._code;
}

bool error_code::operator!=(const error_code &rhs) const {
    return !(*this == rhs);
}

error_code::operator bool() const {
    return _code != 0;
}

const std::string& error_code::what() const {
    return _what;
}

uint32_t error_code::code() const {
    return _code;
}

validation_error::validation_error(const error_code &code, const std::string &detail)
    :std::runtime_error(detail), _code(code) {}

const error_code& validation_error::code() const noexcept {
    return _code;
}

} // namespace checkkit
