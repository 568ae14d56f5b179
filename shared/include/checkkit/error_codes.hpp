#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>

namespace checkkit {

class error_code {
public:
    error_code(uint32_t code, const std::string &what);
    bool operator==(const error_code &rhs) const;
    bool operator!=(const error_code &rhs) const;
    operator bool() const;
    const std::string& what() const;
    uint32_t code() const;

private:
    uint32_t _code;
    std::string _what;
};

namespace error {
    inline const error_code SUCCESS(0, "success");

    inline const error_code NULL_INPUT(1000, "null input");
    inline const error_code INVALID_INPUT(1001, "invalid input");

    inline const error_code NOT_FOUND(1100, "not found");
    inline const error_code ALREADY_EXISTS(1101, "already exists");
    inline const error_code INVALID_EXTENSION(1102, "invalid extension");

    inline const error_code UNSUPPORTED_TYPE(1200, "unsupported type");

    inline const error_code JSON_PARSE_ERROR(1400, "json parse error");
    inline const error_code JSON_TYPE_ERROR(1401, "json type error");
    inline const error_code UNKNOWN_COMMAND(1402, "unknown command");
    inline const error_code MISSING_ARGUMENT(1403, "missing argument");
}

// Raised by every validator in this library. what() carries the detail
// ("Directory does not exist: /tmp/x"), code() the category.
class validation_error : public std::runtime_error {
public:
    validation_error(const error_code &code, const std::string &detail);
    const error_code& code() const noexcept;

private:
    error_code _code;
};

} // namespace checkkit
