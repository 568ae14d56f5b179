#include "checkkit/numeric.hpp"
#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <cstdint>
#include <spdlog/spdlog.h>

#include "checkkit/error_codes.hpp"

namespace checkkit {

namespace {

// 96-bit scaled decimal, 2^96 - 1
constexpr double DECIMAL_MAX = 79228162514264337593543950335.0;

template <typename T>
std::pair<double, double> rangeOf() {
    return { static_cast<double>(std::numeric_limits<T>::lowest()),
             static_cast<double>(std::numeric_limits<T>::max()) };
}

const std::map<type_code, std::pair<double, double>>& ranges() {
    static const std::map<type_code, std::pair<double, double>> table = {
        {type_code::Byte, rangeOf<uint8_t>()},
        {type_code::SByte, rangeOf<int8_t>()},
        {type_code::UInt16, rangeOf<uint16_t>()},
        {type_code::UInt32, rangeOf<uint32_t>()},
        {type_code::UInt64, rangeOf<uint64_t>()},
        {type_code::Int16, rangeOf<int16_t>()},
        {type_code::Int32, rangeOf<int32_t>()},
        {type_code::Int64, rangeOf<int64_t>()},
        {type_code::Decimal, {-DECIMAL_MAX, DECIMAL_MAX}},
        {type_code::Double, rangeOf<double>()},
        {type_code::Single, rangeOf<float>()},
    };
    return table;
}

const std::map<std::string, type_code>& names() {
    static const std::map<std::string, type_code> table = {
        {"empty", type_code::Empty},
        {"object", type_code::Object},
        {"dbnull", type_code::DBNull},
        {"boolean", type_code::Boolean},
        {"bool", type_code::Boolean},
        {"char", type_code::Char},
        {"sbyte", type_code::SByte},
        {"int8", type_code::SByte},
        {"byte", type_code::Byte},
        {"uint8", type_code::Byte},
        {"int16", type_code::Int16},
        {"uint16", type_code::UInt16},
        {"int32", type_code::Int32},
        {"uint32", type_code::UInt32},
        {"int64", type_code::Int64},
        {"uint64", type_code::UInt64},
        {"single", type_code::Single},
        {"float", type_code::Single},
        {"double", type_code::Double},
        {"decimal", type_code::Decimal},
        {"datetime", type_code::DateTime},
        {"string", type_code::String},
    };
    return table;
}

const std::pair<double, double>& lookupRange(const std::optional<type_code> &type) {
    if (!type) {
        spdlog::warn("type lookup with null type");
        throw validation_error(error::NULL_INPUT, "Specified data type is a null reference");
    }
    auto it = ranges().find(*type);
    if (it == ranges().end()) {
        std::string detail = "Specified data type is not supported: " + typeCodeName(*type);
        spdlog::warn("{}", detail);
        throw validation_error(error::UNSUPPORTED_TYPE, detail);
    }
    return it->second;
}

void validateTolerance(double tolerance) {
    if (!(tolerance >= 0.0)) {
        std::string detail = "Tolerance shall not be negative: " + std::to_string(tolerance);
        spdlog::warn("{}", detail);
        throw validation_error(error::INVALID_INPUT, detail);
    }
}

} // namespace

double typeMaxValue(const std::optional<type_code> &type) {
    return lookupRange(type).second;
}

double typeMinValue(const std::optional<type_code> &type) {
    return lookupRange(type).first;
}

type_code typeCodeFromName(const std::string &name) {
    auto it = names().find(name);
    if (it == names().end()) {
        spdlog::warn("unknown type name: '{}'", name);
        throw validation_error(error::UNSUPPORTED_TYPE, "Specified data type is not supported: " + name);
    }
    return it->second;
}

std::string typeCodeName(type_code type) {
    switch (type) {
    case type_code::Empty: return "empty";
    case type_code::Object: return "object";
    case type_code::DBNull: return "dbnull";
    case type_code::Boolean: return "boolean";
    case type_code::Char: return "char";
    case type_code::SByte: return "sbyte";
    case type_code::Byte: return "byte";
    case type_code::Int16: return "int16";
    case type_code::UInt16: return "uint16";
    case type_code::Int32: return "int32";
    case type_code::UInt32: return "uint32";
    case type_code::Int64: return "int64";
    case type_code::UInt64: return "uint64";
    case type_code::Single: return "single";
    case type_code::Double: return "double";
    case type_code::Decimal: return "decimal";
    case type_code::DateTime: return "datetime";
    case type_code::String: return "string";
    }
    return "unknown";
}

bool areEqual(double a, double b, double tolerance) {
    validateTolerance(tolerance);
    // equal infinities have no finite difference
    if (a == b) return true;
    return std::fabs(a - b) <= tolerance;
}

bool smallerOrEqual(double value, double reference, double tolerance) {
    return areEqual(value, reference, tolerance) || value < reference;
}

bool greaterOrEqual(double value, double reference, double tolerance) {
    return areEqual(value, reference, tolerance) || value > reference;
}

} // namespace checkkit
