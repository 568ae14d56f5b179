#pragma once
#include <string>
#include <optional>

namespace checkkit {

// runtime type kinds; only the numeric kinds carry a range
enum class type_code {
    Empty = 0, Object, DBNull, Boolean, Char,
    SByte, Byte, Int16, UInt16, Int32, UInt32, Int64, UInt64,
    Single, Double, Decimal,
    DateTime, String
};

// Range lookup. Throws validation_error: NULL_INPUT for a null type,
// UNSUPPORTED_TYPE for a kind without a numeric range.
double typeMaxValue(const std::optional<type_code> &type);
double typeMinValue(const std::optional<type_code> &type);

// "int32", "uint8", "float", ... ; UNSUPPORTED_TYPE for unknown names
type_code typeCodeFromName(const std::string &name);
std::string typeCodeName(type_code type);

// Tolerance comparisons. A negative (or NaN) tolerance throws
// validation_error with INVALID_INPUT. NaN never compares equal.
bool areEqual(double a, double b, double tolerance = 0.0);
bool smallerOrEqual(double value, double reference, double tolerance = 0.0);
bool greaterOrEqual(double value, double reference, double tolerance = 0.0);

} // namespace checkkit
