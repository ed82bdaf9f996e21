/**
 * @file value.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ovf {

/**
 * @brief Dynamically typed value read from a control point or tool result.
 *
 * `std::monostate` is the "no data" sentinel and is distinct from falsy values
 * such as `false`, `0` or an empty string.
 */
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

inline bool isNoData(const Value& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Numeric view of a value (bool and integers widen to double).
 */
std::optional<double> toNumber(const Value& value);

/**
 * @brief Text rendering used for string coercion and result reasons.
 */
std::string toText(const Value& value);

/**
 * @brief Type name of the held alternative, e.g. "int" or "string".
 */
const char* typeName(const Value& value);

} // namespace ovf
