/**
 * @file value.cpp
 * @brief openVerify source file.
 */

#include "openverify/core/value.hpp"

#include <sstream>

namespace ovf {

std::optional<double> toNumber(const Value& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? 1.0 : 0.0;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    return std::nullopt;
}

std::string toText(const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "None";
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        std::ostringstream os;
        os << *real;
        return os.str();
    }
    return std::get<std::string>(value);
}

const char* typeName(const Value& value) {
    switch (value.index()) {
    case 0:
        return "none";
    case 1:
        return "bool";
    case 2:
        return "int";
    case 3:
        return "float";
    case 4:
        return "string";
    }
    return "unknown";
}

} // namespace ovf
