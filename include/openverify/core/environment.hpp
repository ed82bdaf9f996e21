/**
 * @file environment.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace ovf {

/**
 * @brief Read a boolean switch (1/0, true/false, on/off); unset or invalid yields the default.
 */
bool parseBoolEnv(const char* name, bool defaultValue);

/**
 * @brief True when the variable is set at all, used for trace switches.
 */
inline bool envFlagSet(const char* name) {
    return std::getenv(name) != nullptr;
}

template <typename T>
T parseIntegralEnv(const char* name, T defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    try {
        if constexpr (std::is_signed<T>::value) {
            return static_cast<T>(std::stoll(value, nullptr, 0));
        } else {
            return static_cast<T>(std::stoull(value, nullptr, 0));
        }
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

} // namespace ovf
