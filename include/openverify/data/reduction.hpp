/**
 * @file reduction.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "openverify/core/value.hpp"

namespace ovf {

/**
 * @brief Method used to collapse time-windowed samples into one value.
 */
enum class ReduceMethod {
    Latest,
    Average,
    Median,
    Sum,
    Min,
    Max,
    Std,
};

/**
 * @brief Reduce samples collected over a window.
 *
 * `Latest` returns the last sample unchanged and accepts any type. All other
 * methods need numeric samples and return a double.
 *
 * @throws std::invalid_argument for an empty window or non-numeric samples.
 */
Value reduceSamples(const std::vector<Value>& samples, ReduceMethod method);

const char* toString(ReduceMethod method);
std::optional<ReduceMethod> parseReduceMethod(const std::string& text);

} // namespace ovf
