/**
 * @file result.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ovf {

/**
 * @brief Ordered outcome level of a check.
 *
 * The numeric order is the aggregation order: Success < Warning < Error < InternalError.
 */
enum class Severity : std::uint8_t {
    Success = 0,
    Warning = 1,
    Error = 2,
    InternalError = 3,
};

/**
 * @brief How a group folds the severities of its children.
 */
enum class GroupResultMode : std::uint8_t {
    All = 0,
    Any = 1,
};

/**
 * @brief Outcome of one comparison, configuration or group.
 */
struct Result {
    Severity severity = Severity::Success;
    std::string reason;
};

/**
 * @brief Fold child results into one severity.
 *
 * An absent entry (a child that produced no result) forces `Error`. Otherwise
 * `All` takes the maximum severity and `Any` the minimum. An empty list folds to
 * `Success`; an unknown mode value yields `InternalError`.
 */
Severity combineSeverities(GroupResultMode mode, const std::vector<std::optional<Result>>& results);

Severity maxSeverity(Severity a, Severity b) noexcept;
Severity minSeverity(Severity a, Severity b) noexcept;

const char* toString(Severity severity);
const char* toString(GroupResultMode mode);
std::optional<Severity> parseSeverity(const std::string& text);
std::optional<GroupResultMode> parseGroupResultMode(const std::string& text);

} // namespace ovf
