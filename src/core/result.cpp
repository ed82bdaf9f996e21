/**
 * @file result.cpp
 * @brief openVerify source file.
 */

#include "openverify/core/result.hpp"

#include <algorithm>
#include <cctype>

namespace ovf {
namespace {

std::string normalize(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (const auto c : text) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

} // namespace

Severity maxSeverity(Severity a, Severity b) noexcept {
    return (static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b)) ? a : b;
}

Severity minSeverity(Severity a, Severity b) noexcept {
    return (static_cast<std::uint8_t>(a) <= static_cast<std::uint8_t>(b)) ? a : b;
}

Severity combineSeverities(GroupResultMode mode, const std::vector<std::optional<Result>>& results) {
    const bool anyMissing = std::any_of(results.begin(), results.end(),
                                        [](const std::optional<Result>& result) { return !result.has_value(); });
    if (anyMissing) {
        return Severity::Error;
    }

    switch (mode) {
    case GroupResultMode::All: {
        auto severity = Severity::Success;
        for (const auto& result : results) {
            severity = maxSeverity(severity, result->severity);
        }
        return severity;
    }
    case GroupResultMode::Any: {
        if (results.empty()) {
            return Severity::Success;
        }
        auto severity = Severity::InternalError;
        for (const auto& result : results) {
            severity = minSeverity(severity, result->severity);
        }
        return severity;
    }
    }
    return Severity::InternalError;
}

const char* toString(Severity severity) {
    switch (severity) {
    case Severity::Success:
        return "success";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    case Severity::InternalError:
        return "internal_error";
    }
    return "unknown";
}

const char* toString(GroupResultMode mode) {
    switch (mode) {
    case GroupResultMode::All:
        return "all";
    case GroupResultMode::Any:
        return "any";
    }
    return "unknown";
}

std::optional<Severity> parseSeverity(const std::string& text) {
    const auto normalized = normalize(text);
    if (normalized == "success" || normalized == "ok") {
        return Severity::Success;
    }
    if (normalized == "warning" || normalized == "warn") {
        return Severity::Warning;
    }
    if (normalized == "error") {
        return Severity::Error;
    }
    if (normalized == "internalerror") {
        return Severity::InternalError;
    }
    return std::nullopt;
}

std::optional<GroupResultMode> parseGroupResultMode(const std::string& text) {
    const auto normalized = normalize(text);
    if (normalized == "all") {
        return GroupResultMode::All;
    }
    if (normalized == "any") {
        return GroupResultMode::Any;
    }
    return std::nullopt;
}

} // namespace ovf
