/**
 * @file configuration_validator.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <string>
#include <vector>

#include "openverify/config/configuration.hpp"

namespace ovf {

/**
 * @brief Severity level for configuration validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One configuration validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Static checks on a `ConfigurationFile` before it is prepared.
 *
 * Checks include the file version, empty device lists, missing tools and
 * comparisons, tool result keys rejected by their tool, and checks or groups
 * that would contribute nothing to the result.
 */
class ConfigurationValidator {
public:
    /**
     * @brief Perform validation and return all findings.
     */
    static std::vector<ValidationIssue> validate(const ConfigurationFile& file);
    /**
     * @brief Convenience predicate to detect if any issue is fatal.
     */
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace ovf
