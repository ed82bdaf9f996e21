/**
 * @file configuration_validator.cpp
 * @brief openVerify source file.
 */

#include "openverify/config/configuration_validator.hpp"

#include <sstream>
#include <unordered_set>

namespace ovf {
namespace {

void checkComparisons(const std::string& owner,
                      const ComparisonMap& byIdentifier,
                      const ComparisonList& shared,
                      std::vector<ValidationIssue>& issues) {
    if (byIdentifier.empty()) {
        issues.push_back({ValidationSeverity::Warning, owner + " has no identifiers to check"});
    }

    for (const auto& entry : byIdentifier) {
        if (entry.first.empty()) {
            issues.push_back({ValidationSeverity::Error, owner + " has an empty identifier"});
        }
        if (entry.second.empty() && shared.empty()) {
            issues.push_back({ValidationSeverity::Warning,
                              owner + " identifier '" + entry.first + "' has no comparisons"});
        }
        for (const auto& comparison : entry.second) {
            if (!comparison) {
                issues.push_back({ValidationSeverity::Error,
                                  owner + " identifier '" + entry.first + "' has a null comparison"});
            }
        }
    }

    for (const auto& comparison : shared) {
        if (!comparison) {
            issues.push_back({ValidationSeverity::Error, owner + " has a null shared comparison"});
        }
    }
}

} // namespace

std::vector<ValidationIssue> ConfigurationValidator::validate(const ConfigurationFile& file) {
    std::vector<ValidationIssue> issues;

    if (file.version() != 0) {
        std::ostringstream os;
        os << "Unsupported configuration file version " << file.version();
        issues.push_back({ValidationSeverity::Error, os.str()});
    }

    for (const auto& config : file.walkConfigs()) {
        const auto owner = config.describe();

        if (const auto* group = config.as<ConfigurationGroup>()) {
            if (group->configs.empty()) {
                issues.push_back({ValidationSeverity::Warning, owner + " contains no configurations"});
            }
            if (group->mode != GroupResultMode::All && group->mode != GroupResultMode::Any) {
                issues.push_back({ValidationSeverity::Error, owner + " has an unknown result mode"});
            }
            continue;
        }

        if (const auto* device = config.as<DeviceConfiguration>()) {
            if (device->devices.empty()) {
                issues.push_back({ValidationSeverity::Error, owner + " names no devices"});
            }
            std::unordered_set<std::string> seen;
            for (const auto& name : device->devices) {
                if (!seen.insert(name).second) {
                    issues.push_back({ValidationSeverity::Warning,
                                      owner + " lists device '" + name + "' more than once"});
                }
            }
            checkComparisons(owner, device->byAttr, device->shared, issues);
            continue;
        }

        if (const auto* pv = config.as<PvConfiguration>()) {
            checkComparisons(owner, pv->byPv, pv->shared, issues);
            continue;
        }

        if (const auto* tool = config.as<ToolConfiguration>()) {
            if (!tool->tool) {
                issues.push_back({ValidationSeverity::Error, owner + " has no tool"});
            } else {
                for (const auto& entry : tool->byAttr) {
                    std::string keyError;
                    if (!tool->tool->validateResultKey(entry.first, keyError)) {
                        issues.push_back({ValidationSeverity::Error, owner + ": " + keyError});
                    }
                }
            }
            checkComparisons(owner, tool->byAttr, tool->shared, issues);
        }
    }

    return issues;
}

bool ConfigurationValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace ovf
