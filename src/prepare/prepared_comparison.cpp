/**
 * @file prepared_comparison.cpp
 * @brief openVerify source file.
 */

#include "openverify/prepare/prepared_comparison.hpp"

#include <stdexcept>

#include "openverify/core/errors.hpp"

namespace ovf {

PreparedComparison::PreparedComparison(std::string identifier,
                                       ComparisonPtr comparison,
                                       std::shared_ptr<DataCache> cache,
                                       PreparedConfiguration* parent,
                                       std::optional<std::string> name)
    : identifier_(std::move(identifier)),
      comparison_(std::move(comparison)),
      cache_(cache ? std::move(cache) : std::make_shared<DataCache>()),
      parent_(parent),
      name_(std::move(name)) {
    if (!comparison_) {
        throw std::invalid_argument("Comparison unset for identifier: " + identifier_);
    }
}

Result PreparedComparison::compare() {
    clearData();

    try {
        acquireData();
    } catch (const ConnectionTimeoutError&) {
        result_ = Result{comparison_->policy().ifDisconnected,
                         "Unable to retrieve data for comparison: " + identifier_};
        return *result_;
    } catch (const std::exception& ex) {
        result_ = Result{Severity::InternalError,
                         "Getting data for '" + identifier_ + "' comparison " + comparison_->describe() +
                             " raised " + describeException(ex)};
        return *result_;
    } catch (...) {
        result_ = Result{Severity::InternalError,
                         "Getting data for '" + identifier_ + "' comparison " + comparison_->describe() +
                             " raised an unknown exception"};
        return *result_;
    }

    try {
        result_ = evaluate();
    } catch (const std::exception& ex) {
        result_ = Result{Severity::InternalError,
                         "Failed to run '" + identifier_ + "' comparison " + comparison_->describe() +
                             " raised " + describeException(ex)};
    } catch (...) {
        result_ = Result{Severity::InternalError,
                         "Failed to run '" + identifier_ + "' comparison " + comparison_->describe() +
                             " raised an unknown exception"};
    }
    return *result_;
}

bool PreparedComparison::prefetch(std::string& outError) {
    try {
        acquireData();
        return true;
    } catch (const std::exception& ex) {
        outError = identifier_ + ": " + describeException(ex);
    } catch (...) {
        outError = identifier_ + ": unknown exception";
    }
    return false;
}

PreparedSignalComparison::PreparedSignalComparison(std::string identifier,
                                                   ComparisonPtr comparison,
                                                   std::shared_ptr<ISignal> signal,
                                                   std::shared_ptr<IDevice> device,
                                                   std::shared_ptr<DataCache> cache,
                                                   PreparedConfiguration* parent,
                                                   std::optional<std::string> name)
    : PreparedComparison(std::move(identifier), std::move(comparison), std::move(cache), parent, std::move(name)),
      signal_(std::move(signal)),
      device_(std::move(device)) {}

std::unique_ptr<PreparedSignalComparison> PreparedSignalComparison::fromDevice(
    const std::shared_ptr<IDevice>& device,
    const std::string& attr,
    ComparisonPtr comparison,
    std::shared_ptr<DataCache> cache,
    PreparedConfiguration* parent,
    std::optional<std::string> name) {
    if (!device) {
        throw std::invalid_argument("Device unset for attribute: " + attr);
    }
    const auto fullAttr = device->name() + "." + attr;
    auto signal = device->attribute(attr);
    if (!signal) {
        throw AttributeLookupError("Attribute " + fullAttr + " does not exist on device " + device->name());
    }
    return std::make_unique<PreparedSignalComparison>(fullAttr, std::move(comparison), std::move(signal), device,
                                                      std::move(cache), parent, std::move(name));
}

std::unique_ptr<PreparedSignalComparison> PreparedSignalComparison::fromPvName(
    const std::string& pvName,
    ComparisonPtr comparison,
    std::shared_ptr<DataCache> cache,
    PreparedConfiguration* parent,
    std::optional<std::string> name) {
    if (!cache) {
        cache = std::make_shared<DataCache>();
    }
    auto signal = cache->signalFor(pvName);
    return std::make_unique<PreparedSignalComparison>(pvName, std::move(comparison), std::move(signal), nullptr,
                                                      std::move(cache), parent, std::move(name));
}

void PreparedSignalComparison::acquireData() {
    const auto& policy = comparison().policy();
    data_ = cache()->getSignalData(signal_, policy.reducePeriod, policy.reduceMethod, policy.string);
}

Result PreparedSignalComparison::evaluate() const {
    if (isNoData(data_)) {
        // Missing data is never fed to a predicate.
        return Result{comparison().policy().ifDisconnected,
                      "No data available for signal '" + identifier() + "' in comparison " +
                          comparison().describe()};
    }
    return comparison().compare(data_, identifier());
}

void PreparedSignalComparison::clearData() { data_ = std::monostate{}; }

PreparedToolComparison::PreparedToolComparison(std::string resultKey,
                                               ComparisonPtr comparison,
                                               std::shared_ptr<ITool> tool,
                                               std::shared_ptr<DataCache> cache,
                                               PreparedConfiguration* parent,
                                               std::optional<std::string> name)
    : PreparedComparison(std::move(resultKey), std::move(comparison), std::move(cache), parent, std::move(name)),
      tool_(std::move(tool)) {
    if (!tool_) {
        throw std::invalid_argument("Tool unset for result key: " + identifier());
    }
}

std::unique_ptr<PreparedToolComparison> PreparedToolComparison::fromTool(const std::shared_ptr<ITool>& tool,
                                                                         const std::string& resultKey,
                                                                         ComparisonPtr comparison,
                                                                         std::shared_ptr<DataCache> cache,
                                                                         PreparedConfiguration* parent,
                                                                         std::optional<std::string> name) {
    if (!tool) {
        throw std::invalid_argument("Tool unset for result key: " + resultKey);
    }
    std::string keyError;
    if (!tool->validateResultKey(resultKey, keyError)) {
        throw ResultKeyError(keyError);
    }
    return std::make_unique<PreparedToolComparison>(resultKey, std::move(comparison), tool, std::move(cache), parent,
                                                    std::move(name));
}

void PreparedToolComparison::acquireData() {
    data_ = cache()->getToolData(tool_);
}

Result PreparedToolComparison::evaluate() const {
    Value value;
    std::string lookupError;
    if (!data_ || !data_->lookup(identifier(), value, lookupError)) {
        std::string reason = "Provided key is invalid for tool result " + tool_->describe() + " '" + identifier() + "'";
        if (name().has_value()) {
            reason += " (" + *name() + ")";
        }
        reason += ": " + lookupError + " (in comparison " + comparison().describe() + ")";
        return Result{comparison().policy().severityOnFailure, reason};
    }
    if (isNoData(value)) {
        return Result{comparison().policy().ifDisconnected,
                      "No data available for tool result " + tool_->describe() + " '" + identifier() +
                          "' in comparison " + comparison().describe()};
    }
    return comparison().compare(value, identifier());
}

void PreparedToolComparison::clearData() { data_.reset(); }

} // namespace ovf
