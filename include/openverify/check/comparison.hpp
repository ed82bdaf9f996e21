/**
 * @file comparison.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "openverify/core/result.hpp"
#include "openverify/core/value.hpp"
#include "openverify/data/reduction.hpp"

namespace ovf {

/**
 * @brief Policy fields shared by every comparison.
 */
struct ComparisonPolicy {
    std::optional<std::string> name;
    std::optional<std::string> description;
    /// Severity reported when the data source is unreachable or has no data.
    Severity ifDisconnected = Severity::Error;
    /// Severity reported when the check fails (or a tool result key is missing).
    Severity severityOnFailure = Severity::Error;
    /// Sampling window for reduced reads; a single read when unset.
    std::optional<std::chrono::milliseconds> reducePeriod;
    ReduceMethod reduceMethod = ReduceMethod::Average;
    /// Compare the textual form of the value.
    bool string = false;
};

/**
 * @brief Predicate evaluated against one acquired value.
 *
 * Implementations are immutable after construction and may be evaluated from
 * several worker threads at once. Throwing from `compare()` is tolerated: the
 * calling leaf converts it to an internal error.
 */
class Comparison {
public:
    explicit Comparison(ComparisonPolicy policy = {});
    virtual ~Comparison() = default;

    virtual Result compare(const Value& value, const std::string& identifier) const = 0;
    virtual std::string describe() const = 0;

    const ComparisonPolicy& policy() const noexcept { return policy_; }

protected:
    std::string label() const;

private:
    ComparisonPolicy policy_;
};

using ComparisonPtr = std::shared_ptr<const Comparison>;
using ComparisonList = std::vector<ComparisonPtr>;

/**
 * @brief Value equality; numbers compare within an absolute tolerance.
 */
class Equals final : public Comparison {
public:
    explicit Equals(Value expected, double tolerance = 0.0, ComparisonPolicy policy = {});

    Result compare(const Value& value, const std::string& identifier) const override;
    std::string describe() const override;

private:
    Value expected_;
    double tolerance_ = 0.0;
};

/**
 * @brief Inclusive numeric range with an optional inner warning band.
 *
 * Outside [low, high] fails with `severityOnFailure`; inside but outside
 * [warnLow, warnHigh] reports `Warning`. Non-numeric values throw.
 */
class Range final : public Comparison {
public:
    Range(double low, double high, ComparisonPolicy policy = {});

    Range& withWarningBand(double warnLow, double warnHigh);

    Result compare(const Value& value, const std::string& identifier) const override;
    std::string describe() const override;

private:
    double low_ = 0.0;
    double high_ = 0.0;
    std::optional<double> warnLow_;
    std::optional<double> warnHigh_;
};

} // namespace ovf
