/**
 * @file comparison.cpp
 * @brief openVerify source file.
 */

#include "openverify/check/comparison.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace ovf {

Comparison::Comparison(ComparisonPolicy policy) : policy_(std::move(policy)) {}

std::string Comparison::label() const {
    return policy_.name.has_value() ? (" '" + *policy_.name + "'") : std::string();
}

Equals::Equals(Value expected, double tolerance, ComparisonPolicy policy)
    : Comparison(std::move(policy)), expected_(std::move(expected)), tolerance_(tolerance) {}

Result Equals::compare(const Value& value, const std::string& identifier) const {
    bool equal = false;
    const auto actualNumber = toNumber(value);
    const auto expectedNumber = toNumber(expected_);
    if (actualNumber && expectedNumber) {
        equal = std::fabs(*actualNumber - *expectedNumber) <= tolerance_;
    } else {
        equal = (toText(value) == toText(expected_)) && (value.index() == expected_.index());
    }

    if (equal) {
        return {Severity::Success, ""};
    }
    std::ostringstream os;
    os << identifier << ": value " << toText(value) << " != expected " << toText(expected_);
    if (tolerance_ > 0.0) {
        os << " (tolerance " << tolerance_ << ")";
    }
    return {policy().severityOnFailure, os.str()};
}

std::string Equals::describe() const {
    std::ostringstream os;
    os << "Equals" << label() << "(expected=" << toText(expected_);
    if (tolerance_ > 0.0) {
        os << ", tolerance=" << tolerance_;
    }
    os << ")";
    return os.str();
}

Range::Range(double low, double high, ComparisonPolicy policy)
    : Comparison(std::move(policy)), low_(low), high_(high) {
    if (low_ > high_) {
        throw std::invalid_argument("Range low bound exceeds high bound");
    }
}

Range& Range::withWarningBand(double warnLow, double warnHigh) {
    warnLow_ = warnLow;
    warnHigh_ = warnHigh;
    return *this;
}

Result Range::compare(const Value& value, const std::string& identifier) const {
    const auto number = toNumber(value);
    if (!number) {
        throw std::invalid_argument(std::string("Range needs a numeric value, got ") + typeName(value));
    }

    if (*number < low_ || *number > high_) {
        std::ostringstream os;
        os << identifier << ": value " << *number << " outside [" << low_ << ", " << high_ << "]";
        return {policy().severityOnFailure, os.str()};
    }
    if ((warnLow_ && *number < *warnLow_) || (warnHigh_ && *number > *warnHigh_)) {
        std::ostringstream os;
        os << identifier << ": value " << *number << " outside warning band";
        return {Severity::Warning, os.str()};
    }
    return {Severity::Success, ""};
}

std::string Range::describe() const {
    std::ostringstream os;
    os << "Range" << label() << "(low=" << low_ << ", high=" << high_ << ")";
    return os.str();
}

} // namespace ovf
