/**
 * @file reduction.cpp
 * @brief openVerify source file.
 */

#include "openverify/data/reduction.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace ovf {

Value reduceSamples(const std::vector<Value>& samples, ReduceMethod method) {
    if (samples.empty()) {
        throw std::invalid_argument("no samples collected in reduction window");
    }
    if (method == ReduceMethod::Latest) {
        return samples.back();
    }

    std::vector<double> numbers;
    numbers.reserve(samples.size());
    for (const auto& sample : samples) {
        const auto number = toNumber(sample);
        if (!number) {
            throw std::invalid_argument(std::string("cannot reduce ") + typeName(sample) +
                                        " sample with method " + toString(method));
        }
        numbers.push_back(*number);
    }

    const auto count = static_cast<double>(numbers.size());
    switch (method) {
    case ReduceMethod::Latest:
        break;
    case ReduceMethod::Average:
        return std::accumulate(numbers.begin(), numbers.end(), 0.0) / count;
    case ReduceMethod::Median: {
        std::sort(numbers.begin(), numbers.end());
        const auto mid = numbers.size() / 2U;
        if ((numbers.size() % 2U) == 0U) {
            return (numbers[mid - 1U] + numbers[mid]) / 2.0;
        }
        return numbers[mid];
    }
    case ReduceMethod::Sum:
        return std::accumulate(numbers.begin(), numbers.end(), 0.0);
    case ReduceMethod::Min:
        return *std::min_element(numbers.begin(), numbers.end());
    case ReduceMethod::Max:
        return *std::max_element(numbers.begin(), numbers.end());
    case ReduceMethod::Std: {
        const auto mean = std::accumulate(numbers.begin(), numbers.end(), 0.0) / count;
        double sumSquares = 0.0;
        for (const auto n : numbers) {
            sumSquares += (n - mean) * (n - mean);
        }
        return std::sqrt(sumSquares / count);
    }
    }
    throw std::invalid_argument("unsupported reduce method");
}

const char* toString(ReduceMethod method) {
    switch (method) {
    case ReduceMethod::Latest:
        return "latest";
    case ReduceMethod::Average:
        return "average";
    case ReduceMethod::Median:
        return "median";
    case ReduceMethod::Sum:
        return "sum";
    case ReduceMethod::Min:
        return "min";
    case ReduceMethod::Max:
        return "max";
    case ReduceMethod::Std:
        return "std";
    }
    return "unknown";
}

std::optional<ReduceMethod> parseReduceMethod(const std::string& text) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "latest" || normalized == "last") {
        return ReduceMethod::Latest;
    }
    if (normalized == "average" || normalized == "mean") {
        return ReduceMethod::Average;
    }
    if (normalized == "median") {
        return ReduceMethod::Median;
    }
    if (normalized == "sum") {
        return ReduceMethod::Sum;
    }
    if (normalized == "min") {
        return ReduceMethod::Min;
    }
    if (normalized == "max") {
        return ReduceMethod::Max;
    }
    if (normalized == "std" || normalized == "stddev") {
        return ReduceMethod::Std;
    }
    return std::nullopt;
}

} // namespace ovf
