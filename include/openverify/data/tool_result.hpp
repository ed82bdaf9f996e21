/**
 * @file tool_result.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "openverify/core/value.hpp"

namespace ovf {

/**
 * @brief Structured output of one tool run.
 *
 * Keys are dotted paths, e.g. "num_alive" or "times.10.0.0.1".
 */
class ToolResult {
public:
    void set(const std::string& key, Value value);

    /**
     * @brief Look up one result entry.
     * @return false with a key-not-found message when the key is absent.
     */
    bool lookup(const std::string& key, Value& outValue, std::string& outError) const;

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;
    std::size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, Value> values_;
};

} // namespace ovf
