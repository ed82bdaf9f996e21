/**
 * @file tool_result.cpp
 * @brief openVerify source file.
 */

#include "openverify/data/tool_result.hpp"

#include <utility>

namespace ovf {

void ToolResult::set(const std::string& key, Value value) {
    values_[key] = std::move(value);
}

bool ToolResult::lookup(const std::string& key, Value& outValue, std::string& outError) const {
    const auto it = values_.find(key);
    if (it == values_.end()) {
        outError = "Key not found in tool result: " + key;
        return false;
    }
    outValue = it->second;
    return true;
}

bool ToolResult::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ToolResult::keys() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& entry : values_) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace ovf
