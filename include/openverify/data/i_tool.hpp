/**
 * @file i_tool.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <string>

#include "openverify/data/tool_result.hpp"

namespace ovf {

/**
 * @brief Tool specification run as a data source (e.g. a ping reachability check).
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Identity used by `DataCache` to share one run between equal tool specs.
     */
    virtual std::string key() const = 0;

    /**
     * @brief Human-readable description for result reasons.
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Check that `resultKey` is legal for this tool's result schema.
     */
    virtual bool validateResultKey(const std::string& resultKey, std::string& outError) const = 0;

    /**
     * @brief Run the tool.
     * @throws ConnectionTimeoutError when the tool cannot reach its targets.
     */
    virtual ToolResult run() = 0;
};

} // namespace ovf
