/**
 * @file prepared_comparison.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "openverify/check/comparison.hpp"
#include "openverify/core/result.hpp"
#include "openverify/core/value.hpp"
#include "openverify/data/data_cache.hpp"
#include "openverify/data/i_device_database.hpp"
#include "openverify/data/i_signal.hpp"
#include "openverify/data/i_tool.hpp"

namespace ovf {

class PreparedConfiguration;

/**
 * @brief Leaf execution unit: one identifier, one comparison, one live source.
 *
 * `compare()` acquires data through the shared `DataCache`, runs the comparison
 * and stores exactly one `Result` (the last run wins). Acquisition and
 * evaluation faults never escape: they become results.
 */
class PreparedComparison {
public:
    virtual ~PreparedComparison() = default;

    PreparedComparison(const PreparedComparison&) = delete;
    PreparedComparison& operator=(const PreparedComparison&) = delete;

    /**
     * @brief Acquire data, evaluate, store and return the result.
     *
     * Disconnect/timeout maps to the comparison's `ifDisconnected` severity; any
     * other acquisition or evaluation fault maps to `InternalError`.
     */
    Result compare();

    /**
     * @brief Acquire data only (warms the cache), without comparing.
     * @return false with the failure text when acquisition failed.
     */
    bool prefetch(std::string& outError);

    const std::string& identifier() const noexcept { return identifier_; }
    const Comparison& comparison() const noexcept { return *comparison_; }
    const ComparisonPtr& comparisonPtr() const noexcept { return comparison_; }
    const std::optional<std::string>& name() const noexcept { return name_; }
    PreparedConfiguration* parent() const noexcept { return parent_; }
    const std::shared_ptr<DataCache>& cache() const noexcept { return cache_; }
    const std::optional<Result>& result() const noexcept { return result_; }

protected:
    PreparedComparison(std::string identifier,
                       ComparisonPtr comparison,
                       std::shared_ptr<DataCache> cache,
                       PreparedConfiguration* parent,
                       std::optional<std::string> name);

    /**
     * @brief Fetch through the cache and store the acquired data.
     */
    virtual void acquireData() = 0;
    /**
     * @brief Evaluate the stored data; may throw.
     */
    virtual Result evaluate() const = 0;
    virtual void clearData() = 0;

private:
    std::string identifier_;
    ComparisonPtr comparison_;
    std::shared_ptr<DataCache> cache_;
    PreparedConfiguration* parent_ = nullptr;
    std::optional<std::string> name_;
    std::optional<Result> result_;
};

/**
 * @brief Comparison bound to a signal (device attribute or raw control point).
 */
class PreparedSignalComparison final : public PreparedComparison {
public:
    PreparedSignalComparison(std::string identifier,
                             ComparisonPtr comparison,
                             std::shared_ptr<ISignal> signal,
                             std::shared_ptr<IDevice> device,
                             std::shared_ptr<DataCache> cache,
                             PreparedConfiguration* parent = nullptr,
                             std::optional<std::string> name = std::nullopt);

    /**
     * @brief Bind `device.attr`; identifier is "<device>.<attr>".
     * @throws AttributeLookupError when the device has no such attribute.
     */
    static std::unique_ptr<PreparedSignalComparison> fromDevice(const std::shared_ptr<IDevice>& device,
                                                                const std::string& attr,
                                                                ComparisonPtr comparison,
                                                                std::shared_ptr<DataCache> cache,
                                                                PreparedConfiguration* parent = nullptr,
                                                                std::optional<std::string> name = std::nullopt);

    /**
     * @brief Bind a raw control point through the cache's signal table.
     */
    static std::unique_ptr<PreparedSignalComparison> fromPvName(const std::string& pvName,
                                                                ComparisonPtr comparison,
                                                                std::shared_ptr<DataCache> cache,
                                                                PreparedConfiguration* parent = nullptr,
                                                                std::optional<std::string> name = std::nullopt);

    const std::shared_ptr<ISignal>& signal() const noexcept { return signal_; }
    const std::shared_ptr<IDevice>& device() const noexcept { return device_; }
    /**
     * @brief Last acquired value (no data until a fetch succeeded).
     */
    const Value& data() const noexcept { return data_; }

protected:
    void acquireData() override;
    Result evaluate() const override;
    void clearData() override;

private:
    std::shared_ptr<ISignal> signal_;
    std::shared_ptr<IDevice> device_;
    Value data_;
};

/**
 * @brief Comparison on one key of a tool's result.
 */
class PreparedToolComparison final : public PreparedComparison {
public:
    PreparedToolComparison(std::string resultKey,
                           ComparisonPtr comparison,
                           std::shared_ptr<ITool> tool,
                           std::shared_ptr<DataCache> cache,
                           PreparedConfiguration* parent = nullptr,
                           std::optional<std::string> name = std::nullopt);

    /**
     * @brief Bind a result key after validating it against the tool.
     * @throws ResultKeyError when the tool rejects the key.
     */
    static std::unique_ptr<PreparedToolComparison> fromTool(const std::shared_ptr<ITool>& tool,
                                                            const std::string& resultKey,
                                                            ComparisonPtr comparison,
                                                            std::shared_ptr<DataCache> cache,
                                                            PreparedConfiguration* parent = nullptr,
                                                            std::optional<std::string> name = std::nullopt);

    const std::shared_ptr<ITool>& tool() const noexcept { return tool_; }
    /**
     * @brief Last tool result bundle.
     */
    const std::optional<ToolResult>& data() const noexcept { return data_; }

protected:
    void acquireData() override;
    Result evaluate() const override;
    void clearData() override;

private:
    std::shared_ptr<ITool> tool_;
    std::optional<ToolResult> data_;
};

} // namespace ovf
