/**
 * @file data_cache.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "openverify/core/value.hpp"
#include "openverify/data/i_signal.hpp"
#include "openverify/data/i_tool.hpp"
#include "openverify/data/reduction.hpp"

namespace ovf {

/**
 * @brief Acquisition knobs applied to every fetch issued by a cache.
 */
struct CacheOptions {
    /// Connection/reply timeout passed to `ISignal::read()`.
    std::chrono::milliseconds connectionTimeout{1000};
    /// Spacing between samples inside a reduction window.
    std::chrono::milliseconds sampleInterval{100};

    /**
     * @brief Defaults overridden by OVF_CONNECTION_TIMEOUT_MS / OVF_SAMPLE_INTERVAL_MS.
     */
    static CacheOptions fromEnvironment();
};

/**
 * @brief Session-scoped, single-flight store of acquired data.
 *
 * Concurrent requests with the same key share one underlying fetch: the first
 * caller performs it while the others wait on the same `std::shared_future`.
 * Values and failures stay cached until `clear()` so that every comparison in
 * a session observes the same data.
 *
 * Signal keys are (signal identity, reduce period, reduce method, string flag);
 * tool keys are `ITool::key()`.
 */
class DataCache {
public:
    explicit DataCache(std::shared_ptr<ISignalFactory> signalFactory = nullptr,
                       CacheOptions options = {});

    DataCache(const DataCache&) = delete;
    DataCache& operator=(const DataCache&) = delete;

    /**
     * @brief Shared signal handle for a raw control-point name.
     * @throws std::runtime_error when the cache has no signal factory.
     */
    std::shared_ptr<ISignal> signalFor(const std::string& pvName);

    /**
     * @brief Current (optionally reduced) value of a signal.
     *
     * @param signal Signal to read.
     * @param reducePeriod Sampling window; a single read when unset or zero.
     * @param reduceMethod Method applied to the window's samples.
     * @param asString Coerce the final value to text.
     * @throws ConnectionTimeoutError when the signal cannot be reached.
     */
    Value getSignalData(const std::shared_ptr<ISignal>& signal,
                        std::optional<std::chrono::milliseconds> reducePeriod = std::nullopt,
                        ReduceMethod reduceMethod = ReduceMethod::Average,
                        bool asString = false);

    /**
     * @brief Result of running a tool, shared between equal tool specifications.
     */
    ToolResult getToolData(const std::shared_ptr<ITool>& tool);

    /**
     * @brief Drop all cached values and failures (signal handles are kept).
     */
    void clear();

    /**
     * @brief Number of underlying signal reads and tool runs started so far.
     */
    std::uint64_t fetchCount() const noexcept;

    const CacheOptions& options() const noexcept;

private:
    struct SignalKey {
        std::shared_ptr<ISignal> signal;
        std::int64_t reducePeriodMs = 0;
        ReduceMethod reduceMethod = ReduceMethod::Average;
        bool asString = false;

        bool operator<(const SignalKey& other) const;
    };

    Value fetchSignal(ISignal& signal,
                      std::optional<std::chrono::milliseconds> reducePeriod,
                      ReduceMethod reduceMethod,
                      bool asString);
    void trace(const std::string& line) const;

    std::shared_ptr<ISignalFactory> signalFactory_;
    CacheOptions options_{};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ISignal>> signals_;
    std::map<SignalKey, std::shared_future<Value>> signalData_;
    std::map<std::string, std::shared_future<ToolResult>> toolData_;
    std::atomic<std::uint64_t> fetchCount_{0};
    bool traceCache_ = false;
};

} // namespace ovf
