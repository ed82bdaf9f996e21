/**
 * @file data_cache.cpp
 * @brief openVerify source file.
 */

#include "openverify/data/data_cache.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "openverify/core/environment.hpp"

namespace ovf {
namespace {

// The first caller for a key owns the fetch; everyone else waits on its future.
template <typename Key, typename T, typename Fetch>
T singleFlight(std::mutex& mutex,
               std::map<Key, std::shared_future<T>>& entries,
               const Key& key,
               Fetch&& fetch,
               bool& outShared) {
    std::promise<T> promise;
    std::shared_future<T> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = entries.find(key);
        if (it != entries.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            entries.emplace(key, future);
            owner = true;
        }
    }

    outShared = !owner;
    if (owner) {
        try {
            promise.set_value(fetch());
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
    return future.get();
}

} // namespace

CacheOptions CacheOptions::fromEnvironment() {
    CacheOptions options;
    options.connectionTimeout = std::chrono::milliseconds(
        parseIntegralEnv<std::int64_t>("OVF_CONNECTION_TIMEOUT_MS", options.connectionTimeout.count()));
    options.sampleInterval = std::chrono::milliseconds(
        parseIntegralEnv<std::int64_t>("OVF_SAMPLE_INTERVAL_MS", options.sampleInterval.count()));
    if (options.connectionTimeout.count() <= 0) {
        options.connectionTimeout = CacheOptions{}.connectionTimeout;
    }
    if (options.sampleInterval.count() <= 0) {
        options.sampleInterval = CacheOptions{}.sampleInterval;
    }
    return options;
}

bool DataCache::SignalKey::operator<(const SignalKey& other) const {
    if (signal.get() != other.signal.get()) {
        return signal.get() < other.signal.get();
    }
    if (reducePeriodMs != other.reducePeriodMs) {
        return reducePeriodMs < other.reducePeriodMs;
    }
    if (reduceMethod != other.reduceMethod) {
        return reduceMethod < other.reduceMethod;
    }
    return asString < other.asString;
}

DataCache::DataCache(std::shared_ptr<ISignalFactory> signalFactory, CacheOptions options)
    : signalFactory_(std::move(signalFactory)),
      options_(options),
      traceCache_(envFlagSet("OVF_TRACE_CACHE")) {}

std::shared_ptr<ISignal> DataCache::signalFor(const std::string& pvName) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = signals_.find(pvName);
    if (it != signals_.end()) {
        return it->second;
    }
    if (!signalFactory_) {
        throw std::runtime_error("No signal factory configured for point: " + pvName);
    }
    auto signal = signalFactory_->create(pvName);
    if (!signal) {
        throw std::runtime_error("Signal factory returned no handle for point: " + pvName);
    }
    signals_.emplace(pvName, signal);
    return signal;
}

Value DataCache::getSignalData(const std::shared_ptr<ISignal>& signal,
                               std::optional<std::chrono::milliseconds> reducePeriod,
                               ReduceMethod reduceMethod,
                               bool asString) {
    if (!signal) {
        throw std::invalid_argument("Signal instance unset");
    }

    SignalKey key;
    key.signal = signal;
    key.reducePeriodMs = (reducePeriod.has_value() && reducePeriod->count() > 0) ? reducePeriod->count() : 0;
    // Without a window the method does not change what is read.
    key.reduceMethod = (key.reducePeriodMs > 0) ? reduceMethod : ReduceMethod::Latest;
    key.asString = asString;

    bool shared = false;
    auto value = singleFlight(mutex_, signalData_, key, [&]() {
        ++fetchCount_;
        if (traceCache_) {
            std::ostringstream os;
            os << "[ovf-cache] fetch signal=" << signal->name()
               << " period_ms=" << key.reducePeriodMs
               << " method=" << toString(key.reduceMethod)
               << " string=" << (asString ? 1 : 0) << '\n';
            trace(os.str());
        }
        return fetchSignal(*signal, reducePeriod, key.reduceMethod, asString);
    }, shared);

    if (shared && traceCache_) {
        trace("[ovf-cache] hit signal=" + signal->name() + '\n');
    }
    return value;
}

ToolResult DataCache::getToolData(const std::shared_ptr<ITool>& tool) {
    if (!tool) {
        throw std::invalid_argument("Tool instance unset");
    }

    const auto key = tool->key();
    bool shared = false;
    auto result = singleFlight(mutex_, toolData_, key, [&]() {
        ++fetchCount_;
        if (traceCache_) {
            trace("[ovf-cache] run tool=" + key + '\n');
        }
        return tool->run();
    }, shared);

    if (shared && traceCache_) {
        trace("[ovf-cache] hit tool=" + key + '\n');
    }
    return result;
}

void DataCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    signalData_.clear();
    toolData_.clear();
}

std::uint64_t DataCache::fetchCount() const noexcept { return fetchCount_.load(); }

const CacheOptions& DataCache::options() const noexcept { return options_; }

Value DataCache::fetchSignal(ISignal& signal,
                             std::optional<std::chrono::milliseconds> reducePeriod,
                             ReduceMethod reduceMethod,
                             bool asString) {
    Value value;
    if (!reducePeriod.has_value() || reducePeriod->count() <= 0) {
        value = signal.read(options_.connectionTimeout);
    } else {
        std::vector<Value> samples;
        const auto deadline = std::chrono::steady_clock::now() + *reducePeriod;
        auto nextSample = std::chrono::steady_clock::now();
        while (true) {
            auto sample = signal.read(options_.connectionTimeout);
            if (!isNoData(sample)) {
                samples.push_back(std::move(sample));
            }
            nextSample += options_.sampleInterval;
            if (nextSample >= deadline) {
                break;
            }
            std::this_thread::sleep_until(nextSample);
        }
        if (!samples.empty()) {
            value = reduceSamples(samples, reduceMethod);
        }
    }

    if (asString && !isNoData(value)) {
        value = toText(value);
    }
    return value;
}

void DataCache::trace(const std::string& line) const {
    std::cerr << line;
}

} // namespace ovf
