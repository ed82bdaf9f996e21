/**
 * @file execution.cpp
 * @brief openVerify source file.
 */

#include "openverify/engine/execution.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "openverify/core/environment.hpp"
#include "openverify/prepare/prepared_comparison.hpp"

namespace ovf {
namespace {

bool traceExec() {
    static const bool enabled = envFlagSet("OVF_TRACE_EXEC");
    return enabled;
}

void trace(const std::string& line) {
    if (traceExec()) {
        std::cerr << ("[ovf-exec] " + line + "\n");
    }
}

std::size_t workerCount(std::size_t tasks, const ExecutionOptions& options) {
    if (!options.parallel || tasks <= 1U) {
        return 1U;
    }
    if (options.maxWorkers == 0U) {
        return tasks;
    }
    return std::min(tasks, options.maxWorkers);
}

// Runs task(0..count-1) on a bounded worker set pulling from a shared index.
// The calling thread is one of the workers; tasks must not throw.
void forEachIndex(std::size_t count,
                  const ExecutionOptions& options,
                  const std::function<void(std::size_t)>& task) {
    if (count == 0U) {
        return;
    }

    std::atomic<std::size_t> next{0};
    const auto drain = [&]() {
        for (auto index = next.fetch_add(1); index < count; index = next.fetch_add(1)) {
            task(index);
        }
    };

    const auto wanted = workerCount(count, options);
    std::vector<std::thread> workers;
    workers.reserve(wanted - 1U);
    for (std::size_t i = 1; i < wanted; ++i) {
        try {
            workers.emplace_back(drain);
        } catch (const std::system_error& ex) {
            // Remaining work is picked up by the threads that did start.
            trace(std::string("worker spawn failed: ") + ex.what());
            break;
        }
    }

    std::ostringstream os;
    os << "tasks=" << count << " workers=" << (workers.size() + 1U)
       << " mode=" << (options.parallel ? "parallel" : "sequential");
    trace(os.str());

    drain();
    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace

ExecutionOptions ExecutionOptions::fromEnvironment() {
    ExecutionOptions options;
    options.parallel = parseBoolEnv("OVF_PARALLEL", options.parallel);
    const auto workers = parseIntegralEnv<std::int64_t>("OVF_MAX_WORKERS",
                                                        static_cast<std::int64_t>(options.maxWorkers));
    if (workers >= 0) {
        options.maxWorkers = static_cast<std::size_t>(workers);
    }
    return options;
}

void runComparisons(const std::vector<PreparedComparison*>& comparisons, const ExecutionOptions& options) {
    forEachIndex(comparisons.size(), options, [&](std::size_t index) {
        auto* comparison = comparisons[index];
        if (comparison == nullptr) {
            return;
        }
        const auto result = comparison->compare();
        if (traceExec()) {
            trace(comparison->identifier() + " -> " + toString(result.severity));
        }
    });
}

std::size_t prefetchComparisons(const std::vector<PreparedComparison*>& comparisons,
                                const ExecutionOptions& options) {
    std::atomic<std::size_t> failures{0};
    forEachIndex(comparisons.size(), options, [&](std::size_t index) {
        auto* comparison = comparisons[index];
        if (comparison == nullptr) {
            return;
        }
        std::string error;
        if (!comparison->prefetch(error)) {
            failures.fetch_add(1);
            trace("prefetch failed: " + error);
        }
    });
    return failures.load();
}

} // namespace ovf
