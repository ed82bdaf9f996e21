/**
 * @file execution.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace ovf {

class PreparedComparison;

/**
 * @brief Fan-out settings for one execution pass.
 */
struct ExecutionOptions {
    /// Run leaves on a worker pool; false runs them in walk order on the caller.
    bool parallel = true;
    /// Upper bound on concurrent workers, caller thread included (0 = one per leaf).
    std::size_t maxWorkers = 64;

    /**
     * @brief Defaults overridden by OVF_PARALLEL / OVF_MAX_WORKERS.
     */
    static ExecutionOptions fromEnvironment();
};

/**
 * @brief Run `compare()` on every leaf and wait for all of them.
 *
 * Each leaf converts its own faults into a stored `Result`; one leaf never
 * prevents the others from running.
 */
void runComparisons(const std::vector<PreparedComparison*>& comparisons,
                    const ExecutionOptions& options = {});

/**
 * @brief Acquire data for every leaf without comparing.
 * @return Number of leaves whose acquisition failed.
 */
std::size_t prefetchComparisons(const std::vector<PreparedComparison*>& comparisons,
                                const ExecutionOptions& options = {});

} // namespace ovf
