/**
 * @file prepared_file.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstddef>
#include <memory>

#include "openverify/config/configuration.hpp"
#include "openverify/core/result.hpp"
#include "openverify/data/data_cache.hpp"
#include "openverify/data/i_device_database.hpp"
#include "openverify/engine/execution.hpp"
#include "openverify/prepare/prepared_configuration.hpp"

namespace ovf {

/**
 * @brief Prepared form of a whole `ConfigurationFile`; the usual entry point.
 *
 * Owns its copy of the file, the prepared root group and a reference to the
 * session cache. The device database is borrowed and must outlive preparation.
 */
class PreparedFile {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    explicit PreparedFile(ConstructionKey) {}
    PreparedFile(const PreparedFile&) = delete;
    PreparedFile& operator=(const PreparedFile&) = delete;

    /**
     * @brief Prepare every node of `file`.
     * @param cache Session cache; a fresh one is created when null.
     */
    static std::unique_ptr<PreparedFile> fromConfig(ConfigurationFile file,
                                                    IDeviceDatabase* database = nullptr,
                                                    std::shared_ptr<DataCache> cache = nullptr);

    const ConfigurationFile& file() const noexcept { return *file_; }
    PreparedGroup& root() noexcept { return *root_; }
    const PreparedGroup& root() const noexcept { return *root_; }
    const std::shared_ptr<DataCache>& cache() const noexcept { return cache_; }
    IDeviceDatabase* deviceDatabase() const noexcept { return database_; }

    /**
     * @brief Acquire data for every leaf without comparing.
     * @return Number of leaves whose acquisition failed.
     */
    std::size_t fillCache(const ExecutionOptions& options = {});

    ComparisonWalk walkComparisons() { return root_->walkComparisons(); }

    /**
     * @brief All groups, pre-order, starting with the root.
     */
    PreparedGroupWalk walkGroups() { return PreparedGroupWalk(PreparedWalk::including(*root_)); }

    /**
     * @brief Run every comparison and return the root's folded result.
     */
    Result compare(const ExecutionOptions& options = {});

private:
    std::shared_ptr<const ConfigurationFile> file_;
    std::shared_ptr<DataCache> cache_;
    IDeviceDatabase* database_ = nullptr;
    std::unique_ptr<PreparedGroup> root_;
};

} // namespace ovf
