/**
 * @file prepared_file.cpp
 * @brief openVerify source file.
 */

#include "openverify/prepare/prepared_file.hpp"

#include <vector>

namespace ovf {

std::unique_ptr<PreparedFile> PreparedFile::fromConfig(ConfigurationFile file,
                                                       IDeviceDatabase* database,
                                                       std::shared_ptr<DataCache> cache) {
    auto prepared = std::make_unique<PreparedFile>(ConstructionKey{});
    prepared->file_ = std::make_shared<const ConfigurationFile>(std::move(file));
    prepared->cache_ = cache ? std::move(cache) : std::make_shared<DataCache>();
    prepared->database_ = database;

    std::shared_ptr<const Configuration> rootNode(prepared->file_, &prepared->file_->rootNode());
    prepared->root_ = PreparedGroup::fromGroup(std::move(rootNode), database, prepared->cache_);
    return prepared;
}

std::size_t PreparedFile::fillCache(const ExecutionOptions& options) {
    std::vector<PreparedComparison*> leaves;
    for (const auto item : walkComparisons()) {
        if (const auto* leaf = std::get_if<PreparedComparison*>(&item)) {
            leaves.push_back(*leaf);
        }
    }
    return prefetchComparisons(leaves, options);
}

Result PreparedFile::compare(const ExecutionOptions& options) { return root_->compare(options); }

} // namespace ovf
