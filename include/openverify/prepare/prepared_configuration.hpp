/**
 * @file prepared_configuration.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstddef>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "openverify/check/comparison.hpp"
#include "openverify/config/configuration.hpp"
#include "openverify/core/result.hpp"
#include "openverify/data/data_cache.hpp"
#include "openverify/data/i_device_database.hpp"
#include "openverify/data/i_tool.hpp"
#include "openverify/engine/execution.hpp"
#include "openverify/prepare/prepared_comparison.hpp"

namespace ovf {

class PreparedConfiguration;
class PreparedGroup;

/**
 * @brief Record of a configuration (or one of its leaves) that could not be prepared.
 *
 * Whole-node failures leave `identifier` empty and `comparison` unset.
 */
struct FailedConfiguration {
    PreparedConfiguration* parent = nullptr;
    std::shared_ptr<const Configuration> config;
    std::string identifier;
    ComparisonPtr comparison;
    Result result;
    /// Underlying error text ("<Type>: <message>"), empty when none was raised.
    std::string error;
};

/// Item produced by `walkComparisons()`: a runnable leaf or a preparation failure.
using ComparisonItem = std::variant<PreparedComparison*, const FailedConfiguration*>;

using PreparedConfigurationPtr = std::unique_ptr<PreparedConfiguration>;
using PreparedConfigurationList = std::vector<PreparedConfigurationPtr>;
/// Outcome of preparing one configuration node.
using PreparedNode = std::variant<PreparedConfigurationPtr, FailedConfiguration>;

/**
 * @brief Restartable pre-order range over prepared nodes.
 */
class PreparedWalk {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = PreparedConfiguration;
        using difference_type = std::ptrdiff_t;
        using pointer = PreparedConfiguration*;
        using reference = PreparedConfiguration&;

        Iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return current_; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return current_ == other.current_; }
        bool operator!=(const Iterator& other) const { return current_ != other.current_; }

    private:
        friend class PreparedWalk;

        std::vector<std::pair<const PreparedConfigurationList*, std::size_t>> stack_;
        PreparedConfiguration* current_ = nullptr;
    };

    static PreparedWalk including(PreparedConfiguration& root);
    static PreparedWalk below(PreparedConfiguration& root);

    Iterator begin() const;
    Iterator end() const { return Iterator{}; }

private:
    PreparedWalk(PreparedConfiguration* root, bool includeRoot) : root_(root), includeRoot_(includeRoot) {}

    PreparedConfiguration* root_ = nullptr;
    bool includeRoot_ = false;
};

/**
 * @brief Restartable pre-order range over prepared groups.
 */
class PreparedGroupWalk {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = PreparedGroup;
        using difference_type = std::ptrdiff_t;
        using pointer = PreparedGroup*;
        using reference = PreparedGroup&;

        Iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return node_ == other.node_; }
        bool operator!=(const Iterator& other) const { return node_ != other.node_; }

    private:
        friend class PreparedGroupWalk;

        void skipToGroup();

        PreparedWalk::Iterator node_;
    };

    explicit PreparedGroupWalk(PreparedWalk nodes) : nodes_(nodes) {}

    Iterator begin() const;
    Iterator end() const { return Iterator{}; }

private:
    PreparedWalk nodes_;
};

/**
 * @brief Restartable pre-order range over leaves and preparation failures.
 *
 * For every node the failures recorded on it come first, then its leaves,
 * then the items of its children in order.
 */
class ComparisonWalk {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ComparisonItem;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ComparisonItem;

        Iterator() = default;

        ComparisonItem operator*() const;
        Iterator& operator++();
        bool operator==(const Iterator& other) const {
            return node_ == other.node_ && index_ == other.index_;
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class ComparisonWalk;

        void settle();

        PreparedWalk::Iterator node_;
        std::size_t index_ = 0;
    };

    explicit ComparisonWalk(PreparedWalk nodes) : nodes_(nodes) {}

    Iterator begin() const;
    Iterator end() const { return Iterator{}; }

private:
    PreparedWalk nodes_;
};

/**
 * @brief Prepared mirror of one configuration node.
 *
 * The implementers are fixed: `PreparedGroup`, `PreparedDeviceConfiguration`,
 * `PreparedPvConfiguration` and `PreparedToolConfiguration`. Groups own child
 * nodes, the others own leaves. The parent pointer is non-owning.
 */
class PreparedConfiguration {
public:
    virtual ~PreparedConfiguration() = default;

    PreparedConfiguration(const PreparedConfiguration&) = delete;
    PreparedConfiguration& operator=(const PreparedConfiguration&) = delete;

    ConfigurationKind kind() const noexcept { return config_->kind(); }
    const Configuration& config() const noexcept { return *config_; }
    const std::shared_ptr<const Configuration>& configPtr() const noexcept { return config_; }
    PreparedConfiguration* parent() const noexcept { return parent_; }
    const std::shared_ptr<DataCache>& cache() const noexcept { return cache_; }

    const PreparedConfigurationList& children() const noexcept { return children_; }
    const std::vector<std::unique_ptr<PreparedComparison>>& comparisons() const noexcept { return comparisons_; }
    const std::vector<FailedConfiguration>& prepareFailures() const noexcept { return prepareFailures_; }
    /**
     * @brief Folded result of the last `compare()`/`fold()`; empty before the first pass.
     */
    const std::optional<Result>& result() const noexcept { return result_; }

    /**
     * @brief Slash-separated names from the root down to this node.
     */
    std::string path() const;

    ComparisonWalk walkComparisons();

    /**
     * @brief Run every leaf in this subtree, then fold results bottom-up.
     */
    Result compare(const ExecutionOptions& options = {});

    /**
     * @brief Re-fold stored leaf results without running anything.
     *
     * Any preparation failure on a node forces Error on that node, whatever its mode.
     */
    Result fold();

    /**
     * @brief Mode used to combine this node's children and leaves.
     */
    virtual GroupResultMode foldMode() const = 0;

protected:
    /**
     * @brief Restricts construction of implementers to their own factories.
     */
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

    PreparedConfiguration(std::shared_ptr<const Configuration> config,
                          std::shared_ptr<DataCache> cache,
                          PreparedConfiguration* parent);

    /**
     * @brief Record a leaf binding failure on this node.
     */
    void recordLeafFailure(const std::string& identifier, const ComparisonPtr& comparison, const std::exception& ex);
    void recordLeafFailure(const std::string& identifier, const ComparisonPtr& comparison, const std::string& error);

    std::shared_ptr<const Configuration> config_;
    std::shared_ptr<DataCache> cache_;
    PreparedConfiguration* parent_ = nullptr;
    PreparedConfigurationList children_;
    std::vector<std::unique_ptr<PreparedComparison>> comparisons_;
    std::vector<FailedConfiguration> prepareFailures_;
    std::optional<Result> result_;
};

/**
 * @brief Prepare any configuration node.
 *
 * Preparation failures are returned as `FailedConfiguration`, never thrown.
 *
 * @param config Node to prepare (may alias into a larger tree).
 * @param database Device lookup; required only when device checks are present.
 * @param cache Session cache; a fresh one is created when null.
 * @param parent Non-owning parent for the prepared node.
 * @throws std::invalid_argument when `config` is null.
 */
PreparedNode prepareConfiguration(std::shared_ptr<const Configuration> config,
                                  IDeviceDatabase* database,
                                  std::shared_ptr<DataCache> cache,
                                  PreparedConfiguration* parent = nullptr);

/**
 * @brief Result of one walk item.
 *
 * A leaf that never ran yields InternalError; a failure yields its stored result.
 */
Result resultFromComparison(const ComparisonItem& item);

class PreparedGroup final : public PreparedConfiguration {
public:
    PreparedGroup(ConstructionKey,
                  std::shared_ptr<const Configuration> config,
                  std::shared_ptr<DataCache> cache,
                  PreparedConfiguration* parent)
        : PreparedConfiguration(std::move(config), std::move(cache), parent) {}

    /**
     * @brief Prepare a group and all of its descendants.
     * @throws std::invalid_argument when `config` is not a group.
     */
    static std::unique_ptr<PreparedGroup> fromGroup(std::shared_ptr<const Configuration> config,
                                                    IDeviceDatabase* database,
                                                    std::shared_ptr<DataCache> cache,
                                                    PreparedConfiguration* parent = nullptr);
    static std::unique_ptr<PreparedGroup> fromGroup(ConfigurationGroup group,
                                                    IDeviceDatabase* database,
                                                    std::shared_ptr<DataCache> cache = nullptr,
                                                    PreparedConfiguration* parent = nullptr);

    const ConfigurationGroup& group() const noexcept;

    /**
     * @brief Direct child groups.
     */
    std::vector<PreparedGroup*> subgroups() const;

    /**
     * @brief All descendant groups, pre-order (this group excluded).
     */
    PreparedGroupWalk walkGroups();

    GroupResultMode foldMode() const override { return group().mode; }
};

class PreparedDeviceConfiguration final : public PreparedConfiguration {
public:
    PreparedDeviceConfiguration(ConstructionKey,
                                std::shared_ptr<const Configuration> config,
                                std::shared_ptr<DataCache> cache,
                                PreparedConfiguration* parent)
        : PreparedConfiguration(std::move(config), std::move(cache), parent) {}

    /**
     * @brief Resolve every named device then bind device x attribute x comparison.
     *
     * A device that cannot be resolved fails the whole node; a leaf that cannot
     * be bound is recorded in `prepareFailures()`.
     */
    static PreparedNode fromConfig(std::shared_ptr<const Configuration> config,
                                   IDeviceDatabase* database,
                                   std::shared_ptr<DataCache> cache,
                                   PreparedConfiguration* parent = nullptr,
                                   std::vector<std::shared_ptr<IDevice>> additionalDevices = {});

    /**
     * @brief Bind already-resolved devices; never fails as a whole.
     */
    static std::unique_ptr<PreparedDeviceConfiguration> fromDevices(std::vector<std::shared_ptr<IDevice>> devices,
                                                                    ComparisonMap byAttr,
                                                                    ComparisonList shared = {},
                                                                    std::shared_ptr<DataCache> cache = nullptr,
                                                                    PreparedConfiguration* parent = nullptr);

    const DeviceConfiguration& deviceConfig() const noexcept;
    const std::vector<std::shared_ptr<IDevice>>& devices() const noexcept { return devices_; }

    GroupResultMode foldMode() const override { return GroupResultMode::All; }

private:

    static std::unique_ptr<PreparedDeviceConfiguration> bind(std::shared_ptr<const Configuration> config,
                                                             std::vector<std::shared_ptr<IDevice>> devices,
                                                             std::shared_ptr<DataCache> cache,
                                                             PreparedConfiguration* parent);

    std::vector<std::shared_ptr<IDevice>> devices_;
};

class PreparedPvConfiguration final : public PreparedConfiguration {
public:
    PreparedPvConfiguration(ConstructionKey,
                            std::shared_ptr<const Configuration> config,
                            std::shared_ptr<DataCache> cache,
                            PreparedConfiguration* parent)
        : PreparedConfiguration(std::move(config), std::move(cache), parent) {}

    static PreparedNode fromConfig(std::shared_ptr<const Configuration> config,
                                   std::shared_ptr<DataCache> cache,
                                   PreparedConfiguration* parent = nullptr);

    static std::unique_ptr<PreparedPvConfiguration> fromPvs(ComparisonMap byPv,
                                                            ComparisonList shared = {},
                                                            std::shared_ptr<DataCache> cache = nullptr,
                                                            PreparedConfiguration* parent = nullptr);

    const PvConfiguration& pvConfig() const noexcept;

    GroupResultMode foldMode() const override { return GroupResultMode::All; }

private:

    static std::unique_ptr<PreparedPvConfiguration> bind(std::shared_ptr<const Configuration> config,
                                                         std::shared_ptr<DataCache> cache,
                                                         PreparedConfiguration* parent);
};

class PreparedToolConfiguration final : public PreparedConfiguration {
public:
    PreparedToolConfiguration(ConstructionKey,
                              std::shared_ptr<const Configuration> config,
                              std::shared_ptr<DataCache> cache,
                              PreparedConfiguration* parent)
        : PreparedConfiguration(std::move(config), std::move(cache), parent) {}

    /**
     * @brief Bind result key x comparison against the node's single tool.
     *
     * A node without a tool fails as a whole.
     */
    static PreparedNode fromConfig(std::shared_ptr<const Configuration> config,
                                   std::shared_ptr<DataCache> cache,
                                   PreparedConfiguration* parent = nullptr);

    /**
     * @throws std::invalid_argument when `tool` is null.
     */
    static std::unique_ptr<PreparedToolConfiguration> fromTool(std::shared_ptr<ITool> tool,
                                                               ComparisonMap byAttr,
                                                               ComparisonList shared = {},
                                                               std::shared_ptr<DataCache> cache = nullptr,
                                                               PreparedConfiguration* parent = nullptr);

    const ToolConfiguration& toolConfig() const noexcept;
    const std::shared_ptr<ITool>& tool() const noexcept { return toolConfig().tool; }

    GroupResultMode foldMode() const override { return GroupResultMode::All; }

private:

    static std::unique_ptr<PreparedToolConfiguration> bind(std::shared_ptr<const Configuration> config,
                                                           std::shared_ptr<DataCache> cache,
                                                           PreparedConfiguration* parent);
};

} // namespace ovf
