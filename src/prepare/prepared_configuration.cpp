/**
 * @file prepared_configuration.cpp
 * @brief openVerify source file.
 */

#include "openverify/prepare/prepared_configuration.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "openverify/core/environment.hpp"
#include "openverify/core/errors.hpp"

namespace ovf {
namespace {

void tracePrepare(const std::string& line) {
    static const bool enabled = envFlagSet("OVF_TRACE_PREPARE");
    if (enabled) {
        std::cerr << ("[ovf-prep] " + line + "\n");
    }
}

ComparisonList withShared(const ComparisonList& own, const ComparisonList& shared) {
    ComparisonList all;
    all.reserve(own.size() + shared.size());
    all.insert(all.end(), own.begin(), own.end());
    all.insert(all.end(), shared.begin(), shared.end());
    return all;
}

std::shared_ptr<DataCache> ensureCache(std::shared_ptr<DataCache> cache) {
    return cache ? std::move(cache) : std::make_shared<DataCache>();
}

[[noreturn]] void throwUnexpectedType(const std::shared_ptr<const Configuration>& config, const char* expected) {
    throw std::invalid_argument(std::string("Unexpected configuration type: ") +
                                (config ? toString(config->kind()) : "null") + " (expected " + expected + ")");
}

} // namespace

PreparedWalk::Iterator& PreparedWalk::Iterator::operator++() {
    if (current_ != nullptr && !current_->children().empty()) {
        stack_.emplace_back(&current_->children(), 0U);
        current_ = current_->children().front().get();
        return *this;
    }

    while (!stack_.empty()) {
        auto& top = stack_.back();
        ++top.second;
        if (top.second < top.first->size()) {
            current_ = (*top.first)[top.second].get();
            return *this;
        }
        stack_.pop_back();
    }
    current_ = nullptr;
    return *this;
}

PreparedWalk PreparedWalk::including(PreparedConfiguration& root) { return PreparedWalk(&root, true); }

PreparedWalk PreparedWalk::below(PreparedConfiguration& root) { return PreparedWalk(&root, false); }

PreparedWalk::Iterator PreparedWalk::begin() const {
    Iterator it;
    if (root_ == nullptr) {
        return it;
    }
    if (includeRoot_) {
        it.current_ = root_;
    } else if (!root_->children().empty()) {
        it.stack_.emplace_back(&root_->children(), 0U);
        it.current_ = root_->children().front().get();
    }
    return it;
}

PreparedGroup& PreparedGroupWalk::Iterator::operator*() const { return static_cast<PreparedGroup&>(*node_); }

PreparedGroupWalk::Iterator& PreparedGroupWalk::Iterator::operator++() {
    ++node_;
    skipToGroup();
    return *this;
}

void PreparedGroupWalk::Iterator::skipToGroup() {
    while (node_ != PreparedWalk::Iterator{} && node_->kind() != ConfigurationKind::Group) {
        ++node_;
    }
}

PreparedGroupWalk::Iterator PreparedGroupWalk::begin() const {
    Iterator it;
    it.node_ = nodes_.begin();
    it.skipToGroup();
    return it;
}

ComparisonItem ComparisonWalk::Iterator::operator*() const {
    const auto& failures = node_->prepareFailures();
    if (index_ < failures.size()) {
        return &failures[index_];
    }
    return node_->comparisons()[index_ - failures.size()].get();
}

ComparisonWalk::Iterator& ComparisonWalk::Iterator::operator++() {
    ++index_;
    settle();
    return *this;
}

void ComparisonWalk::Iterator::settle() {
    while (node_ != PreparedWalk::Iterator{}) {
        const auto total = node_->prepareFailures().size() + node_->comparisons().size();
        if (index_ < total) {
            return;
        }
        ++node_;
        index_ = 0;
    }
    index_ = 0;
}

ComparisonWalk::Iterator ComparisonWalk::begin() const {
    Iterator it;
    it.node_ = nodes_.begin();
    it.settle();
    return it;
}

PreparedConfiguration::PreparedConfiguration(std::shared_ptr<const Configuration> config,
                                             std::shared_ptr<DataCache> cache,
                                             PreparedConfiguration* parent)
    : config_(std::move(config)), cache_(ensureCache(std::move(cache))), parent_(parent) {
    if (!config_) {
        throw std::invalid_argument("Configuration unset");
    }
}

std::string PreparedConfiguration::path() const {
    std::vector<std::string> parts;
    for (const auto* node = this; node != nullptr; node = node->parent_) {
        const auto& info = node->config().info();
        parts.push_back(info.name.has_value() ? *info.name : std::string(toString(node->kind())));
    }

    std::string text;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!text.empty()) {
            text += "/";
        }
        text += *it;
    }
    return text;
}

ComparisonWalk PreparedConfiguration::walkComparisons() { return ComparisonWalk(PreparedWalk::including(*this)); }

Result PreparedConfiguration::compare(const ExecutionOptions& options) {
    std::vector<PreparedComparison*> leaves;
    for (const auto item : walkComparisons()) {
        if (const auto* leaf = std::get_if<PreparedComparison*>(&item)) {
            leaves.push_back(*leaf);
        }
    }
    runComparisons(leaves, options);
    return fold();
}

Result PreparedConfiguration::fold() {
    std::vector<std::optional<Result>> results;
    results.reserve(children_.size() + comparisons_.size());
    for (auto& child : children_) {
        results.emplace_back(child->fold());
    }
    for (const auto& comparison : comparisons_) {
        results.push_back(comparison->result());
    }

    if (!prepareFailures_.empty()) {
        result_ = Result{Severity::Error, "At least one configuration failed to initialize"};
    } else {
        result_ = Result{combineSeverities(foldMode(), results), {}};
    }
    return *result_;
}

void PreparedConfiguration::recordLeafFailure(const std::string& identifier,
                                              const ComparisonPtr& comparison,
                                              const std::exception& ex) {
    recordLeafFailure(identifier, comparison, describeException(ex));
}

void PreparedConfiguration::recordLeafFailure(const std::string& identifier,
                                              const ComparisonPtr& comparison,
                                              const std::string& error) {
    tracePrepare(config_->describe() + " leaf '" + identifier + "' failed: " + error);
    prepareFailures_.push_back(FailedConfiguration{
        .parent = this,
        .config = config_,
        .identifier = identifier,
        .comparison = comparison,
        .result = Result{Severity::Error, "Failed to prepare comparison for '" + identifier + "': " + error},
        .error = error,
    });
}

PreparedNode prepareConfiguration(std::shared_ptr<const Configuration> config,
                                  IDeviceDatabase* database,
                                  std::shared_ptr<DataCache> cache,
                                  PreparedConfiguration* parent) {
    if (!config) {
        throw std::invalid_argument("Configuration unset");
    }
    cache = ensureCache(std::move(cache));

    struct Dispatch {
        const std::shared_ptr<const Configuration>& config;
        IDeviceDatabase* database;
        const std::shared_ptr<DataCache>& cache;
        PreparedConfiguration* parent;

        PreparedNode operator()(const ConfigurationGroup&) const {
            return PreparedConfigurationPtr(PreparedGroup::fromGroup(config, database, cache, parent));
        }
        PreparedNode operator()(const DeviceConfiguration&) const {
            return PreparedDeviceConfiguration::fromConfig(config, database, cache, parent);
        }
        PreparedNode operator()(const PvConfiguration&) const {
            return PreparedPvConfiguration::fromConfig(config, cache, parent);
        }
        PreparedNode operator()(const ToolConfiguration&) const {
            return PreparedToolConfiguration::fromConfig(config, cache, parent);
        }
    };

    return std::visit(Dispatch{config, database, cache, parent}, config->variant());
}

Result resultFromComparison(const ComparisonItem& item) {
    if (const auto* failure = std::get_if<const FailedConfiguration*>(&item)) {
        if (*failure != nullptr) {
            return (*failure)->result;
        }
    } else if (const auto* leaf = std::get_if<PreparedComparison*>(&item)) {
        if (*leaf != nullptr && (*leaf)->result().has_value()) {
            return *(*leaf)->result();
        }
    }
    return Result{Severity::InternalError, "no result available (comparison not run?)"};
}

std::unique_ptr<PreparedGroup> PreparedGroup::fromGroup(std::shared_ptr<const Configuration> config,
                                                        IDeviceDatabase* database,
                                                        std::shared_ptr<DataCache> cache,
                                                        PreparedConfiguration* parent) {
    if (!config || config->as<ConfigurationGroup>() == nullptr) {
        throwUnexpectedType(config, "ConfigurationGroup");
    }
    cache = ensureCache(std::move(cache));

    auto prepared = std::make_unique<PreparedGroup>(ConstructionKey{}, config, cache, parent);
    for (const auto& child : prepared->group().configs) {
        // Children alias the owning tree so they stay valid as long as any node does.
        std::shared_ptr<const Configuration> childConfig(prepared->config_, &child);
        auto node = prepareConfiguration(std::move(childConfig), database, cache, prepared.get());
        if (auto* failure = std::get_if<FailedConfiguration>(&node)) {
            prepared->prepareFailures_.push_back(std::move(*failure));
        } else {
            prepared->children_.push_back(std::move(std::get<PreparedConfigurationPtr>(node)));
        }
    }
    return prepared;
}

std::unique_ptr<PreparedGroup> PreparedGroup::fromGroup(ConfigurationGroup group,
                                                        IDeviceDatabase* database,
                                                        std::shared_ptr<DataCache> cache,
                                                        PreparedConfiguration* parent) {
    return fromGroup(std::make_shared<const Configuration>(std::move(group)), database, std::move(cache), parent);
}

const ConfigurationGroup& PreparedGroup::group() const noexcept { return *config_->as<ConfigurationGroup>(); }

std::vector<PreparedGroup*> PreparedGroup::subgroups() const {
    std::vector<PreparedGroup*> groups;
    for (const auto& child : children_) {
        if (child->kind() == ConfigurationKind::Group) {
            groups.push_back(static_cast<PreparedGroup*>(child.get()));
        }
    }
    return groups;
}

PreparedGroupWalk PreparedGroup::walkGroups() { return PreparedGroupWalk(PreparedWalk::below(*this)); }

PreparedNode PreparedDeviceConfiguration::fromConfig(std::shared_ptr<const Configuration> config,
                                                     IDeviceDatabase* database,
                                                     std::shared_ptr<DataCache> cache,
                                                     PreparedConfiguration* parent,
                                                     std::vector<std::shared_ptr<IDevice>> additionalDevices) {
    const auto* deviceConfig = config ? config->as<DeviceConfiguration>() : nullptr;
    if (deviceConfig == nullptr) {
        throwUnexpectedType(config, "DeviceConfiguration");
    }

    auto devices = std::move(additionalDevices);
    for (const auto& name : deviceConfig->devices) {
        std::shared_ptr<IDevice> device;
        std::string error;
        bool resolved = false;
        if (database == nullptr) {
            error = "No device database available";
        } else {
            try {
                resolved = database->resolve(name, device, error) && device != nullptr;
            } catch (const std::exception& ex) {
                error = describeException(ex);
            } catch (...) {
                error = "unknown exception";
            }
            if (!resolved && error.empty()) {
                error = "Device database returned no device for " + name;
            }
        }

        if (!resolved) {
            tracePrepare(config->describe() + " device '" + name + "' failed: " + error);
            return FailedConfiguration{
                .parent = parent,
                .config = config,
                .result = Result{Severity::Error, "Failed to load device: " + name},
                .error = error,
            };
        }
        devices.push_back(std::move(device));
    }

    return PreparedConfigurationPtr(bind(std::move(config), std::move(devices), std::move(cache), parent));
}

std::unique_ptr<PreparedDeviceConfiguration> PreparedDeviceConfiguration::fromDevices(
    std::vector<std::shared_ptr<IDevice>> devices,
    ComparisonMap byAttr,
    ComparisonList shared,
    std::shared_ptr<DataCache> cache,
    PreparedConfiguration* parent) {
    DeviceConfiguration config;
    config.byAttr = std::move(byAttr);
    config.shared = std::move(shared);
    return bind(std::make_shared<const Configuration>(std::move(config)), std::move(devices), std::move(cache),
                parent);
}

std::unique_ptr<PreparedDeviceConfiguration> PreparedDeviceConfiguration::bind(
    std::shared_ptr<const Configuration> config,
    std::vector<std::shared_ptr<IDevice>> devices,
    std::shared_ptr<DataCache> cache,
    PreparedConfiguration* parent) {
    cache = ensureCache(std::move(cache));
    auto prepared =
        std::make_unique<PreparedDeviceConfiguration>(ConstructionKey{}, std::move(config), cache, parent);
    prepared->devices_ = std::move(devices);

    const auto& deviceConfig = prepared->deviceConfig();
    for (const auto& device : prepared->devices_) {
        for (const auto& [attr, comparisons] : deviceConfig.byAttr) {
            for (const auto& comparison : withShared(comparisons, deviceConfig.shared)) {
                try {
                    prepared->comparisons_.push_back(PreparedSignalComparison::fromDevice(
                        device, attr, comparison, cache, prepared.get(), deviceConfig.name));
                } catch (const std::exception& ex) {
                    prepared->recordLeafFailure(device ? device->name() + "." + attr : attr, comparison, ex);
                } catch (...) {
                    prepared->recordLeafFailure(device ? device->name() + "." + attr : attr, comparison,
                                                std::string("unknown exception"));
                }
            }
        }
    }
    return prepared;
}

const DeviceConfiguration& PreparedDeviceConfiguration::deviceConfig() const noexcept {
    return *config_->as<DeviceConfiguration>();
}

PreparedNode PreparedPvConfiguration::fromConfig(std::shared_ptr<const Configuration> config,
                                                 std::shared_ptr<DataCache> cache,
                                                 PreparedConfiguration* parent) {
    if (!config || config->as<PvConfiguration>() == nullptr) {
        throwUnexpectedType(config, "PvConfiguration");
    }
    return PreparedConfigurationPtr(bind(std::move(config), std::move(cache), parent));
}

std::unique_ptr<PreparedPvConfiguration> PreparedPvConfiguration::fromPvs(ComparisonMap byPv,
                                                                          ComparisonList shared,
                                                                          std::shared_ptr<DataCache> cache,
                                                                          PreparedConfiguration* parent) {
    PvConfiguration config;
    config.byPv = std::move(byPv);
    config.shared = std::move(shared);
    return bind(std::make_shared<const Configuration>(std::move(config)), std::move(cache), parent);
}

std::unique_ptr<PreparedPvConfiguration> PreparedPvConfiguration::bind(std::shared_ptr<const Configuration> config,
                                                                       std::shared_ptr<DataCache> cache,
                                                                       PreparedConfiguration* parent) {
    cache = ensureCache(std::move(cache));
    auto prepared =
        std::make_unique<PreparedPvConfiguration>(ConstructionKey{}, std::move(config), cache, parent);

    const auto& pvConfig = prepared->pvConfig();
    for (const auto& [pvName, comparisons] : pvConfig.byPv) {
        for (const auto& comparison : withShared(comparisons, pvConfig.shared)) {
            try {
                prepared->comparisons_.push_back(
                    PreparedSignalComparison::fromPvName(pvName, comparison, cache, prepared.get(), pvConfig.name));
            } catch (const std::exception& ex) {
                prepared->recordLeafFailure(pvName, comparison, ex);
            } catch (...) {
                prepared->recordLeafFailure(pvName, comparison, std::string("unknown exception"));
            }
        }
    }
    return prepared;
}

const PvConfiguration& PreparedPvConfiguration::pvConfig() const noexcept { return *config_->as<PvConfiguration>(); }

PreparedNode PreparedToolConfiguration::fromConfig(std::shared_ptr<const Configuration> config,
                                                   std::shared_ptr<DataCache> cache,
                                                   PreparedConfiguration* parent) {
    const auto* toolConfig = config ? config->as<ToolConfiguration>() : nullptr;
    if (toolConfig == nullptr) {
        throwUnexpectedType(config, "ToolConfiguration");
    }
    if (!toolConfig->tool) {
        tracePrepare(config->describe() + " has no tool");
        return FailedConfiguration{
            .parent = parent,
            .config = config,
            .result = Result{Severity::Error, "No tool configured for " + config->describe()},
        };
    }
    return PreparedConfigurationPtr(bind(std::move(config), std::move(cache), parent));
}

std::unique_ptr<PreparedToolConfiguration> PreparedToolConfiguration::fromTool(std::shared_ptr<ITool> tool,
                                                                               ComparisonMap byAttr,
                                                                               ComparisonList shared,
                                                                               std::shared_ptr<DataCache> cache,
                                                                               PreparedConfiguration* parent) {
    if (!tool) {
        throw std::invalid_argument("Tool unset");
    }
    ToolConfiguration config;
    config.tool = std::move(tool);
    config.byAttr = std::move(byAttr);
    config.shared = std::move(shared);
    return bind(std::make_shared<const Configuration>(std::move(config)), std::move(cache), parent);
}

std::unique_ptr<PreparedToolConfiguration> PreparedToolConfiguration::bind(std::shared_ptr<const Configuration> config,
                                                                           std::shared_ptr<DataCache> cache,
                                                                           PreparedConfiguration* parent) {
    cache = ensureCache(std::move(cache));
    auto prepared =
        std::make_unique<PreparedToolConfiguration>(ConstructionKey{}, std::move(config), cache, parent);

    const auto& toolConfig = prepared->toolConfig();
    for (const auto& [resultKey, comparisons] : toolConfig.byAttr) {
        for (const auto& comparison : withShared(comparisons, toolConfig.shared)) {
            try {
                prepared->comparisons_.push_back(PreparedToolComparison::fromTool(
                    toolConfig.tool, resultKey, comparison, cache, prepared.get(), toolConfig.name));
            } catch (const std::exception& ex) {
                prepared->recordLeafFailure(resultKey, comparison, ex);
            } catch (...) {
                prepared->recordLeafFailure(resultKey, comparison, std::string("unknown exception"));
            }
        }
    }
    return prepared;
}

const ToolConfiguration& PreparedToolConfiguration::toolConfig() const noexcept {
    return *config_->as<ToolConfiguration>();
}

} // namespace ovf
