/**
 * @file configuration.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "openverify/check/comparison.hpp"
#include "openverify/core/result.hpp"
#include "openverify/core/value.hpp"
#include "openverify/data/i_tool.hpp"

namespace ovf {

class Configuration;
class ConfigurationWalk;

using ConfigurationList = std::vector<Configuration>;
/// Identifier (attribute, PV name or result key) to its ordered comparisons.
using ComparisonMap = std::map<std::string, ComparisonList>;

/**
 * @brief Metadata carried by every configuration node.
 */
struct ConfigurationInfo {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::vector<std::string> tags;
};

/**
 * @brief Ordered group of child configurations folded with `mode`.
 */
struct ConfigurationGroup : ConfigurationInfo {
    ConfigurationList configs;
    /// Named values reusable by comparisons underneath this group.
    std::map<std::string, Value> values;
    GroupResultMode mode = GroupResultMode::All;

    /**
     * @brief Pre-order walk over all descendants (this group excluded).
     */
    ConfigurationWalk walkConfigs() const;
};

/**
 * @brief Checks attributes of one or more named devices.
 *
 * Attribute names may address sub-devices with dots ("stage.x.readback").
 */
struct DeviceConfiguration : ConfigurationInfo {
    std::vector<std::string> devices;
    ComparisonMap byAttr;
    /// Comparisons applied to every attribute in `byAttr`.
    ComparisonList shared;
};

/**
 * @brief Checks raw control points by name.
 */
struct PvConfiguration : ConfigurationInfo {
    ComparisonMap byPv;
    ComparisonList shared;
};

/**
 * @brief Checks the result of running a tool; keys are result keys.
 */
struct ToolConfiguration : ConfigurationInfo {
    std::shared_ptr<ITool> tool;
    ComparisonMap byAttr;
    ComparisonList shared;
};

enum class ConfigurationKind { Group, Device, Pv, Tool };

const char* toString(ConfigurationKind kind);

/**
 * @brief One node of the configuration tree: a closed set of four variants.
 */
class Configuration {
public:
    using Variant = std::variant<ConfigurationGroup, DeviceConfiguration, PvConfiguration, ToolConfiguration>;

    Configuration(ConfigurationGroup group);
    Configuration(DeviceConfiguration device);
    Configuration(PvConfiguration pv);
    Configuration(ToolConfiguration tool);

    ConfigurationKind kind() const noexcept;
    const ConfigurationInfo& info() const;
    const Variant& variant() const noexcept { return value_; }

    template <typename T>
    const T* as() const noexcept {
        return std::get_if<T>(&value_);
    }

    /**
     * @brief "<Kind> '<name>'" or just the kind when unnamed.
     */
    std::string describe() const;

private:
    Variant value_;
};

/**
 * @brief Restartable, lazy, depth-first pre-order range over configuration nodes.
 *
 * Every call to `begin()` starts a fresh traversal; iterators hold their own
 * cursor stack. Groups are yielded before their descendants.
 */
class ConfigurationWalk {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Configuration;
        using difference_type = std::ptrdiff_t;
        using pointer = const Configuration*;
        using reference = const Configuration&;

        Iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return current_; }
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const { return current_ == other.current_; }
        bool operator!=(const Iterator& other) const { return current_ != other.current_; }

    private:
        friend class ConfigurationWalk;

        std::vector<std::pair<const ConfigurationList*, std::size_t>> stack_;
        const Configuration* current_ = nullptr;
    };

    /**
     * @brief Walk `root` followed by its descendants.
     */
    static ConfigurationWalk including(const Configuration& root);
    /**
     * @brief Walk the descendants rooted at `children`.
     */
    static ConfigurationWalk below(const ConfigurationList& children);

    Iterator begin() const;
    Iterator end() const { return Iterator{}; }

private:
    ConfigurationWalk(const Configuration* root, const ConfigurationList* children)
        : root_(root), children_(children) {}

    const Configuration* root_ = nullptr;
    const ConfigurationList* children_ = nullptr;
};

/**
 * @brief Top-level configuration document.
 */
class ConfigurationFile {
public:
    explicit ConfigurationFile(ConfigurationGroup root = {}, int version = 0);

    int version() const noexcept { return version_; }
    const ConfigurationGroup& root() const;
    const Configuration& rootNode() const noexcept { return root_; }

    /**
     * @brief Pre-order walk including the root group.
     */
    ConfigurationWalk walkConfigs() const;

    std::vector<const DeviceConfiguration*> getByDevice(const std::string& name) const;
    std::vector<const PvConfiguration*> getByPv(const std::string& pvName) const;
    /**
     * @brief Nodes sharing at least one tag with `tags`; no tags yields nothing.
     */
    std::vector<const Configuration*> getByTag(const std::vector<std::string>& tags) const;

private:
    int version_ = 0;
    Configuration root_;
};

} // namespace ovf
