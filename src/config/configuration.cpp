/**
 * @file configuration.cpp
 * @brief openVerify source file.
 */

#include "openverify/config/configuration.hpp"

#include <algorithm>
#include <set>

namespace ovf {

const char* toString(ConfigurationKind kind) {
    switch (kind) {
    case ConfigurationKind::Group:
        return "ConfigurationGroup";
    case ConfigurationKind::Device:
        return "DeviceConfiguration";
    case ConfigurationKind::Pv:
        return "PvConfiguration";
    case ConfigurationKind::Tool:
        return "ToolConfiguration";
    }
    return "Configuration";
}

ConfigurationWalk ConfigurationGroup::walkConfigs() const {
    return ConfigurationWalk::below(configs);
}

Configuration::Configuration(ConfigurationGroup group) : value_(std::move(group)) {}
Configuration::Configuration(DeviceConfiguration device) : value_(std::move(device)) {}
Configuration::Configuration(PvConfiguration pv) : value_(std::move(pv)) {}
Configuration::Configuration(ToolConfiguration tool) : value_(std::move(tool)) {}

ConfigurationKind Configuration::kind() const noexcept {
    switch (value_.index()) {
    case 0:
        return ConfigurationKind::Group;
    case 1:
        return ConfigurationKind::Device;
    case 2:
        return ConfigurationKind::Pv;
    default:
        return ConfigurationKind::Tool;
    }
}

const ConfigurationInfo& Configuration::info() const {
    return std::visit([](const auto& config) -> const ConfigurationInfo& { return config; }, value_);
}

std::string Configuration::describe() const {
    const auto& meta = info();
    std::string text = toString(kind());
    if (meta.name.has_value()) {
        text += " '" + *meta.name + "'";
    }
    return text;
}

ConfigurationWalk::Iterator& ConfigurationWalk::Iterator::operator++() {
    if (current_ != nullptr) {
        const auto* group = current_->as<ConfigurationGroup>();
        if (group != nullptr && !group->configs.empty()) {
            stack_.emplace_back(&group->configs, 0U);
            current_ = &group->configs.front();
            return *this;
        }
    }

    while (!stack_.empty()) {
        auto& top = stack_.back();
        ++top.second;
        if (top.second < top.first->size()) {
            current_ = &(*top.first)[top.second];
            return *this;
        }
        stack_.pop_back();
    }
    current_ = nullptr;
    return *this;
}

ConfigurationWalk::Iterator ConfigurationWalk::Iterator::operator++(int) {
    auto copy = *this;
    ++(*this);
    return copy;
}

ConfigurationWalk ConfigurationWalk::including(const Configuration& root) {
    return ConfigurationWalk(&root, nullptr);
}

ConfigurationWalk ConfigurationWalk::below(const ConfigurationList& children) {
    return ConfigurationWalk(nullptr, &children);
}

ConfigurationWalk::Iterator ConfigurationWalk::begin() const {
    Iterator it;
    if (root_ != nullptr) {
        it.current_ = root_;
    } else if (children_ != nullptr && !children_->empty()) {
        it.stack_.emplace_back(children_, 0U);
        it.current_ = &children_->front();
    }
    return it;
}

ConfigurationFile::ConfigurationFile(ConfigurationGroup root, int version)
    : version_(version), root_(std::move(root)) {}

const ConfigurationGroup& ConfigurationFile::root() const {
    return std::get<ConfigurationGroup>(root_.variant());
}

ConfigurationWalk ConfigurationFile::walkConfigs() const {
    return ConfigurationWalk::including(root_);
}

std::vector<const DeviceConfiguration*> ConfigurationFile::getByDevice(const std::string& name) const {
    std::vector<const DeviceConfiguration*> matches;
    for (const auto& config : walkConfigs()) {
        const auto* device = config.as<DeviceConfiguration>();
        if (device == nullptr) {
            continue;
        }
        if (std::find(device->devices.begin(), device->devices.end(), name) != device->devices.end()) {
            matches.push_back(device);
        }
    }
    return matches;
}

std::vector<const PvConfiguration*> ConfigurationFile::getByPv(const std::string& pvName) const {
    std::vector<const PvConfiguration*> matches;
    for (const auto& config : walkConfigs()) {
        const auto* pv = config.as<PvConfiguration>();
        if (pv != nullptr && pv->byPv.find(pvName) != pv->byPv.end()) {
            matches.push_back(pv);
        }
    }
    return matches;
}

std::vector<const Configuration*> ConfigurationFile::getByTag(const std::vector<std::string>& tags) const {
    std::vector<const Configuration*> matches;
    if (tags.empty()) {
        return matches;
    }

    const std::set<std::string> wanted(tags.begin(), tags.end());
    for (const auto& config : walkConfigs()) {
        const auto& configTags = config.info().tags;
        const bool intersects = std::any_of(configTags.begin(), configTags.end(),
                                            [&](const std::string& tag) { return wanted.count(tag) != 0U; });
        if (intersects) {
            matches.push_back(&config);
        }
    }
    return matches;
}

} // namespace ovf
