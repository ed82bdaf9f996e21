/**
 * @file configuration_tests.cpp
 * @brief openVerify source file.
 */

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "openverify/check/comparison.hpp"
#include "openverify/config/configuration.hpp"
#include "openverify/config/configuration_validator.hpp"
#include "openverify/data/mock_sources.hpp"

namespace {

std::string nameOf(const ovf::Configuration& config) {
    return config.info().name.value_or("?");
}

ovf::ConfigurationFile makeFile() {
    const auto atOne = std::make_shared<ovf::Equals>(ovf::Value{std::int64_t{1}});

    ovf::DeviceConfiguration motors;
    motors.name = "motors";
    motors.tags = {"motion"};
    motors.devices = {"xpp_mot_1", "xpp_mot_2"};
    motors.byAttr = {{"user_readback", {atOne}}};

    ovf::PvConfiguration vacuum;
    vacuum.name = "vacuum";
    vacuum.tags = {"vacuum", "safety"};
    vacuum.byPv = {{"XPP:GAUGE:01", {atOne}}, {"XPP:GAUGE:02", {atOne}}};

    ovf::ConfigurationGroup inner;
    inner.name = "inner";
    inner.configs = {vacuum};

    ovf::PvConfiguration shutter;
    shutter.name = "shutter";
    shutter.tags = {"safety"};
    shutter.byPv = {{"XPP:SHUTTER", {atOne}}};

    ovf::ConfigurationGroup root;
    root.name = "root";
    root.configs = {motors, inner, shutter};
    root.values = {{"nominal", ovf::Value{std::int64_t{1}}}};
    return ovf::ConfigurationFile(root);
}

void testWalkOrderAndRestart() {
    const auto file = makeFile();

    std::vector<std::string> first;
    for (const auto& config : file.walkConfigs()) {
        first.push_back(nameOf(config));
    }
    const std::vector<std::string> expected = {"root", "motors", "inner", "vacuum", "shutter"};
    assert(first == expected);

    // A second walk starts over and yields the same sequence.
    const auto walk = file.walkConfigs();
    std::vector<std::string> second;
    for (auto it = walk.begin(); it != walk.end(); ++it) {
        second.push_back(nameOf(*it));
    }
    assert(second == first);

    // Groups come before any of their descendants.
    const auto groupPos = std::find(first.begin(), first.end(), "inner");
    const auto childPos = std::find(first.begin(), first.end(), "vacuum");
    assert(groupPos < childPos);

    std::vector<std::string> below;
    for (const auto& config : file.root().walkConfigs()) {
        below.push_back(nameOf(config));
    }
    assert(below == std::vector<std::string>({"motors", "inner", "vacuum", "shutter"}));

    const ovf::ConfigurationGroup empty;
    assert(empty.walkConfigs().begin() == empty.walkConfigs().end());
}

void testLookups() {
    const auto file = makeFile();

    const auto byDevice = file.getByDevice("xpp_mot_2");
    assert(byDevice.size() == 1U);
    assert(byDevice[0]->name == "motors");
    assert(file.getByDevice("xpp_mot").empty());

    const auto byPv = file.getByPv("XPP:GAUGE:02");
    assert(byPv.size() == 1U);
    assert(byPv[0]->name == "vacuum");
    assert(file.getByPv("XPP:GAUGE").empty());

    const auto safety = file.getByTag({"safety"});
    assert(safety.size() == 2U);
    assert(nameOf(*safety[0]) == "vacuum");
    assert(nameOf(*safety[1]) == "shutter");
    assert(file.getByTag({"motion", "vacuum"}).size() == 2U);
    assert(file.getByTag({}).empty());
    assert(file.getByTag({"optics"}).empty());
}

void testKindsAndDescriptions() {
    const auto file = makeFile();
    assert(file.rootNode().kind() == ovf::ConfigurationKind::Group);
    assert(file.rootNode().describe() == "ConfigurationGroup 'root'");
    assert(file.version() == 0);
    assert(file.root().values.count("nominal") == 1U);

    const ovf::Configuration tool = ovf::ToolConfiguration{};
    assert(tool.kind() == ovf::ConfigurationKind::Tool);
    assert(tool.describe() == "ToolConfiguration");
    assert(tool.as<ovf::ToolConfiguration>() != nullptr);
    assert(tool.as<ovf::PvConfiguration>() == nullptr);
}

void testValidator() {
    assert(ovf::ConfigurationValidator::validate(makeFile()).empty());

    auto tool = std::make_shared<ovf::MockTool>("ping", std::vector<std::string>{"alive", "result.*"});
    const auto check = std::make_shared<ovf::Equals>(ovf::Value{true});

    ovf::ToolConfiguration ping;
    ping.tool = tool;
    ping.byAttr = {{"alive", {check}}, {"result.host_a", {check}}, {"latency", {check}}};

    ovf::ToolConfiguration noTool;
    noTool.byAttr = {{"alive", {check}}};

    ovf::DeviceConfiguration noDevices;
    noDevices.byAttr = {{"x", {nullptr}}};

    ovf::DeviceConfiguration repeated;
    repeated.devices = {"a", "a"};
    repeated.byAttr = {{"x", {check}}};

    ovf::ConfigurationGroup emptyGroup;
    emptyGroup.name = "empty";

    ovf::ConfigurationGroup root;
    root.configs = {ping, noTool, noDevices, repeated, emptyGroup};

    const auto issues = ovf::ConfigurationValidator::validate(ovf::ConfigurationFile(root, 3));
    assert(ovf::ConfigurationValidator::hasErrors(issues));

    const auto mentions = [&](ovf::ValidationSeverity severity, const std::string& text) {
        return std::any_of(issues.begin(), issues.end(), [&](const ovf::ValidationIssue& issue) {
            return issue.severity == severity && issue.message.find(text) != std::string::npos;
        });
    };
    assert(mentions(ovf::ValidationSeverity::Error, "version 3"));
    assert(mentions(ovf::ValidationSeverity::Error, "latency"));
    assert(!mentions(ovf::ValidationSeverity::Error, "result.host_a"));
    assert(mentions(ovf::ValidationSeverity::Error, "has no tool"));
    assert(mentions(ovf::ValidationSeverity::Error, "names no devices"));
    assert(mentions(ovf::ValidationSeverity::Error, "null comparison"));
    assert(mentions(ovf::ValidationSeverity::Warning, "more than once"));
    assert(mentions(ovf::ValidationSeverity::Warning, "contains no configurations"));

    std::vector<ovf::ValidationIssue> warningsOnly = {{ovf::ValidationSeverity::Warning, "w"}};
    assert(!ovf::ConfigurationValidator::hasErrors(warningsOnly));
}

} // namespace

int main() {
    testWalkOrderAndRestart();
    testLookups();
    testKindsAndDescriptions();
    testValidator();
    std::cout << "configuration_tests passed\n";
    return 0;
}
