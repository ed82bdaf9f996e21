/**
 * @file execution_tests.cpp
 * @brief openVerify source file.
 */

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "openverify/check/comparison.hpp"
#include "openverify/config/configuration.hpp"
#include "openverify/data/mock_sources.hpp"
#include "openverify/engine/execution.hpp"
#include "openverify/prepare/prepared_configuration.hpp"
#include "openverify/prepare/prepared_file.hpp"

namespace {

ovf::ComparisonPtr equalsInt(std::int64_t expected, ovf::ComparisonPolicy policy = {}) {
    return std::make_shared<ovf::Equals>(ovf::Value{expected}, 0.0, policy);
}

ovf::PvConfiguration pointCheck(const std::string& name, const std::string& pv, ovf::ComparisonPtr comparison) {
    ovf::PvConfiguration check;
    check.name = name;
    check.byPv = {{pv, {std::move(comparison)}}};
    return check;
}

std::vector<ovf::Severity> leafSeverities(ovf::PreparedConfiguration& root) {
    std::vector<ovf::Severity> severities;
    for (const auto item : root.walkComparisons()) {
        severities.push_back(ovf::resultFromComparison(item).severity);
    }
    return severities;
}

void testAllPointChecksPass() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    factory->signal("XPP:A")->setValue(ovf::Value{std::int64_t{1}});
    factory->signal("XPP:B")->setValue(ovf::Value{std::int64_t{2}});

    ovf::ConfigurationGroup root;
    root.configs = {pointCheck("a", "XPP:A", equalsInt(1)), pointCheck("b", "XPP:B", equalsInt(2))};

    auto prepared = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root), nullptr,
                                                  std::make_shared<ovf::DataCache>(factory));
    const auto result = prepared->compare();
    assert(result.severity == ovf::Severity::Success);
    assert(prepared->root().result().has_value());
    assert(prepared->root().children()[0]->result()->severity == ovf::Severity::Success);
}

void testAttributeFailureFailsGroup() {
    auto database = std::make_shared<ovf::MockDeviceDatabase>();
    auto motor = std::make_shared<ovf::MockDevice>("xpp_mot_1");
    motor->addAttribute("user_readback", ovf::Value{std::int64_t{1}});
    database->addDevice(motor);

    ovf::DeviceConfiguration good;
    good.devices = {"xpp_mot_1"};
    good.byAttr = {{"user_readback", {equalsInt(1)}}};

    ovf::DeviceConfiguration bad;
    bad.devices = {"xpp_mot_1"};
    bad.byAttr = {{"user_setpoint", {equalsInt(1)}}};

    ovf::ConfigurationGroup root;
    root.mode = ovf::GroupResultMode::All;
    root.configs = {good, bad};

    auto prepared = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root), database.get());
    assert(prepared->compare().severity == ovf::Severity::Error);

    std::size_t failures = 0;
    std::size_t comparisons = 0;
    for (const auto item : prepared->walkComparisons()) {
        if (std::holds_alternative<const ovf::FailedConfiguration*>(item)) {
            ++failures;
        } else {
            ++comparisons;
            assert(ovf::resultFromComparison(item).severity == ovf::Severity::Success);
        }
    }
    assert(failures == 1U);
    assert(comparisons == 1U);

    const auto& badNode = *prepared->root().children()[1];
    assert(badNode.result()->severity == ovf::Severity::Error);
    assert(badNode.result()->reason == "At least one configuration failed to initialize");
}

void testAnyModeTakesBestChild() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    factory->signal("XPP:E")->setValue(ovf::Value{std::int64_t{0}});
    factory->signal("XPP:W")->setValue(ovf::Value{std::int64_t{0}});
    factory->signal("XPP:S")->setValue(ovf::Value{std::int64_t{1}});

    ovf::ComparisonPolicy warn;
    warn.severityOnFailure = ovf::Severity::Warning;

    ovf::ConfigurationGroup root;
    root.mode = ovf::GroupResultMode::Any;
    root.configs = {pointCheck("e", "XPP:E", equalsInt(1)),
                    pointCheck("w", "XPP:W", equalsInt(1, warn)),
                    pointCheck("s", "XPP:S", equalsInt(1))};

    auto prepared = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root), nullptr,
                                                  std::make_shared<ovf::DataCache>(factory));
    assert(prepared->compare().severity == ovf::Severity::Success);
    const auto severities = leafSeverities(prepared->root());
    assert(severities == std::vector<ovf::Severity>(
                             {ovf::Severity::Error, ovf::Severity::Warning, ovf::Severity::Success}));

    // A preparation failure forces Error even in Any mode.
    ovf::DeviceConfiguration unreachable;
    unreachable.devices = {"xpp_mot_9"};
    unreachable.byAttr = {{"user_readback", {equalsInt(1)}}};
    root.configs.push_back(unreachable);
    ovf::MockDeviceDatabase database;
    auto withFailure = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root), &database,
                                                     std::make_shared<ovf::DataCache>(factory));
    const auto forced = withFailure->compare();
    assert(forced.severity == ovf::Severity::Error);
    assert(forced.reason == "At least one configuration failed to initialize");
}

void testDisconnectedToolUsesLeafPolicy() {
    auto tool = std::make_shared<ovf::MockTool>("ping:xpp-daq", std::vector<std::string>{"alive", "time.*"});
    tool->setDisconnected(true);

    ovf::ComparisonPolicy warnWhenDown;
    warnWhenDown.ifDisconnected = ovf::Severity::Warning;
    ovf::ComparisonPolicy ignoreWhenDown;
    ignoreWhenDown.ifDisconnected = ovf::Severity::Success;

    ovf::ToolConfiguration ping;
    ping.tool = tool;
    ping.byAttr = {{"alive", {std::make_shared<ovf::Equals>(ovf::Value{true}, 0.0, warnWhenDown)}},
                   {"time.avg", {std::make_shared<ovf::Range>(0.0, 5.0, ignoreWhenDown)}}};

    ovf::ConfigurationGroup root;
    root.configs = {ping};

    auto prepared = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root));
    assert(prepared->compare().severity == ovf::Severity::Warning);
    const auto severities = leafSeverities(prepared->root());
    assert(severities == std::vector<ovf::Severity>({ovf::Severity::Warning, ovf::Severity::Success}));
    // Both leaves share one tool run.
    assert(tool->runCount() == 1U);

    for (const auto item : prepared->walkComparisons()) {
        const auto* leaf = std::get<ovf::PreparedComparison*>(item);
        assert(leaf->result()->reason == "Unable to retrieve data for comparison: " + leaf->identifier());
    }
}

void testToolKeyMissingFromResult() {
    auto tool = std::make_shared<ovf::MockTool>("ping:xpp-ctrl", std::vector<std::string>{"alive", "time.*"});
    ovf::ToolResult result;
    result.set("alive", ovf::Value{true});
    result.set("time.avg", ovf::Value{1.5});
    tool->setResult(result);

    ovf::ComparisonPolicy warnOnFailure;
    warnOnFailure.severityOnFailure = ovf::Severity::Warning;

    auto prepared = ovf::PreparedToolConfiguration::fromTool(
        tool,
        {{"alive", {std::make_shared<ovf::Equals>(ovf::Value{true})}},
         {"time.avg", {std::make_shared<ovf::Range>(0.0, 2.0)}},
         {"time.max", {std::make_shared<ovf::Range>(0.0, 2.0, warnOnFailure)}}});

    assert(prepared->compare().severity == ovf::Severity::Warning);
    const auto& missing = *prepared->comparisons()[2];
    assert(missing.identifier() == "time.max");
    assert(missing.result()->severity == ovf::Severity::Warning);
    assert(missing.result()->reason.find("Provided key is invalid for tool result MockTool(ping:xpp-ctrl)") == 0U);

    auto* toolLeaf = dynamic_cast<ovf::PreparedToolComparison*>(prepared->comparisons()[0].get());
    assert(toolLeaf != nullptr);
    assert(toolLeaf->data().has_value());
    assert(toolLeaf->data()->size() == 2U);
}

void testToolEntryWithoutDataSkipsPredicate() {
    auto tool = std::make_shared<ovf::MockTool>("ping:xpp-ctrl", std::vector<std::string>{"alive", "time.*"});
    ovf::ToolResult result;
    result.set("alive", ovf::Value{true});
    result.set("time.avg", ovf::Value{});
    tool->setResult(result);

    ovf::ComparisonPolicy warnWhenDown;
    warnWhenDown.ifDisconnected = ovf::Severity::Warning;

    auto prepared = ovf::PreparedToolConfiguration::fromTool(
        tool,
        {{"alive", {std::make_shared<ovf::Equals>(ovf::Value{true})}},
         {"time.avg", {std::make_shared<ovf::Range>(0.0, 2.0, warnWhenDown)}}});

    assert(prepared->compare().severity == ovf::Severity::Warning);
    const auto& empty = *prepared->comparisons()[1];
    assert(empty.identifier() == "time.avg");
    assert(empty.result()->severity == ovf::Severity::Warning);
    assert(empty.result()->reason.find("No data available for tool result MockTool(ping:xpp-ctrl) 'time.avg'") == 0U);
    assert(prepared->comparisons()[0]->result()->severity == ovf::Severity::Success);
}

void testFaultClassesMapToSeverities() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    factory->signal("XPP:DOWN")->setConnected(false);
    factory->signal("XPP:BROKEN")->setReadFailure("driver fault");
    factory->signal("XPP:EMPTY");
    factory->signal("XPP:TEXT")->setValue(ovf::Value{std::string("OUT")});

    ovf::ComparisonPolicy warnWhenDown;
    warnWhenDown.ifDisconnected = ovf::Severity::Warning;

    auto cache = std::make_shared<ovf::DataCache>(factory);
    auto prepared = ovf::PreparedPvConfiguration::fromPvs(
        {{"XPP:DOWN", {equalsInt(1, warnWhenDown)}},
         {"XPP:BROKEN", {equalsInt(1, warnWhenDown)}},
         {"XPP:EMPTY", {equalsInt(1, warnWhenDown)}},
         {"XPP:TEXT", {std::make_shared<ovf::Range>(0.0, 1.0)}}},
        {}, cache);
    prepared->compare();

    const auto resultFor = [&](const std::string& identifier) {
        for (const auto& leaf : prepared->comparisons()) {
            if (leaf->identifier() == identifier) {
                return *leaf->result();
            }
        }
        assert(false);
        return ovf::Result{};
    };

    // Timeouts follow the comparison's policy and are never internal errors.
    const auto down = resultFor("XPP:DOWN");
    assert(down.severity == ovf::Severity::Warning);

    const auto broken = resultFor("XPP:BROKEN");
    assert(broken.severity == ovf::Severity::InternalError);
    assert(broken.reason.find("XPP:BROKEN") != std::string::npos);
    assert(broken.reason.find("runtime_error: driver fault") != std::string::npos);
    assert(broken.reason.find("Equals(expected=1)") != std::string::npos);

    const auto empty = resultFor("XPP:EMPTY");
    assert(empty.severity == ovf::Severity::Warning);
    assert(empty.reason.find("No data available") == 0U);

    const auto text = resultFor("XPP:TEXT");
    assert(text.severity == ovf::Severity::InternalError);
    assert(text.reason.find("Failed to run 'XPP:TEXT'") == 0U);

    assert(prepared->result()->severity == ovf::Severity::InternalError);
}

void testRerunOverwritesResults() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    auto signal = factory->signal("XPP:VALVE");
    signal->setValue(ovf::Value{std::int64_t{1}});
    auto cache = std::make_shared<ovf::DataCache>(factory);

    ovf::ConfigurationGroup root;
    root.configs = {pointCheck("valve", "XPP:VALVE", equalsInt(1))};
    auto prepared = ovf::PreparedFile::fromConfig(ovf::ConfigurationFile(root), nullptr, cache);
    assert(prepared->compare().severity == ovf::Severity::Success);

    // Same session: the cached value is reused.
    signal->setValue(ovf::Value{std::int64_t{0}});
    assert(prepared->compare().severity == ovf::Severity::Success);
    assert(signal->readCount() == 1U);

    cache->clear();
    assert(prepared->compare().severity == ovf::Severity::Error);
    const auto* leaf = dynamic_cast<const ovf::PreparedSignalComparison*>(
        prepared->root().children()[0]->comparisons()[0].get());
    assert(leaf != nullptr);
    assert(std::get<std::int64_t>(leaf->data()) == 0);
}

void testParallelMatchesSequential() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    ovf::ConfigurationGroup root;
    ovf::ConfigurationGroup anyGroup;
    anyGroup.mode = ovf::GroupResultMode::Any;

    ovf::ComparisonPolicy warn;
    warn.severityOnFailure = ovf::Severity::Warning;
    warn.ifDisconnected = ovf::Severity::Warning;

    for (int i = 0; i < 24; ++i) {
        const auto pv = "XPP:CH" + std::to_string(i);
        auto signal = factory->signal(pv);
        signal->setValue(ovf::Value{std::int64_t{i % 3}});
        signal->setReadDelay(std::chrono::milliseconds(2));
        if (i % 7 == 0) {
            signal->setConnected(false);
        }
        auto check = pointCheck("ch" + std::to_string(i), pv, equalsInt(0, (i % 2) == 0 ? warn : ovf::ComparisonPolicy{}));
        if (i % 4 == 0) {
            anyGroup.configs.push_back(check);
        } else {
            root.configs.push_back(check);
        }
    }
    root.configs.push_back(anyGroup);
    const ovf::ConfigurationFile file(root);

    ovf::ExecutionOptions parallel;
    parallel.parallel = true;
    parallel.maxWorkers = 4;
    auto first = ovf::PreparedFile::fromConfig(file, nullptr, std::make_shared<ovf::DataCache>(factory));
    const auto parallelResult = first->compare(parallel);

    ovf::ExecutionOptions sequential;
    sequential.parallel = false;
    auto second = ovf::PreparedFile::fromConfig(file, nullptr, std::make_shared<ovf::DataCache>(factory));
    const auto sequentialResult = second->compare(sequential);

    assert(parallelResult.severity == sequentialResult.severity);
    assert(leafSeverities(first->root()) == leafSeverities(second->root()));
    assert(first->root().children().back()->result()->severity ==
           second->root().children().back()->result()->severity);

    ovf::ExecutionOptions unbounded;
    unbounded.maxWorkers = 0;
    auto third = ovf::PreparedFile::fromConfig(file, nullptr, std::make_shared<ovf::DataCache>(factory));
    assert(third->compare(unbounded).severity == sequentialResult.severity);
}

void testRunComparisonsDirectly() {
    auto factory = std::make_shared<ovf::MockSignalFactory>();
    factory->signal("XPP:ONE")->setValue(ovf::Value{std::int64_t{1}});
    factory->signal("XPP:TWO")->setConnected(false);
    auto cache = std::make_shared<ovf::DataCache>(factory);

    auto one = ovf::PreparedSignalComparison::fromPvName("XPP:ONE", equalsInt(1), cache);
    auto two = ovf::PreparedSignalComparison::fromPvName("XPP:TWO", equalsInt(1), cache);
    std::vector<ovf::PreparedComparison*> leaves = {one.get(), nullptr, two.get()};

    assert(ovf::prefetchComparisons(leaves) == 1U);
    assert(!one->result().has_value());
    ovf::runComparisons(leaves);
    assert(one->result()->severity == ovf::Severity::Success);
    assert(two->result()->severity == ovf::Severity::Error);

    ovf::runComparisons({});
    assert(ovf::prefetchComparisons({}) == 0U);
}

void testExecutionOptionsFromEnvironment() {
    ::setenv("OVF_PARALLEL", "off", 1);
    ::setenv("OVF_MAX_WORKERS", "3", 1);
    auto options = ovf::ExecutionOptions::fromEnvironment();
    assert(!options.parallel);
    assert(options.maxWorkers == 3U);

    ::setenv("OVF_PARALLEL", "maybe", 1);
    ::setenv("OVF_MAX_WORKERS", "many", 1);
    options = ovf::ExecutionOptions::fromEnvironment();
    assert(options.parallel == ovf::ExecutionOptions{}.parallel);
    assert(options.maxWorkers == ovf::ExecutionOptions{}.maxWorkers);
    ::unsetenv("OVF_PARALLEL");
    ::unsetenv("OVF_MAX_WORKERS");
}

} // namespace

int main() {
    testAllPointChecksPass();
    testAttributeFailureFailsGroup();
    testAnyModeTakesBestChild();
    testDisconnectedToolUsesLeafPolicy();
    testToolKeyMissingFromResult();
    testToolEntryWithoutDataSkipsPredicate();
    testFaultClassesMapToSeverities();
    testRerunOverwritesResults();
    testParallelMatchesSequential();
    testRunComparisonsDirectly();
    testExecutionOptionsFromEnvironment();
    std::cout << "execution_tests passed\n";
    return 0;
}
