/**
 * @file mock_checkout_demo.cpp
 * @brief openVerify source file.
 */

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "openverify/check/comparison.hpp"
#include "openverify/config/configuration.hpp"
#include "openverify/config/configuration_validator.hpp"
#include "openverify/data/mock_sources.hpp"
#include "openverify/engine/execution.hpp"
#include "openverify/prepare/prepared_file.hpp"

int main() {
    auto database = std::make_shared<ovf::MockDeviceDatabase>();
    auto stage = std::make_shared<ovf::MockDevice>("xpp_stage");
    stage->addAttribute("x.user_readback", ovf::Value{0.02});
    stage->addAttribute("y.user_readback", ovf::Value{1.4});
    database->addDevice(stage);

    auto factory = std::make_shared<ovf::MockSignalFactory>();
    factory->signal("XPP:GAUGE:01")->setValue(ovf::Value{2.0e-8});
    factory->signal("XPP:VALVE:01:OPN")->setValue(ovf::Value{std::int64_t{1}});
    factory->signal("XPP:VALVE:02:OPN")->setConnected(false);

    auto ping = std::make_shared<ovf::MockTool>("ping:xpp-daq", std::vector<std::string>{"alive", "time.*"});
    ovf::ToolResult pingResult;
    pingResult.set("alive", ovf::Value{true});
    pingResult.set("time.avg", ovf::Value{0.7});
    ping->setResult(pingResult);

    ovf::ComparisonPolicy nearZero;
    nearZero.name = "near zero";
    nearZero.severityOnFailure = ovf::Severity::Warning;

    ovf::DeviceConfiguration stageCheck;
    stageCheck.name = "stage at home";
    stageCheck.tags = {"motion"};
    stageCheck.devices = {"xpp_stage"};
    stageCheck.byAttr = {{"x.user_readback", {}}, {"y.user_readback", {}}};
    stageCheck.shared = {std::make_shared<ovf::Range>(-0.05, 0.05, nearZero)};

    ovf::ComparisonPolicy warnWhenDown;
    warnWhenDown.ifDisconnected = ovf::Severity::Warning;

    ovf::PvConfiguration vacuum;
    vacuum.name = "vacuum";
    vacuum.tags = {"vacuum"};
    vacuum.byPv = {
        {"XPP:GAUGE:01", {std::make_shared<ovf::Range>(0.0, 1.0e-6)}},
        {"XPP:VALVE:01:OPN", {std::make_shared<ovf::Equals>(ovf::Value{std::int64_t{1}})}},
        {"XPP:VALVE:02:OPN", {std::make_shared<ovf::Equals>(ovf::Value{std::int64_t{1}}, 0.0, warnWhenDown)}},
    };

    ovf::ToolConfiguration daq;
    daq.name = "daq reachable";
    daq.tool = ping;
    daq.byAttr = {
        {"alive", {std::make_shared<ovf::Equals>(ovf::Value{true})}},
        {"time.avg", {std::make_shared<ovf::Range>(0.0, 1.0)}},
    };

    ovf::ConfigurationGroup root;
    root.name = "xpp checkout";
    root.mode = ovf::GroupResultMode::All;
    root.configs = {stageCheck, vacuum, daq};
    const ovf::ConfigurationFile file(root);

    const auto issues = ovf::ConfigurationValidator::validate(file);
    for (const auto& issue : issues) {
        std::cerr << (issue.severity == ovf::ValidationSeverity::Error ? "error: " : "warning: ")
                  << issue.message << '\n';
    }
    if (ovf::ConfigurationValidator::hasErrors(issues)) {
        return 1;
    }

    const auto options = ovf::ExecutionOptions::fromEnvironment();
    auto cache = std::make_shared<ovf::DataCache>(factory, ovf::CacheOptions::fromEnvironment());
    auto prepared = ovf::PreparedFile::fromConfig(file, database.get(), cache);

    const auto prefetchFailures = prepared->fillCache(options);
    const auto overall = prepared->compare(options);

    for (const auto item : prepared->walkComparisons()) {
        const auto result = ovf::resultFromComparison(item);
        std::string label;
        if (const auto* leaf = std::get_if<ovf::PreparedComparison*>(&item)) {
            label = (*leaf)->identifier();
        } else {
            label = std::get<const ovf::FailedConfiguration*>(item)->config->describe();
        }
        std::cout << ovf::toString(result.severity) << "  " << label;
        if (!result.reason.empty()) {
            std::cout << "  (" << result.reason << ")";
        }
        std::cout << '\n';
    }

    for (auto& group : prepared->walkGroups()) {
        std::cout << "group " << group.path() << ": " << ovf::toString(group.result()->severity) << '\n';
    }
    std::cout << "prefetch failures=" << prefetchFailures << " fetches=" << cache->fetchCount()
              << " overall=" << ovf::toString(overall.severity) << '\n';
    return overall.severity == ovf::Severity::Success ? 0 : 2;
}
