/**
 * @file mock_sources.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "openverify/data/i_device_database.hpp"
#include "openverify/data/i_signal.hpp"
#include "openverify/data/i_tool.hpp"

namespace ovf {

/**
 * @brief In-memory signal with fault injection.
 */
class MockSignal final : public ISignal {
public:
    explicit MockSignal(std::string name, Value value = {});

    std::string name() const override;
    Value read(std::chrono::milliseconds timeout) override;

    void setValue(Value value);
    /**
     * @brief Values returned by the next reads, before falling back to `setValue()`.
     */
    void queueValues(const std::vector<Value>& values);
    void setConnected(bool connected);
    /**
     * @brief Make every read throw `std::runtime_error` with this message (empty disables).
     */
    void setReadFailure(std::string message);
    void setReadDelay(std::chrono::milliseconds delay);
    std::size_t readCount() const noexcept;

private:
    std::string name_;
    mutable std::mutex mutex_;
    Value value_;
    std::deque<Value> queued_;
    bool connected_ = true;
    std::string readFailure_;
    std::chrono::milliseconds readDelay_{0};
    std::atomic<std::size_t> readCount_{0};
};

/**
 * @brief Signal factory handing out `MockSignal`s by control-point name.
 */
class MockSignalFactory final : public ISignalFactory {
public:
    std::shared_ptr<ISignal> create(const std::string& pvName) override;

    /**
     * @brief The signal for a name, created on first use.
     */
    std::shared_ptr<MockSignal> signal(const std::string& pvName);
    /**
     * @brief Make `create()` throw `std::invalid_argument` for this name.
     */
    void rejectName(const std::string& pvName);
    std::size_t createdCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<MockSignal>> signals_;
    std::set<std::string> rejected_;
    std::size_t created_ = 0;
};

class MockDevice final : public IDevice {
public:
    explicit MockDevice(std::string name);

    std::string name() const override;
    std::shared_ptr<ISignal> attribute(const std::string& dottedName) const override;

    /**
     * @brief Add an attribute; the signal is named "<device>.<attribute>".
     */
    std::shared_ptr<MockSignal> addAttribute(const std::string& dottedName, Value value = {});

private:
    std::string name_;
    std::unordered_map<std::string, std::shared_ptr<MockSignal>> attributes_;
};

class MockDeviceDatabase final : public IDeviceDatabase {
public:
    bool resolve(const std::string& name,
                 std::shared_ptr<IDevice>& outDevice,
                 std::string& outError) override;

    void addDevice(std::shared_ptr<MockDevice> device);
    /**
     * @brief Keep the device registered but fail resolution as unreachable.
     */
    void setUnreachable(const std::string& name, bool unreachable);
    std::size_t resolveCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<MockDevice>> devices_;
    std::set<std::string> unreachable_;
    std::size_t resolveCount_ = 0;
};

/**
 * @brief Tool returning a fixed result, with a declared set of legal result keys.
 *
 * A legal key ending in ".*" accepts any key with that prefix.
 */
class MockTool final : public ITool {
public:
    MockTool(std::string key, std::vector<std::string> legalKeys);

    std::string key() const override;
    std::string describe() const override;
    bool validateResultKey(const std::string& resultKey, std::string& outError) const override;
    ToolResult run() override;

    void setResult(ToolResult result);
    void setDisconnected(bool disconnected);
    void setRunDelay(std::chrono::milliseconds delay);
    std::size_t runCount() const noexcept;

private:
    std::string key_;
    std::vector<std::string> legalKeys_;
    mutable std::mutex mutex_;
    ToolResult result_;
    bool disconnected_ = false;
    std::chrono::milliseconds runDelay_{0};
    std::atomic<std::size_t> runCount_{0};
};

} // namespace ovf
