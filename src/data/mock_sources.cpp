/**
 * @file mock_sources.cpp
 * @brief openVerify source file.
 */

#include "openverify/data/mock_sources.hpp"

#include <stdexcept>
#include <thread>

#include "openverify/core/errors.hpp"

namespace ovf {

MockSignal::MockSignal(std::string name, Value value) : name_(std::move(name)), value_(std::move(value)) {}

std::string MockSignal::name() const { return name_; }

Value MockSignal::read(std::chrono::milliseconds timeout) {
    ++readCount_;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = readDelay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        throw ConnectionTimeoutError("Timed out connecting to " + name_ + " after " +
                                     std::to_string(timeout.count()) + " ms");
    }
    if (!readFailure_.empty()) {
        throw std::runtime_error(readFailure_);
    }
    if (!queued_.empty()) {
        auto next = std::move(queued_.front());
        queued_.pop_front();
        return next;
    }
    return value_;
}

void MockSignal::setValue(Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(value);
}

void MockSignal::queueValues(const std::vector<Value>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    queued_.insert(queued_.end(), values.begin(), values.end());
}

void MockSignal::setConnected(bool connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = connected;
}

void MockSignal::setReadFailure(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    readFailure_ = std::move(message);
}

void MockSignal::setReadDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    readDelay_ = delay;
}

std::size_t MockSignal::readCount() const noexcept { return readCount_.load(); }

std::shared_ptr<ISignal> MockSignalFactory::create(const std::string& pvName) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rejected_.count(pvName) != 0U) {
            throw std::invalid_argument("Invalid control point name: " + pvName);
        }
        ++created_;
    }
    return signal(pvName);
}

std::shared_ptr<MockSignal> MockSignalFactory::signal(const std::string& pvName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = signals_[pvName];
    if (!slot) {
        slot = std::make_shared<MockSignal>(pvName);
    }
    return slot;
}

void MockSignalFactory::rejectName(const std::string& pvName) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejected_.insert(pvName);
}

std::size_t MockSignalFactory::createdCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

MockDevice::MockDevice(std::string name) : name_(std::move(name)) {}

std::string MockDevice::name() const { return name_; }

std::shared_ptr<ISignal> MockDevice::attribute(const std::string& dottedName) const {
    const auto it = attributes_.find(dottedName);
    if (it == attributes_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<MockSignal> MockDevice::addAttribute(const std::string& dottedName, Value value) {
    auto signal = std::make_shared<MockSignal>(name_ + "." + dottedName, std::move(value));
    attributes_[dottedName] = signal;
    return signal;
}

bool MockDeviceDatabase::resolve(const std::string& name,
                                 std::shared_ptr<IDevice>& outDevice,
                                 std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++resolveCount_;
    const auto it = devices_.find(name);
    if (it == devices_.end()) {
        outError = "Device not found: " + name;
        return false;
    }
    if (unreachable_.count(name) != 0U) {
        outError = "Device unreachable: " + name;
        return false;
    }
    outDevice = it->second;
    return true;
}

void MockDeviceDatabase::addDevice(std::shared_ptr<MockDevice> device) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto name = device->name();
    devices_[name] = std::move(device);
}

void MockDeviceDatabase::setUnreachable(const std::string& name, bool unreachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unreachable) {
        unreachable_.insert(name);
    } else {
        unreachable_.erase(name);
    }
}

std::size_t MockDeviceDatabase::resolveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveCount_;
}

MockTool::MockTool(std::string key, std::vector<std::string> legalKeys)
    : key_(std::move(key)), legalKeys_(std::move(legalKeys)) {}

std::string MockTool::key() const { return key_; }

std::string MockTool::describe() const { return "MockTool(" + key_ + ")"; }

bool MockTool::validateResultKey(const std::string& resultKey, std::string& outError) const {
    for (const auto& legal : legalKeys_) {
        if (legal == resultKey) {
            return true;
        }
        if (legal.size() >= 2U && legal.compare(legal.size() - 2U, 2U, ".*") == 0) {
            const auto prefix = legal.substr(0, legal.size() - 1U);
            if (resultKey.size() > prefix.size() && resultKey.compare(0, prefix.size(), prefix) == 0) {
                return true;
            }
        }
    }
    outError = "Invalid result key '" + resultKey + "' for " + describe();
    return false;
}

ToolResult MockTool::run() {
    ++runCount_;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = runDelay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (disconnected_) {
        throw ConnectionTimeoutError(describe() + " could not reach its targets");
    }
    return result_;
}

void MockTool::setResult(ToolResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_ = std::move(result);
}

void MockTool::setDisconnected(bool disconnected) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_ = disconnected;
}

void MockTool::setRunDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    runDelay_ = delay;
}

std::size_t MockTool::runCount() const noexcept { return runCount_.load(); }

} // namespace ovf
