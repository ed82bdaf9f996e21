/**
 * @file i_device_database.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <memory>
#include <string>

#include "openverify/data/i_signal.hpp"

namespace ovf {

/**
 * @brief Already-connected device exposing named attributes.
 */
class IDevice {
public:
    virtual ~IDevice() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Resolve an attribute (dotted sub-device paths allowed) to its signal.
     * @return nullptr when the device has no such attribute.
     */
    virtual std::shared_ptr<ISignal> attribute(const std::string& dottedName) const = 0;
};

/**
 * @brief Resolves device names to live device handles.
 */
class IDeviceDatabase {
public:
    virtual ~IDeviceDatabase() = default;

    /**
     * @brief Look up and instantiate a device by name.
     *
     * @param name Device name as used in configurations.
     * @param outDevice Device handle on success.
     * @param outError "not found" or connection failure text on failure.
     * @return true when the device was resolved.
     */
    virtual bool resolve(const std::string& name,
                         std::shared_ptr<IDevice>& outDevice,
                         std::string& outError) = 0;
};

} // namespace ovf
