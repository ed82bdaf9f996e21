/**
 * @file i_signal.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "openverify/core/value.hpp"

namespace ovf {

/**
 * @brief Live data-source handle (one control point).
 *
 * Signals are consumed only through `DataCache`, which deduplicates concurrent
 * reads. Implementations must tolerate `read()` being called from several
 * worker threads.
 */
class ISignal {
public:
    virtual ~ISignal() = default;

    /**
     * @brief Control-point name, e.g. "TST:MTR:01.RBV".
     */
    virtual std::string name() const = 0;

    /**
     * @brief Read the current value.
     *
     * @param timeout Maximum time to wait for the connection and the reply.
     * @return Current value; `std::monostate` when the source reports no data.
     * @throws ConnectionTimeoutError when the source cannot be reached in time.
     */
    virtual Value read(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Creates signal handles from raw control-point names.
 *
 * Existence is not checked at creation; an unknown point surfaces at read time.
 */
class ISignalFactory {
public:
    virtual ~ISignalFactory() = default;

    virtual std::shared_ptr<ISignal> create(const std::string& pvName) = 0;
};

} // namespace ovf
