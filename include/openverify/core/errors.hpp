/**
 * @file errors.hpp
 * @brief openVerify source file.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ovf {

/**
 * @brief A data source could not be reached or did not answer in time.
 *
 * This is the "expected" acquisition failure: leaves map it to the comparison's
 * if-disconnected severity instead of an internal error.
 */
class ConnectionTimeoutError : public std::runtime_error {
public:
    explicit ConnectionTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A device does not expose the requested attribute.
 */
class AttributeLookupError : public std::runtime_error {
public:
    explicit AttributeLookupError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A tool result key is not part of the tool's result schema.
 */
class ResultKeyError : public std::runtime_error {
public:
    explicit ResultKeyError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Short type name for known exception classes.
 */
const char* exceptionTypeName(const std::exception& ex);

/**
 * @brief Render as "<Type>: <message>".
 */
std::string describeException(const std::exception& ex);

/**
 * @brief Render an exception pointer, including non-std exceptions.
 */
std::string describeException(const std::exception_ptr& error);

} // namespace ovf
