/**
 * @file errors.cpp
 * @brief openVerify source file.
 */

#include "openverify/core/errors.hpp"

#include <future>
#include <new>
#include <variant>

namespace ovf {

const char* exceptionTypeName(const std::exception& ex) {
    if (dynamic_cast<const ConnectionTimeoutError*>(&ex) != nullptr) {
        return "ConnectionTimeoutError";
    }
    if (dynamic_cast<const AttributeLookupError*>(&ex) != nullptr) {
        return "AttributeLookupError";
    }
    if (dynamic_cast<const ResultKeyError*>(&ex) != nullptr) {
        return "ResultKeyError";
    }
    if (dynamic_cast<const std::bad_variant_access*>(&ex) != nullptr) {
        return "bad_variant_access";
    }
    if (dynamic_cast<const std::future_error*>(&ex) != nullptr) {
        return "future_error";
    }
    if (dynamic_cast<const std::bad_alloc*>(&ex) != nullptr) {
        return "bad_alloc";
    }
    if (dynamic_cast<const std::out_of_range*>(&ex) != nullptr) {
        return "out_of_range";
    }
    if (dynamic_cast<const std::invalid_argument*>(&ex) != nullptr) {
        return "invalid_argument";
    }
    if (dynamic_cast<const std::logic_error*>(&ex) != nullptr) {
        return "logic_error";
    }
    if (dynamic_cast<const std::runtime_error*>(&ex) != nullptr) {
        return "runtime_error";
    }
    return "exception";
}

std::string describeException(const std::exception& ex) {
    return std::string(exceptionTypeName(ex)) + ": " + ex.what();
}

std::string describeException(const std::exception_ptr& error) {
    if (!error) {
        return "no exception";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return describeException(ex);
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace ovf
