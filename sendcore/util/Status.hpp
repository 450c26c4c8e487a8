/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_UTIL_STATUS_HPP
#define SENDCORE_UTIL_STATUS_HPP

#include "Codes.hpp"
#include <ostream>
#include <string>

namespace sendcore {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tSC_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tSC_CC value()              const { return value_; }
    const std::string &message() const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == SC_CC_Ok; }

    /**
     * Writes the error to the debug log, if there is one.
     * Returns the status unchanged, for chaining.
     */
    const Status &
    log() const;

private:
    // Error information:
    tSC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define SC_ERROR(value, message) \
    sendcore::Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define SC_CHECK(f) \
    do { \
        sendcore::Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace sendcore

#endif
