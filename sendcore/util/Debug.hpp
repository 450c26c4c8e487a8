/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_UTIL_DEBUG_HPP
#define SENDCORE_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define SC_DebugLevel(level, ...)   \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        SC_DebugLog(__VA_ARGS__);   \
    }                               \
}

namespace sendcore {

/**
 * Opens the log file, rotating the previous one out of the way.
 * @param path The log file, such as "/home/me/.sendcore/sendcore.log".
 * An empty path logs to stdout only.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

void SC_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
;

} // namespace sendcore

#endif
