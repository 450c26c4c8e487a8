/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../sendcore/util/Status.hpp"
#include <stdint.h>

/**
 * Reads a whole-number argument.
 */
sendcore::Status
argUint(uint64_t &result, const char *arg, const char *name);

/**
 * Reads a decimal argument.
 */
sendcore::Status
argNumber(double &result, const char *arg, const char *name);

#endif
