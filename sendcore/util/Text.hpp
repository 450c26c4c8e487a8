/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for user-typed text.
 */

#ifndef SENDCORE_UTIL_TEXT_HPP
#define SENDCORE_UTIL_TEXT_HPP

#include <string>

namespace sendcore {

/**
 * Removes leading and trailing whitespace.
 */
std::string
textTrim(const std::string &text);

/**
 * Lower-cases ASCII letters, leaving everything else alone.
 */
std::string
textLower(const std::string &text);

bool
textStartsWith(const std::string &text, const std::string &prefix);

} // namespace sendcore

#endif
