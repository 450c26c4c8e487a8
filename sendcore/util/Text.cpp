/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Text.hpp"
#include <algorithm>

namespace sendcore {

// These avoid the C library's character classes,
// since those change with the current locale.
static bool
isSpace(char c)
{
    return ' ' == c || '\t' == c || '\n' == c || '\r' == c ||
        '\f' == c || '\v' == c;
}

static char
toLower(char c)
{
    return 'A' <= c && c <= 'Z' ? c - 'A' + 'a' : c;
}

std::string
textTrim(const std::string &text)
{
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (end <= begin)
        return std::string();
    return std::string(begin, end);
}

std::string
textLower(const std::string &text)
{
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), toLower);
    return out;
}

bool
textStartsWith(const std::string &text, const std::string &prefix)
{
    return 0 == text.compare(0, prefix.size(), prefix);
}

} // namespace sendcore
