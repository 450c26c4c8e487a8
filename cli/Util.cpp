/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include <errno.h>
#include <stdlib.h>

using namespace sendcore;

Status
argUint(uint64_t &result, const char *arg, const char *name)
{
    char *end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(arg, &end, 10);
    if (!*arg || *end || errno || '-' == *arg)
        return SC_ERROR(SC_CC_ParseError,
                        std::string("Bad ") + name + ": " + arg);

    result = value;
    return Status();
}

Status
argNumber(double &result, const char *arg, const char *name)
{
    char *end = nullptr;
    errno = 0;
    double value = strtod(arg, &end);
    if (!*arg || *end || errno)
        return SC_ERROR(SC_CC_ParseError,
                        std::string("Bad ") + name + ": " + arg);

    result = value;
    return Status();
}
