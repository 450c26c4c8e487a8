/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Status.hpp"
#include "Debug.hpp"

namespace sendcore {

Status::Status() :
    value_(SC_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tSC_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(std::move(message)),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        SC_DebugLog("%s:%d: %s returned error %d (%s)",
            file_, static_cast<int>(line_), function_,
            static_cast<int>(value_), message_.c_str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace sendcore
