/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include <stdlib.h>
#include <utility>

namespace sendcore {

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{
}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(move.root_)
{
    move.root_ = nullptr;
}

JsonPtr::JsonPtr(const JsonPtr &copy):
    root_(json_incref(copy.root_))
{
}

JsonPtr &
JsonPtr::operator=(JsonPtr other)
{
    std::swap(root_, other.root_);
    return *this;
}

JsonPtr::~JsonPtr()
{
    json_decref(root_);
}

Status
jsonDecode(JsonPtr &result, const std::string &text)
{
    json_error_t error;
    json_t *root = json_loadb(text.data(), text.size(), 0, &error);
    if (!root)
        return SC_ERROR(SC_CC_JSONError, "Bad JSON at line " +
            std::to_string(error.line) + ": " + error.text);

    result = JsonPtr(root);
    return Status();
}

Status
jsonEncode(std::string &result, const JsonPtr &value)
{
    if (!value)
        return SC_ERROR(SC_CC_JSONError, "Nothing to encode");

    char *text = json_dumps(value.get(), JSON_INDENT(4) | JSON_SORT_KEYS);
    if (!text)
        return SC_ERROR(SC_CC_JSONError, "Cannot encode JSON");
    result = text;
    free(text);
    return Status();
}

} // namespace sendcore
