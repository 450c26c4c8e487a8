/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonArray.hpp"

namespace sendcore {

JsonArray::JsonArray():
    JsonPtr(json_array())
{
}

JsonArray::JsonArray(JsonPtr value):
    JsonPtr(std::move(value))
{
}

JsonPtr
JsonArray::operator[](size_t i) const
{
    return json_incref(json_array_get(root_, i));
}

Status
JsonArray::append(JsonPtr value)
{
    if (!json_is_array(root_))
        return SC_ERROR(SC_CC_JSONError, "Not a JSON array");
    if (json_array_append(root_, value.get()) < 0)
        return SC_ERROR(SC_CC_JSONError, "Cannot append to JSON array");
    return Status();
}

Status
JsonArray::appendString(const std::string &value)
{
    return append(json_string(value.c_str()));
}

Status
JsonArray::stringAt(std::string &result, size_t i) const
{
    json_t *item = json_array_get(root_, i);
    if (!json_is_string(item))
        return SC_ERROR(SC_CC_JSONError,
                        "Item " + std::to_string(i) + " is not a string");
    result = json_string_value(item);
    return Status();
}

} // namespace sendcore
