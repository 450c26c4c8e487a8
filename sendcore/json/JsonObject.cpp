/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"
#include "../util/FileIO.hpp"

namespace sendcore {

int jsonIsString (const json_t *value) { return json_is_string(value); }
int jsonIsNumber (const json_t *value) { return json_is_number(value); }
int jsonIsBoolean(const json_t *value) { return json_is_boolean(value); }
int jsonIsInteger(const json_t *value) { return json_is_integer(value); }
int jsonIsArray  (const json_t *value) { return json_is_array(value); }

Status
JsonObject::load(const std::string &path)
{
    DataChunk data;
    SC_CHECK(fileLoad(data, path));

    JsonPtr value;
    SC_CHECK(jsonDecode(value, toString(data)));
    if (!json_is_object(value.get()))
        return SC_ERROR(SC_CC_JSONError, path + " does not hold a JSON object");

    JsonPtr::operator=(std::move(value));
    return Status();
}

Status
JsonObject::save(const std::string &path) const
{
    std::string text;
    SC_CHECK(jsonEncode(text, *this));
    SC_CHECK(fileSave(text, path));
    return Status();
}

Status
JsonObject::setValue(const char *key, json_t *value)
{
    if (!root_)
        root_ = json_object();
    if (!value || json_object_set_new(root_, key, value) < 0)
        return SC_ERROR(SC_CC_JSONError, "Cannot set " + std::string(key));
    return Status();
}

Status
JsonObject::hasType(const char *key, int (*test)(const json_t *)) const
{
    json_t *value = json_object_get(root_, key);
    if (!value)
        return SC_ERROR(SC_CC_JSONError, "Missing JSON value for " + std::string(key));
    if (!test(value))
        return SC_ERROR(SC_CC_JSONError, "Bad JSON value for " + std::string(key));
    return Status();
}

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    json_t *value = json_object_get(root_, key);
    return json_is_string(value) ? json_string_value(value) : fallback;
}

double
JsonObject::getNumber(const char *key, double fallback) const
{
    json_t *value = json_object_get(root_, key);
    return json_is_number(value) ? json_number_value(value) : fallback;
}

bool
JsonObject::getBoolean(const char *key, bool fallback) const
{
    json_t *value = json_object_get(root_, key);
    return json_is_boolean(value) ? json_is_true(value) : fallback;
}

json_int_t
JsonObject::getInteger(const char *key, json_int_t fallback) const
{
    json_t *value = json_object_get(root_, key);
    return json_is_integer(value) ? json_integer_value(value) : fallback;
}

JsonArray
JsonObject::getArray(const char *key) const
{
    json_t *value = json_object_get(root_, key);
    if (!json_is_array(value))
        return JsonArray(JsonPtr());
    return JsonArray(json_incref(value));
}

} // namespace sendcore
