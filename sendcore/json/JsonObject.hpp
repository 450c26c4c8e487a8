/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_JSON_JSON_OBJECT_HPP
#define SENDCORE_JSON_JSON_OBJECT_HPP

#include "JsonArray.hpp"

namespace sendcore {

/**
 * A JSON document with an object at its root, such as a config file.
 * Child classes describe their fields with the SC_JSON_* macros below.
 * Missing or wrong-typed fields read as their fallback values.
 */
class JsonObject:
    public JsonPtr
{
public:
    SC_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

    /**
     * Reads a file, which must hold an object.
     */
    Status
    load(const std::string &path);

    Status
    save(const std::string &path) const;

protected:
    /**
     * Writes a field, creating the root object if necessary.
     * Takes ownership of the passed-in value.
     */
    Status
    setValue(const char *key, json_t *value);

    Status
    hasType(const char *key, int (*test)(const json_t *)) const;

    const char *getString (const char *key, const char *fallback) const;
    double      getNumber (const char *key, double fallback) const;
    bool        getBoolean(const char *key, bool fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
    JsonArray   getArray  (const char *key) const;
};

/**
 * jansson's type checks are macros, so these give `hasType` something
 * to point at.
 */
int jsonIsString (const json_t *value);
int jsonIsNumber (const json_t *value);
int jsonIsBoolean(const json_t *value);
int jsonIsInteger(const json_t *value);
int jsonIsArray  (const json_t *value);

#define SC_JSON_STRING(name, key, fallback) \
    const char *name() const                        { return getString(key, fallback); } \
    sendcore::Status name##Ok() const               { return hasType(key, sendcore::jsonIsString); } \
    sendcore::Status name##Set(const std::string &value) { return setValue(key, json_string(value.c_str())); }

#define SC_JSON_NUMBER(name, key, fallback) \
    double name() const                             { return getNumber(key, fallback); } \
    sendcore::Status name##Ok() const               { return hasType(key, sendcore::jsonIsNumber); } \
    sendcore::Status name##Set(double value)        { return setValue(key, json_real(value)); }

#define SC_JSON_BOOLEAN(name, key, fallback) \
    bool name() const                               { return getBoolean(key, fallback); } \
    sendcore::Status name##Ok() const               { return hasType(key, sendcore::jsonIsBoolean); } \
    sendcore::Status name##Set(bool value)          { return setValue(key, json_boolean(value)); }

#define SC_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                         { return getInteger(key, fallback); } \
    sendcore::Status name##Ok() const               { return hasType(key, sendcore::jsonIsInteger); } \
    sendcore::Status name##Set(json_int_t value)    { return setValue(key, json_integer(value)); }

#define SC_JSON_ARRAY(name, key) \
    sendcore::JsonArray name() const                { return getArray(key); } \
    sendcore::Status name##Ok() const               { return hasType(key, sendcore::jsonIsArray); } \
    sendcore::Status name##Set(const sendcore::JsonArray &value) \
        { return setValue(key, json_incref(value.get())); }

} // namespace sendcore

#endif
