/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_JSON_JSON_ARRAY_HPP
#define SENDCORE_JSON_JSON_ARRAY_HPP

#include "JsonPtr.hpp"

namespace sendcore {

/**
 * A list of JSON values, such as the rows of a saved draft.
 */
class JsonArray:
    public JsonPtr
{
public:
    /**
     * Starts a new, empty array.
     */
    JsonArray();

    /**
     * Adopts an existing value.
     * Anything other than an array reads as empty, and refuses appends.
     */
    explicit JsonArray(JsonPtr value);

    size_t
    size() const { return json_array_size(root_); }

    /**
     * An item, or a null JsonPtr if out of range.
     */
    JsonPtr
    operator[](size_t i) const;

    Status
    append(JsonPtr value);

    Status
    appendString(const std::string &value);

    /**
     * Reads an item that must be a string.
     */
    Status
    stringAt(std::string &result, size_t i) const;
};

} // namespace sendcore

#endif
