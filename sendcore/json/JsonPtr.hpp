/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Reference-counted jansson values.
 */

#ifndef SENDCORE_JSON_JSON_PTR_HPP
#define SENDCORE_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace sendcore {

/**
 * Holds one reference to a jansson value.
 */
class JsonPtr
{
public:
    /**
     * Takes ownership of the passed-in reference.
     */
    JsonPtr(json_t *root=nullptr);
    JsonPtr(JsonPtr &&move);
    JsonPtr(const JsonPtr &copy);
    JsonPtr &operator=(JsonPtr other);
    ~JsonPtr();

    /**
     * The value itself, still owned by this object.
     */
    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

protected:
    json_t *root_;
};

/**
 * Parses JSON text.
 */
Status
jsonDecode(JsonPtr &result, const std::string &text);

/**
 * Writes a value out as indented JSON text with sorted keys.
 */
Status
jsonEncode(std::string &result, const JsonPtr &value);

/**
 * Adds the usual constructors to JsonPtr child classes.
 */
#define SC_JSON_CONSTRUCTORS(This, Base) \
    This() {} \
    This(JsonPtr &&move): Base(std::move(move)) {} \
    This(const JsonPtr &copy): Base(copy) {}

} // namespace sendcore

#endif
