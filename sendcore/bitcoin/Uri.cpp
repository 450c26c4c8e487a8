/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Uri.hpp"
#include "Amount.hpp"
#include "../util/Text.hpp"
#include <algorithm>

namespace sendcore {

static const std::string scheme = "bitcoin:";

// RFC 3986 character classes, without the locale-dependent C library:
static bool
isBase16(char c)
{
    return
        ('0' <= c && c <= '9') ||
        ('A' <= c && c <= 'F') ||
        ('a' <= c && c <= 'f');
}

static char
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('A' <= c && c <= 'F')
        return c - 'A' + 10;
    return c - 'a' + 10;
}

static bool
isPchar(char c)
{
    return
        ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z') ||
        ('0' <= c && c <= '9') ||
        '-' == c || '.' == c || '_' == c || '~' == c || // unreserved
        '!' == c || '$' == c || '&' == c || '\'' == c ||
        '(' == c || ')' == c || '*' == c || '+' == c ||
        ',' == c || ';' == c || '=' == c || // sub-delims
        ':' == c || '@' == c;
}

static bool
isQuery(char c)
{
    return isPchar(c) || '/' == c || '?' == c;
}

/**
 * Checks that every escape is complete,
 * and that everything else belongs to the given class.
 */
static bool
validate(const std::string &in, bool (*isValid)(char))
{
    auto i = in.begin();
    while (in.end() != i)
    {
        if ('%' == *i)
        {
            if (!(2 < in.end() - i && isBase16(i[1]) && isBase16(i[2])))
                return false;
            i += 3;
        }
        else
        {
            if (!isValid(*i))
                return false;
            i += 1;
        }
    }
    return true;
}

/**
 * Decodes escapes. Query values also use '+' for a space.
 * The input must already pass `validate`.
 */
static std::string
unescape(const std::string &in, bool plusIsSpace)
{
    std::string out;
    out.reserve(in.size());

    auto i = in.begin();
    while (in.end() != i)
    {
        if ('%' == *i)
        {
            out.push_back(static_cast<char>(
                base16Value(i[1]) << 4 | base16Value(i[2])));
            i += 3;
        }
        else
        {
            out.push_back(plusIsSpace && '+' == *i ? ' ' : *i);
            i += 1;
        }
    }
    return out;
}

Status
uriParse(PaymentUri &result, const std::string &text)
{
    PaymentUri out = {};
    const auto clean = textTrim(text);
    if (!textStartsWith(textLower(clean), scheme))
    {
        out.address = clean;
        result = std::move(out);
        return Status();
    }
    out.isUri = true;

    // Split off the fragment and query:
    auto body = clean.substr(scheme.size());
    body = body.substr(0, body.find('#'));
    if (textStartsWith(body, "//"))
        body.erase(0, 2);
    const auto mark = body.find('?');
    const auto path = body.substr(0, mark);
    const auto query = std::string::npos == mark ?
        std::string() : body.substr(mark + 1);

    if (!validate(path, isPchar) || !validate(query, isQuery))
        return SC_ERROR(SC_CC_ParseError, "Malformed payment URI");
    out.address = unescape(path, false);

    // Later copies of a key win:
    size_t start = 0;
    while (start <= query.size() && !query.empty())
    {
        auto end = query.find('&', start);
        if (std::string::npos == end)
            end = query.size();
        const auto param = query.substr(start, end - start);
        start = end + 1;
        if (param.empty())
            continue;

        const auto equals = param.find('=');
        const auto key = textLower(param.substr(0, equals));
        const auto value = std::string::npos == equals ?
            std::string() : unescape(param.substr(equals + 1), true);

        if ("amount" == key)
        {
            out.hasAmount = false;
            if (value.empty())
                continue;
            if (!amountParse(out.amountSats, value, AmountUnit::btc))
                return SC_ERROR(SC_CC_ParseError,
                                "Invalid payment URI amount " + value);
            out.hasAmount = true;
        }
        else if ("label" == key)
        {
            out.label = textTrim(value).empty() ? std::string() : value;
        }
        else if ("message" == key)
        {
            out.message = textTrim(value).empty() ? std::string() : value;
        }
        else if (textStartsWith(key, "req-"))
        {
            return SC_ERROR(SC_CC_ParseError,
                            "Unsupported payment URI requirement " + key);
        }
    }

    result = std::move(out);
    return Status();
}

} // namespace sendcore
