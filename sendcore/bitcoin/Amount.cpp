/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Amount.hpp"
#include "../util/Text.hpp"
#include <bitcoin/bitcoin.hpp>
#include <ctype.h>
#include <algorithm>

namespace sendcore {

constexpr uint8_t btcDecimals = 8;
constexpr size_t maxDigits = 18;

/**
 * Commas may only split the digits into groups of three.
 */
static bool
groupingOk(const std::string &text)
{
    const auto first = text.find(',');
    if (std::string::npos == first)
        return true;
    if (!first || 3 < first || (text.size() - first) % 4)
        return false;

    size_t groups = 0;
    for (size_t i = first; i < text.size(); i += 4, ++groups)
        if (',' != text[i])
            return false;
    return groups == static_cast<size_t>(
        std::count(text.begin(), text.end(), ','));
}

Status
amountParse(uint64_t &result, const std::string &text, AmountUnit unit)
{
    std::string clean = textTrim(text);
    uint8_t decimals = 0;
    if (AmountUnit::sats == unit)
    {
        if (!groupingOk(clean))
            return SC_ERROR(SC_CC_ParseError, "Misplaced comma in " + clean);
        clean.erase(std::remove(clean.begin(), clean.end(), ','), clean.end());
    }
    else
    {
        decimals = btcDecimals;
    }

    if (clean.empty())
        return SC_ERROR(SC_CC_ParseError, "Empty amount");

    // decode_base10 tolerates some things we don't, like a leading '.':
    if (!std::all_of(clean.begin(), clean.end(),
        [](char c){ return ('0' <= c && c <= '9') || '.' == c; }) ||
        !isdigit(static_cast<unsigned char>(clean[0])))
        return SC_ERROR(SC_CC_ParseError, "Invalid amount " + clean);

    // decode_base10 rounds extra places up, but a typed amount must be exact:
    auto point = clean.find('.');
    if (std::string::npos != point &&
        (std::string::npos != clean.find('.', point + 1) ||
         decimals < clean.size() - point - 1))
        return SC_ERROR(SC_CC_ParseError, "Too many decimal places in " + clean);

    // Keep well inside 64 bits, counting the places decode_base10 adds:
    const size_t wholeDigits = std::string::npos == point ? clean.size() : point;
    if (maxDigits < wholeDigits + decimals)
        return SC_ERROR(SC_CC_ParseError, "Amount too large " + clean);

    uint64_t out;
    if (!bc::decode_base10(out, clean, decimals))
        return SC_ERROR(SC_CC_ParseError, "Invalid amount " + clean);

    result = out;
    return Status();
}

std::string
amountFormat(uint64_t amount, AmountUnit unit)
{
    if (AmountUnit::sats == unit)
        return std::to_string(amount);
    return bc::encode_base10(amount, btcDecimals);
}

const char *
amountUnitName(AmountUnit unit)
{
    return AmountUnit::sats == unit ? "sats" : "btc";
}

Status
amountUnitFromName(AmountUnit &result, const std::string &name)
{
    if ("sats" == name)
        result = AmountUnit::sats;
    else if ("btc" == name)
        result = AmountUnit::btc;
    else
        return SC_ERROR(SC_CC_ParseError, "Unknown amount unit " + name);
    return Status();
}

} // namespace sendcore
