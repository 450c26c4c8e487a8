/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_BITCOIN_AMOUNT_HPP
#define SENDCORE_BITCOIN_AMOUNT_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <string>

namespace sendcore {

/**
 * The units a user can type an amount in.
 */
enum class AmountUnit
{
    sats,
    btc
};

/**
 * Converts user-typed text to an integer number of satoshis.
 * Satoshi amounts may contain ',' thousands separators,
 * and bitcoin amounts may have up to 8 decimal places.
 */
Status
amountParse(uint64_t &result, const std::string &text, AmountUnit unit);

/**
 * Formats a satoshi amount in the given unit, without separators.
 */
std::string
amountFormat(uint64_t amount, AmountUnit unit);

const char *
amountUnitName(AmountUnit unit);

/**
 * Accepts "sats" or "btc".
 */
Status
amountUnitFromName(AmountUnit &result, const std::string &name);

} // namespace sendcore

#endif
