/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * BIP21 payment URIs, as pasted or scanned into the send screen.
 */

#ifndef SENDCORE_BITCOIN_URI_HPP
#define SENDCORE_BITCOIN_URI_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <string>

namespace sendcore {

struct PaymentUri
{
    /** False if the text was a bare address. */
    bool isUri;
    std::string address;

    bool hasAmount;
    uint64_t amountSats;

    /** Empty if missing or blank. */
    std::string label;
    std::string message;
};

/**
 * Reads a "bitcoin:" URI, or passes a bare address through trimmed.
 * The scheme is case-insensitive. The address itself is not validated,
 * so the caller can report address problems the usual way.
 */
Status
uriParse(PaymentUri &result, const std::string &text);

} // namespace sendcore

#endif
