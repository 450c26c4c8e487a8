/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Checksum validation for user-typed bitcoin addresses.
 */

#ifndef SENDCORE_BITCOIN_ADDRESS_HPP
#define SENDCORE_BITCOIN_ADDRESS_HPP

#include "../util/Status.hpp"
#include <string>

namespace sendcore {

enum class AddressFormat
{
    base58,     // Base58Check, P2PKH or P2SH
    bech32,     // Segwit v0
    bech32m     // Segwit v1 and later
};

enum class AddressNetwork
{
    mainnet,
    testnet
};

/**
 * Facts learned while validating an address.
 */
struct AddressInfo
{
    std::string address;    // Trimmed of whitespace
    AddressFormat format;
    AddressNetwork network;
};

/**
 * Checks an address string for format, alphabet, length and checksum.
 * The string is trimmed of surrounding whitespace first.
 * Bech32 addresses may be upper or lower case, but not a mix.
 */
Status
addressValidate(const std::string &address);

/**
 * Validates an address, and reports its format and network if valid.
 */
Status
addressInspect(AddressInfo &result, const std::string &address);

const char *
addressFormatName(AddressFormat format);

const char *
addressNetworkName(AddressNetwork network);

} // namespace sendcore

#endif
