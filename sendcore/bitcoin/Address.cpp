/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Address.hpp"
#include "../crypto/Hash.hpp"
#include "../util/Data.hpp"
#include "../util/Text.hpp"
#include <ctype.h>
#include <string.h>
#include <algorithm>

namespace sendcore {

constexpr size_t base58MinLength = 25;
constexpr size_t base58MaxLength = 35;
constexpr size_t base58DecodedLength = 25;
constexpr size_t base58ChecksumLength = 4;

constexpr size_t bech32MaxLength = 90;
constexpr size_t bech32ChecksumLength = 6;
constexpr uint32_t bech32Constant = 1;
constexpr uint32_t bech32mConstant = 0x2bc830a3;

static const char base58Alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
static const char bech32Charset[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

static bool
isLower(char c)
{
    return islower(static_cast<unsigned char>(c));
}

static bool
isUpper(char c)
{
    return isupper(static_cast<unsigned char>(c));
}


/**
 * Decodes a base58 string into a big-endian byte array,
 * keeping one zero byte for each leading '1'.
 */
static Status
base58Decode(DataChunk &result, const std::string &text)
{
    // Little-endian digits of the big number, which saves on shifting:
    DataChunk number;
    for (char c: text)
    {
        const char *p = strchr(base58Alphabet, c);
        if (!c || !p)
            return SC_ERROR(SC_CC_AddressInvalidCharacter,
                            "Invalid character in address");

        // number = number * 58 + digit:
        unsigned carry = p - base58Alphabet;
        for (auto &byte: number)
        {
            carry += 58 * byte;
            byte = carry & 0xff;
            carry >>= 8;
        }
        for (; carry; carry >>= 8)
            number.push_back(carry & 0xff);
    }

    auto zeros = std::find_if(text.begin(), text.end(),
        [](char c){ return '1' != c; }) - text.begin();

    DataChunk out(zeros, 0);
    out.insert(out.end(), number.rbegin(), number.rend());
    result = std::move(out);
    return Status();
}

static Status
base58CheckValidate(const std::string &address)
{
    if (address.size() < base58MinLength || base58MaxLength < address.size())
        return SC_ERROR(SC_CC_AddressInvalidLength, "Invalid address length");

    DataChunk decoded;
    SC_CHECK(base58Decode(decoded, address));
    if (decoded.size() != base58DecodedLength)
        return SC_ERROR(SC_CC_AddressInvalidLength,
                        "Invalid decoded address length");

    // Split off the checksum:
    auto split = decoded.end() - base58ChecksumLength;
    DataSlice payload(decoded.data(), &*split);
    auto hash = doubleSha256(payload);
    if (!std::equal(split, decoded.end(), hash.begin()))
        return SC_ERROR(SC_CC_AddressInvalidChecksum, "Invalid address checksum");

    return Status();
}

static uint32_t
bech32Polymod(const std::vector<uint8_t> &values)
{
    static const uint32_t generator[] =
    {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };

    uint32_t chk = 1;
    for (auto value: values)
    {
        uint32_t top = chk >> 25;
        chk = (chk & 0x1ffffff) << 5 ^ value;
        for (int i = 0; i < 5; ++i)
            if ((top >> i) & 1)
                chk ^= generator[i];
    }
    return chk;
}

static Status
bech32Validate(const std::string &address, uint32_t constant)
{
    // Mixed case is never allowed, so check that first:
    bool hasLower = std::any_of(address.begin(), address.end(), isLower);
    bool hasUpper = std::any_of(address.begin(), address.end(), isUpper);
    if (hasLower && hasUpper)
        return SC_ERROR(SC_CC_AddressMixedCase, "Mixed case in address");

    const std::string lower = textLower(address);

    // The separator is the last '1', and at least 6 checksum symbols follow:
    auto pos = lower.rfind('1');
    if (std::string::npos == pos || pos < 1 ||
        lower.size() < pos + 1 + bech32ChecksumLength ||
        bech32MaxLength < lower.size())
        return SC_ERROR(SC_CC_AddressInvalidLength, "Invalid address length");

    // Expand the human-readable part:
    std::vector<uint8_t> values;
    values.reserve(2 * pos + 1 + lower.size() - pos - 1);
    for (size_t i = 0; i < pos; ++i)
        values.push_back(static_cast<uint8_t>(lower[i]) >> 5);
    values.push_back(0);
    for (size_t i = 0; i < pos; ++i)
        values.push_back(static_cast<uint8_t>(lower[i]) & 31);

    // Map the data part:
    for (size_t i = pos + 1; i < lower.size(); ++i)
    {
        const char *p = strchr(bech32Charset, lower[i]);
        if (!lower[i] || !p)
            return SC_ERROR(SC_CC_AddressInvalidCharacter,
                            "Invalid character in address");
        values.push_back(p - bech32Charset);
    }

    if (bech32Polymod(values) != constant)
        return SC_ERROR(SC_CC_AddressInvalidChecksum, "Invalid address checksum");

    return Status();
}

Status
addressInspect(AddressInfo &result, const std::string &address)
{
    AddressInfo out;
    out.address = textTrim(address);
    const std::string lower = textLower(out.address);

    if (textStartsWith(lower, "bc1") || textStartsWith(lower, "tb1"))
    {
        // The witness version picks the checksum constant:
        out.network = textStartsWith(lower, "bc1") ?
            AddressNetwork::mainnet : AddressNetwork::testnet;
        out.format = 'q' == lower[3] ?
            AddressFormat::bech32 : AddressFormat::bech32m;
        SC_CHECK(bech32Validate(out.address,
            AddressFormat::bech32 == out.format ?
            bech32Constant : bech32mConstant));
    }
    else if (textStartsWith(out.address, "1") || textStartsWith(out.address, "3"))
    {
        out.network = AddressNetwork::mainnet;
        out.format = AddressFormat::base58;
        SC_CHECK(base58CheckValidate(out.address));
    }
    else if (textStartsWith(out.address, "m") || textStartsWith(out.address, "n") ||
             textStartsWith(out.address, "2"))
    {
        out.network = AddressNetwork::testnet;
        out.format = AddressFormat::base58;
        SC_CHECK(base58CheckValidate(out.address));
    }
    else
    {
        return SC_ERROR(SC_CC_AddressUnknownFormat, "Invalid address format");
    }

    result = std::move(out);
    return Status();
}

Status
addressValidate(const std::string &address)
{
    AddressInfo info;
    return addressInspect(info, address);
}

const char *
addressFormatName(AddressFormat format)
{
    switch (format)
    {
    case AddressFormat::base58:
        return "base58check";
    case AddressFormat::bech32:
        return "bech32";
    case AddressFormat::bech32m:
        return "bech32m";
    }
    return "unknown";
}

const char *
addressNetworkName(AddressNetwork network)
{
    return AddressNetwork::mainnet == network ? "mainnet" : "testnet";
}

} // namespace sendcore
