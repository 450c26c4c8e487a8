/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_CRYPTO_ENCODING_HPP
#define SENDCORE_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace sendcore {

/**
 * Encodes data into a lower-case hex string.
 */
std::string
base16Encode(DataSlice data);

/**
 * Decodes a hex string, accepting either case.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-64 string according to rfc4648.
 */
std::string
base64Encode(DataSlice data);

/**
 * Decodes a base-64 string as defined by rfc4648.
 */
Status
base64Decode(DataChunk &result, const std::string &in);

} // namespace sendcore

#endif
