/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_CRYPTO_HASH_HPP
#define SENDCORE_CRYPTO_HASH_HPP

#include "../util/Data.hpp"

namespace sendcore {

constexpr size_t SHA256_LENGTH = 32;
typedef DataArray<SHA256_LENGTH> Sha256Digest;

Sha256Digest
sha256(DataSlice data);

/**
 * SHA-256 applied twice, as bitcoin uses for checksums and txids.
 */
Sha256Digest
doubleSha256(DataSlice data);

} // namespace sendcore

#endif
