/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hash.hpp"
#include <openssl/sha.h>

namespace sendcore {

Sha256Digest
sha256(DataSlice data)
{
    Sha256Digest out;
    SHA256(data.data(), data.size(), out.data());
    return out;
}

Sha256Digest
doubleSha256(DataSlice data)
{
    return sha256(sha256(data));
}

} // namespace sendcore
