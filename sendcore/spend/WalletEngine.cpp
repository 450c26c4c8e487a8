/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "WalletEngine.hpp"

namespace sendcore {

WalletEngine::~WalletEngine()
{
}

} // namespace sendcore
