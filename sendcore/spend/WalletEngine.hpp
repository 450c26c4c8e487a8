/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_SPEND_WALLET_ENGINE_HPP
#define SENDCORE_SPEND_WALLET_ENGINE_HPP

#include "Draft.hpp"
#include "../bitcoin/Psbt.hpp"
#include <functional>

namespace sendcore {

/**
 * The wallet's coin selection, signing and broadcast machinery.
 * All calls may block, so callers never hold locks across them.
 */
class WalletEngine
{
public:
    typedef std::function<void(DryRunResult result)> DryRunCallback;

    virtual ~WalletEngine();

    /**
     * Estimates the cost of a send without building it.
     * The callback may run on any thread, at any later time,
     * and must run exactly once. Timeouts are reported as
     * SC_CC_DryRunNetworkUnavailable results.
     */
    virtual void
    dryRun(const SpendRequest &request, DryRunCallback callback) = 0;

    /**
     * Builds, signs and broadcasts a transaction.
     */
    virtual Status
    commitSend(std::string &txid, const SpendRequest &request) = 0;

    /**
     * Builds an unsigned PSBT for an external signer.
     * The result is the binary PSBT.
     */
    virtual Status
    commitPsbtCreate(DataChunk &psbt, const SpendRequest &request) = 0;

    /**
     * Finalizes and broadcasts whatever the external signer returned.
     */
    virtual Status
    broadcastSigned(std::string &txid, const SignedPayload &payload) = 0;
};

} // namespace sendcore

#endif
