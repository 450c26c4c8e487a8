/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Offline signing for watch-only wallets.
 *
 * The unsigned PSBT goes out to an air-gapped signer, and whatever comes
 * back is decoded and totaled up again before the user confirms it,
 * since the signer may have changed the fee or change outputs.
 */

#ifndef SENDCORE_SPEND_PSBT_SESSION_HPP
#define SENDCORE_SPEND_PSBT_SESSION_HPP

#include "../bitcoin/Psbt.hpp"
#include <memory>
#include <mutex>

namespace sendcore {

class WalletEngine;

enum class PsbtPhase
{
    exporting,              // Unsigned payload is being shown or saved
    awaitingSigned,         // Waiting for the signer's reply
    confirmingBroadcast,    // User is looking at the signed totals
    broadcasting,
    done,
    failed,
    cancelled
};

/**
 * Totals worked out from the signed payload.
 */
struct ReconciledTotals
{
    /** False if some input's value is unknown. */
    bool hasTotalInput;
    uint64_t totalInputSats;
    uint64_t totalOutputSats;

    bool hasFee;
    uint64_t feeSats;

    uint64_t changeSats;
    std::vector<TxOutput> recipients;   // Outputs that are not change

    size_t inputCount;
    size_t signedInputs;
    bool finalized;     // Ready to broadcast without further signing
};

class PsbtSession
{
public:
    /**
     * Starts a session for an unsigned binary PSBT.
     */
    static Status
    create(std::shared_ptr<PsbtSession> &result,
           WalletEngine &engine, DataSlice unsignedPayload);

    PsbtPhase
    phase() const;

    const DataChunk &
    unsignedPayload() const { return unsignedData_; }

    /**
     * The unsigned PSBT in the usual base64 text form.
     */
    std::string
    unsignedBase64() const;

    /**
     * The payload has gone out, so start waiting for the reply.
     */
    Status
    exportComplete();

    /**
     * Decodes the signer's reply and recomputes the totals.
     * On failure, the session waits for another try.
     */
    Status
    acceptSignedPayload(const std::string &text);

    /**
     * Obtains the reconciled totals, once a signed payload is accepted.
     */
    Status
    totals(ReconciledTotals &result) const;

    /**
     * Hands the signed payload to the engine for broadcast.
     * Failure is final for this session.
     */
    Status
    confirmBroadcast();

    /**
     * Abandons the session. Not allowed once broadcasting has started.
     */
    Status
    cancel();

    /** The broadcast txid, once done. */
    std::string
    txid() const;

private:
    PsbtSession(WalletEngine &engine, DataChunk data, Psbt psbt);

    Status
    reconcile(ReconciledTotals &result, const SignedPayload &payload) const;

    WalletEngine &engine_;
    const DataChunk unsignedData_;
    const Psbt unsigned_;

    mutable std::mutex mutex_;
    PsbtPhase phase_;
    bool hasSigned_;
    SignedPayload signed_;
    ReconciledTotals totals_;
    std::string txid_;
};

const char *
psbtPhaseName(PsbtPhase phase);

} // namespace sendcore

#endif
