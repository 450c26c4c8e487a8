/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Decoding for BIP 174 partially-signed transactions,
 * and for the raw transactions some signers return instead.
 */

#ifndef SENDCORE_BITCOIN_PSBT_HPP
#define SENDCORE_BITCOIN_PSBT_HPP

#include "Transaction.hpp"

namespace sendcore {

struct PsbtInput
{
    bool hasValue;              // Set if a UTXO record was present
    uint64_t value;
    size_t signatureCount;      // Partial, taproot key, and script signatures
    bool finalized;             // Final scriptSig or witness present
};

struct PsbtOutput
{
    bool hasDerivation;         // The wallet can derive this script
};

struct Psbt
{
    Transaction tx;
    std::vector<PsbtInput> inputs;      // Parallel to tx.inputs
    std::vector<PsbtOutput> outputs;    // Parallel to tx.outputs
};

/**
 * Decodes a binary PSBT, starting with the "psbt\xff" magic.
 */
Status
psbtDecode(Psbt &result, DataSlice data);

/**
 * Returns true if the data starts with the PSBT magic bytes.
 */
bool
psbtHasMagic(DataSlice data);

/**
 * Returns true if any input carries a signature or final script.
 */
bool
psbtIsSigned(const Psbt &psbt);

/**
 * Returns true if every input has a final script.
 */
bool
psbtIsFinalized(const Psbt &psbt);

/**
 * Whatever a signer handed back, decoded.
 */
struct SignedPayload
{
    enum class Kind
    {
        psbt,
        rawTx
    };

    Kind kind;
    DataChunk data;     // Binary PSBT or serialized transaction
    Psbt psbt;          // For rawTx, only psbt.tx is filled in
};

/**
 * Decodes a signer's reply from text.
 * Accepts a base64 or hex PSBT, or a hex raw transaction.
 */
Status
signedPayloadDecode(SignedPayload &result, const std::string &text);

} // namespace sendcore

#endif
