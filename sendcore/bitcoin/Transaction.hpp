/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Just enough transaction decoding to total up a signer's reply.
 */

#ifndef SENDCORE_BITCOIN_TRANSACTION_HPP
#define SENDCORE_BITCOIN_TRANSACTION_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <vector>

namespace sendcore {

struct TxInput
{
    /** "txid:vout", with the txid in the usual reversed hex. */
    std::string outpoint;
    DataChunk script;
    std::vector<DataChunk> witness;
    uint32_t sequence;
};

struct TxOutput
{
    uint64_t value;
    DataChunk script;
};

struct Transaction
{
    uint32_t version;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    uint32_t locktime;
    bool segwit;

    /** Hash of the non-witness serialization, in reversed hex. */
    std::string txid;
};

/**
 * Builds the "txid:vout" name for an output.
 */
std::string
outpointString(const std::string &txid, uint32_t index);

/**
 * Decodes a serialized transaction, with or without segwit data.
 * The transaction must use the whole buffer.
 */
Status
decodeTx(Transaction &result, DataSlice rawTx);

/**
 * Returns true if any input carries a scriptSig or witness.
 */
bool
isSigned(const Transaction &tx);

/**
 * Returns true if any input signals replace-by-fee.
 */
bool
isReplaceByFee(const Transaction &tx);

} // namespace sendcore

#endif
