/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Data types describing a send in progress.
 */

#ifndef SENDCORE_SPEND_DRAFT_HPP
#define SENDCORE_SPEND_DRAFT_HPP

#include "../bitcoin/Amount.hpp"
#include "../util/Status.hpp"
#include <set>
#include <string>
#include <vector>

namespace sendcore {

/**
 * A destination with a committed amount.
 */
struct Recipient
{
    std::string address;
    uint64_t amountSats;
};

/**
 * An unspent output the wallet controls.
 */
struct Utxo
{
    std::string outpoint;   // "txid:vout"
    uint64_t amountSats;
    bool confirmed;
    bool frozen;
    std::string label;      // Empty if none
};

typedef std::vector<Utxo> UtxoList;
typedef std::set<std::string> OutpointSet;

/**
 * A destination as the user typed it.
 */
struct RecipientRow
{
    std::string address;
    std::string amount;
};

enum class DraftMode
{
    single,
    multi
};

/**
 * The user's intent. The rows hold raw text,
 * so the draft survives restarts exactly as typed.
 */
struct SendDraft
{
    DraftMode mode = DraftMode::single;

    /** One row in single mode, at least two in multi mode. */
    std::vector<RecipientRow> rows = std::vector<RecipientRow>(1);

    AmountUnit unit = AmountUnit::sats;
    double feeRate = 1.0;   // sat/vB

    /** Empty means the engine picks the coins. */
    OutpointSet coinSelection;

    bool isMaxSend = false;
    std::string label;
};

/**
 * Everything the wallet engine needs to build a transaction.
 */
struct SpendRequest
{
    std::vector<Recipient> recipients;
    double feeRate;
    OutpointSet coinSelection;
    bool isMaxSend;
    std::string label;
};

/**
 * The engine's cost estimate for a SpendRequest.
 * Any failure is in `error`, which the engine sets with SC_ERROR.
 */
struct DryRunResult
{
    uint64_t feeSats = 0;
    double txVBytes = 0;
    uint64_t changeSats = 0;
    bool hasChange = false;

    /** The exact amount sent, which matters for max sends. */
    uint64_t recipientAmountSats = 0;

    size_t numInputs = 0;
    double effectiveFeeRate = 0;
    Status error;
};

} // namespace sendcore

#endif
