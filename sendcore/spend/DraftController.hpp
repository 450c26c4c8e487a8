/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Owns the send draft, and keeps its cost estimate current.
 *
 * Every edit produces a new immutable snapshot. Edits that change what
 * would be sent restart a quiet-time timer, and once it expires a single
 * dry-run request goes to the wallet engine. Each request carries the
 * estimation generation it was made for, and results for older
 * generations are dropped on arrival.
 */

#ifndef SENDCORE_SPEND_DRAFT_CONTROLLER_HPP
#define SENDCORE_SPEND_DRAFT_CONTROLLER_HPP

#include "Draft.hpp"
#include "../Config.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace sendcore {

class DraftStore;
class PsbtSession;
class WalletEngine;

enum class DraftState
{
    empty,
    editing,
    estimating,     // Timer armed or request in flight
    estimated,      // The estimate matches the draft
    committing,
    done,
    failed
};

/**
 * How the user's rows look after validation.
 */
struct RowStatus
{
    /** The address check result. Blank addresses are not errors. */
    Status address;
    bool addressValid;
    bool amountValid;
    uint64_t amountSats;

    /** A warning only. The engine decides what is dust. */
    bool belowDust;

    /** Both halves are valid, so the row goes into the request. */
    bool counted;
};

enum class MaxAmountSource
{
    none,
    heuristic,  // Balance minus a guessed fee
    exact       // From the engine's dry-run
};

/**
 * Everything an observer needs to draw the send screen.
 */
struct DraftSnapshot
{
    uint64_t version;
    DraftState state;
    SendDraft draft;
    std::vector<RowStatus> rows;

    size_t validRecipientCount;
    uint64_t totalSendingSats;
    uint64_t availableSats;
    MaxAmountSource maxAmountSource;

    bool connected;
    bool hasEstimate;
    DryRunResult estimate;
    bool canCommit;

    /** Results of the last commit. */
    std::string txid;
    Status commitError;
};

typedef std::shared_ptr<const DraftSnapshot> DraftSnapshotPtr;

class DraftController
{
public:
    typedef std::chrono::steady_clock Clock;
    typedef std::function<Clock::time_point()> TimeSource;
    typedef std::function<void(DraftSnapshotPtr snapshot)> Watcher;

    DraftController(WalletEngine &engine, DraftStore &store,
                    const SpendConfig &config,
                    TimeSource now = Clock::now);
    ~DraftController();

    /**
     * Loads the saved draft, if any.
     */
    Status
    restore();

    DraftSnapshotPtr
    snapshot() const;

    /**
     * Registers a function to receive every new snapshot.
     * Watchers run outside the controller's lock, on whichever
     * thread made the change.
     * @return An id for `unwatch`.
     */
    size_t
    watch(Watcher watcher);

    void
    unwatch(size_t id);

    // Recipient edits:
    Status addressSet(size_t row, const std::string &text);
    Status amountSet(size_t row, const std::string &text);
    Status unitSet(AmountUnit unit);
    Status rowAdd();
    Status rowRemove(size_t row);
    Status modeSet(DraftMode mode);

    // Other edits:
    Status feeRateSet(double rate);
    Status maxSendSet(bool enable);
    Status labelSet(const std::string &label);

    /**
     * Restricts the send to specific coins. An empty set lets the
     * engine choose. Every coin must be known and not frozen.
     */
    Status
    selectCoins(const OutpointSet &outpoints);

    /**
     * Replaces the wallet's unspent set,
     * dropping vanished or frozen coins from the selection.
     */
    void
    utxosSet(const UtxoList &utxos);

    /**
     * Tracks the backend connection. Estimates are cleared
     * while disconnected, and requested again on reconnect.
     */
    void
    connectionSet(bool connected);

    /**
     * Throws the draft away, along with its saved copy.
     */
    Status
    discard();

    /**
     * Does any timed work that is due.
     * @return The time until the next work, or zero if nothing is pending.
     */
    std::chrono::milliseconds
    wakeup();

    /**
     * Builds, signs and broadcasts the draft.
     * Clears the draft on success.
     */
    Status
    commitSend(std::string &txid);

    /**
     * Builds an unsigned PSBT for an external signer.
     * Clears the draft on success.
     */
    Status
    commitPsbt(std::shared_ptr<PsbtSession> &result);

private:
    typedef std::unique_lock<std::mutex> Lock;

    struct CallbackGuard;

    WalletEngine &engine_;
    DraftStore &store_;
    const SpendConfig config_;
    const TimeSource now_;

    mutable std::mutex mutex_;
    SendDraft draft_;
    UtxoList utxos_;
    bool utxosKnown_;
    bool connected_;

    // Estimation:
    uint64_t generation_;
    bool timerArmed_;
    Clock::time_point deadline_;
    uint64_t inFlight_;             // Generation of the pending request
    uint64_t estimateGeneration_;   // Generation of estimate_
    DryRunResult estimate_;
    MaxAmountSource maxSource_;

    // Commit:
    bool committing_;
    DraftState finalState_;         // Done or failed, until the next edit
    std::string txid_;
    Status commitError_;

    // Publishing:
    uint64_t version_;
    DraftSnapshotPtr snapshot_;
    std::map<size_t, Watcher> watchers_;
    size_t nextWatcher_;

    std::shared_ptr<CallbackGuard> guard_;

    Status
    editCheck(size_t row) const;

    /**
     * Starts a new estimation generation and restarts the timer.
     */
    void
    rearm();

    void
    changed(Lock &lock, bool relevant);

    void
    resetDraft();

    /**
     * Drops unknown or frozen coins from a selection.
     * @return The number of coins dropped.
     */
    size_t
    selectionPrune(OutpointSet &selection) const;

    uint64_t
    available() const;

    /**
     * Fills in a quick max-send amount until the engine answers.
     */
    void
    maxSendGuess();

    void
    rowsCheck(std::vector<RowStatus> &result) const;

    SpendRequest
    makeRequest(const std::vector<RowStatus> &rows) const;

    bool
    sendable(const std::vector<RowStatus> &rows) const;

    Status
    commitBegin(SpendRequest &request, Lock &lock);

    void
    commitEnd(Lock &lock, const Status &status, const std::string &txid);

    void
    dryRunDone(uint64_t tag, DryRunResult result);

    void
    publish(Lock &lock);
};

const char *
draftStateName(DraftState state);

} // namespace sendcore

#endif
