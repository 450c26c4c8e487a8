/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "DraftController.hpp"
#include "DraftStore.hpp"
#include "FeeBump.hpp"
#include "PsbtSession.hpp"
#include "WalletEngine.hpp"
#include "../bitcoin/Address.hpp"
#include "../bitcoin/Uri.hpp"
#include "../util/Debug.hpp"
#include "../util/Text.hpp"
#include <algorithm>
#include <cmath>

namespace sendcore {

/**
 * Lets late dry-run callbacks find out the controller is gone.
 * Recursive, since a callback can trigger another synchronous callback.
 */
struct DraftController::CallbackGuard
{
    std::recursive_mutex mutex;
    DraftController *owner;
};

const char *
draftStateName(DraftState state)
{
    switch (state)
    {
    case DraftState::empty:
        return "empty";
    case DraftState::editing:
        return "editing";
    case DraftState::estimating:
        return "estimating";
    case DraftState::estimated:
        return "estimated";
    case DraftState::committing:
        return "committing";
    case DraftState::done:
        return "done";
    case DraftState::failed:
        return "failed";
    }
    return "unknown";
}

DraftController::DraftController(WalletEngine &engine, DraftStore &store,
                                 const SpendConfig &config, TimeSource now):
    engine_(engine),
    store_(store),
    config_(config),
    now_(now),
    utxosKnown_(false),
    connected_(true),
    generation_(1),
    timerArmed_(false),
    inFlight_(0),
    estimateGeneration_(0),
    maxSource_(MaxAmountSource::none),
    committing_(false),
    finalState_(DraftState::editing),
    version_(0),
    nextWatcher_(1),
    guard_(std::make_shared<CallbackGuard>())
{
    guard_->owner = this;
    resetDraft();

    Lock lock(mutex_);
    publish(lock);
}

DraftController::~DraftController()
{
    std::lock_guard<std::recursive_mutex> lock(guard_->mutex);
    guard_->owner = nullptr;
}

Status
DraftController::restore()
{
    SendDraft draft;
    Status loaded = store_.load(draft);
    if (SC_CC_FileDoesNotExist == loaded.value())
        return Status();
    SC_CHECK(loaded);

    Lock lock(mutex_);
    SC_CHECK(editCheck(0));

    if (draft.feeRate < config_.minFeeRate)
        draft.feeRate = config_.minFeeRate;
    if (DraftMode::multi == draft.mode)
        draft.isMaxSend = false;

    // The saved coins may have been spent or frozen since:
    if (utxosKnown_)
        selectionPrune(draft.coinSelection);

    SC_DebugLog("Restored draft with %d rows",
                static_cast<int>(draft.rows.size()));
    draft_ = std::move(draft);
    maxSource_ = MaxAmountSource::none;
    maxSendGuess();
    changed(lock, true);
    return Status();
}

DraftSnapshotPtr
DraftController::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

size_t
DraftController::watch(Watcher watcher)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = nextWatcher_++;
    watchers_[id] = watcher;
    return id;
}

void
DraftController::unwatch(size_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    watchers_.erase(id);
}

Status
DraftController::addressSet(size_t row, const std::string &text)
{
    PaymentUri uri;
    SC_CHECK(uriParse(uri, text));

    Lock lock(mutex_);
    SC_CHECK(editCheck(row));

    // Typed text stays as typed, but a URI fills in what it carries:
    if (!uri.isUri)
    {
        draft_.rows[row].address = text;
    }
    else
    {
        draft_.rows[row].address = uri.address;
        if (uri.hasAmount)
        {
            draft_.isMaxSend = false;
            maxSource_ = MaxAmountSource::none;
            draft_.rows[row].amount = amountFormat(uri.amountSats, draft_.unit);
        }
        if (!uri.label.empty())
            draft_.label = uri.label;
        SC_DebugLog("Payment URI filled row %d%s", static_cast<int>(row),
                    uri.hasAmount ? " with an amount" : "");
    }
    changed(lock, true);
    return Status();
}

Status
DraftController::amountSet(size_t row, const std::string &text)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(row));

    // Typing an amount means the user no longer wants everything:
    if (draft_.isMaxSend)
    {
        draft_.isMaxSend = false;
        maxSource_ = MaxAmountSource::none;
    }
    draft_.rows[row].amount = text;
    changed(lock, true);
    return Status();
}

Status
DraftController::unitSet(AmountUnit unit)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));
    if (unit == draft_.unit)
        return Status();

    // Carry the typed amounts over to the new unit where they make sense:
    for (auto &row: draft_.rows)
    {
        uint64_t amount;
        if (amountParse(amount, row.amount, draft_.unit))
            row.amount = amountFormat(amount, unit);
    }
    draft_.unit = unit;
    changed(lock, true);
    return Status();
}

Status
DraftController::rowAdd()
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));
    if (DraftMode::multi != draft_.mode)
        return SC_ERROR(SC_CC_InvalidState, "Rows can only be added in multi mode");

    draft_.rows.push_back(RecipientRow());
    changed(lock, true);
    return Status();
}

Status
DraftController::rowRemove(size_t row)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(row));
    if (DraftMode::multi != draft_.mode || draft_.rows.size() <= 2)
        return SC_ERROR(SC_CC_InvalidState,
                        "Multi mode needs at least two rows");

    draft_.rows.erase(draft_.rows.begin() + row);
    changed(lock, true);
    return Status();
}

Status
DraftController::modeSet(DraftMode mode)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));
    if (mode == draft_.mode)
        return Status();

    if (DraftMode::multi == mode)
    {
        // The single row seeds the list, but max-send stays behind:
        if (draft_.isMaxSend)
            draft_.rows[0].amount.clear();
        draft_.isMaxSend = false;
        maxSource_ = MaxAmountSource::none;
        draft_.rows.resize(2);
    }
    else
    {
        draft_.rows.resize(1);
    }
    draft_.mode = mode;

    SC_DebugLog("Draft mode is now %s",
                DraftMode::multi == mode ? "multi" : "single");
    changed(lock, true);
    return Status();
}

Status
DraftController::feeRateSet(double rate)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));
    if (!(config_.minFeeRate <= rate) || !std::isfinite(rate))
        return SC_ERROR(SC_CC_FeeRateBelowMinimum,
                        "Fee rate is below the network minimum");

    draft_.feeRate = rate;
    maxSendGuess();
    changed(lock, true);
    return Status();
}

Status
DraftController::maxSendSet(bool enable)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));
    if (enable == draft_.isMaxSend)
        return Status();
    if (enable && DraftMode::multi == draft_.mode)
        return SC_ERROR(SC_CC_InvalidState,
                        "Max send needs a single recipient");

    draft_.isMaxSend = enable;
    if (enable)
        maxSendGuess();
    else
        maxSource_ = MaxAmountSource::none;
    changed(lock, true);
    return Status();
}

Status
DraftController::labelSet(const std::string &label)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));

    draft_.label = label;
    changed(lock, false);
    return Status();
}

Status
DraftController::selectCoins(const OutpointSet &outpoints)
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));

    for (const auto &outpoint: outpoints)
    {
        auto i = std::find_if(utxos_.begin(), utxos_.end(),
            [&outpoint](const Utxo &utxo){ return utxo.outpoint == outpoint; });
        if (utxos_.end() == i)
            return SC_ERROR(SC_CC_CoinNotSpendable, "Unknown coin " + outpoint);
        if (i->frozen)
            return SC_ERROR(SC_CC_CoinNotSpendable, "Frozen coin " + outpoint);
    }

    draft_.coinSelection = outpoints;
    maxSendGuess();
    changed(lock, true);
    return Status();
}

void
DraftController::utxosSet(const UtxoList &utxos)
{
    Lock lock(mutex_);
    utxos_ = utxos;
    utxosKnown_ = true;

    // Prune coins that were spent or frozen elsewhere:
    if (selectionPrune(draft_.coinSelection))
        store_.save(draft_).log();

    // The engine's choices depend on the coins, so estimate again:
    maxSendGuess();
    rearm();
    publish(lock);
}

void
DraftController::connectionSet(bool connected)
{
    Lock lock(mutex_);
    if (connected == connected_)
        return;
    connected_ = connected;

    if (connected)
    {
        rearm();
    }
    else
    {
        // Forget the estimate and anything still in flight:
        ++generation_;
        timerArmed_ = false;
        inFlight_ = 0;
    }
    SC_DebugLog("Draft %s", connected ? "reconnected" : "disconnected");
    publish(lock);
}

Status
DraftController::discard()
{
    Lock lock(mutex_);
    SC_CHECK(editCheck(0));

    resetDraft();
    ++generation_;
    timerArmed_ = false;
    inFlight_ = 0;
    finalState_ = DraftState::editing;
    txid_.clear();
    commitError_ = Status();
    store_.clear().log();

    publish(lock);
    return Status();
}

std::chrono::milliseconds
DraftController::wakeup()
{
    Lock lock(mutex_);
    if (!timerArmed_)
        return std::chrono::milliseconds(0);

    // Still waiting for the user to stop typing:
    const auto now = now_();
    if (now < deadline_)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - now);
        return std::max(left, std::chrono::milliseconds(1));
    }
    timerArmed_ = false;

    std::vector<RowStatus> rows;
    rowsCheck(rows);
    const auto request = makeRequest(rows);
    if (!connected_ || committing_ || request.recipients.empty())
    {
        publish(lock);
        return std::chrono::milliseconds(0);
    }

    const auto tag = generation_;
    inFlight_ = tag;
    SC_DebugLog("Dry run %llu: %d recipients at %.3f sat/vB%s",
        static_cast<unsigned long long>(tag),
        static_cast<int>(request.recipients.size()), request.feeRate,
        request.isMaxSend ? ", max" : "");
    publish(lock);

    std::weak_ptr<CallbackGuard> weak = guard_;
    engine_.dryRun(request, [weak, tag](DryRunResult result)
    {
        auto guard = weak.lock();
        if (!guard)
            return;
        std::lock_guard<std::recursive_mutex> lock(guard->mutex);
        if (guard->owner)
            guard->owner->dryRunDone(tag, std::move(result));
    });

    return std::chrono::milliseconds(0);
}

Status
DraftController::commitSend(std::string &txid)
{
    if (config_.watchOnly)
        return SC_ERROR(SC_CC_InvalidState,
                        "Watch-only wallets must use offline signing");

    SpendRequest request;
    Lock lock(mutex_);
    SC_CHECK(commitBegin(request, lock));

    std::string out;
    Status sent = engine_.commitSend(out, request);

    lock.lock();
    commitEnd(lock, sent, out);
    SC_CHECK(sent);

    txid = out;
    return Status();
}

Status
DraftController::commitPsbt(std::shared_ptr<PsbtSession> &result)
{
    SpendRequest request;
    Lock lock(mutex_);
    SC_CHECK(commitBegin(request, lock));

    DataChunk psbt;
    std::shared_ptr<PsbtSession> session;
    Status created = engine_.commitPsbtCreate(psbt, request);
    if (created)
        created = PsbtSession::create(session, engine_, psbt);

    lock.lock();
    commitEnd(lock, created, std::string());
    SC_CHECK(created);

    result = session;
    return Status();
}

Status
DraftController::editCheck(size_t row) const
{
    if (committing_)
        return SC_ERROR(SC_CC_CommitInFlight, "The draft is being sent");
    if (draft_.rows.size() <= row)
        return SC_ERROR(SC_CC_Error, "No such recipient row");
    return Status();
}

void
DraftController::rearm()
{
    ++generation_;
    timerArmed_ = connected_;
    deadline_ = now_() + std::chrono::milliseconds(config_.debounceMs);
}

void
DraftController::changed(Lock &lock, bool relevant)
{
    finalState_ = DraftState::editing;
    if (relevant)
        rearm();

    store_.save(draft_).log();
    publish(lock);
}

void
DraftController::resetDraft()
{
    draft_ = SendDraft();
    draft_.feeRate = std::max(config_.minFeeRate, draft_.feeRate);
    maxSource_ = MaxAmountSource::none;
}

size_t
DraftController::selectionPrune(OutpointSet &selection) const
{
    OutpointSet pruned;
    for (const auto &utxo: utxos_)
        if (!utxo.frozen && selection.count(utxo.outpoint))
            pruned.insert(utxo.outpoint);

    const size_t dropped = selection.size() - pruned.size();
    if (dropped)
    {
        SC_DebugLog("Dropped %d unavailable coins from the selection",
                    static_cast<int>(dropped));
        selection = std::move(pruned);
    }
    return dropped;
}

uint64_t
DraftController::available() const
{
    uint64_t out = 0;
    for (const auto &utxo: utxos_)
    {
        if (draft_.coinSelection.empty())
        {
            if (!utxo.frozen && (utxo.confirmed || config_.spendUnconfirmed))
                out += utxo.amountSats;
        }
        else if (draft_.coinSelection.count(utxo.outpoint))
        {
            out += utxo.amountSats;
        }
    }
    return out;
}

void
DraftController::maxSendGuess()
{
    if (!draft_.isMaxSend)
        return;

    const auto balance = available();
    const auto fee = feeForSize(draft_.feeRate, config_.maxSendVbytes);
    draft_.rows[0].amount = amountFormat(fee < balance ? balance - fee : 0,
                                         draft_.unit);
    maxSource_ = MaxAmountSource::heuristic;
}

void
DraftController::rowsCheck(std::vector<RowStatus> &result) const
{
    std::vector<RowStatus> out;
    for (size_t i = 0; i < draft_.rows.size(); ++i)
    {
        const auto &row = draft_.rows[i];
        RowStatus status = {Status(), false, false, 0, false, false};

        if (!textTrim(row.address).empty())
        {
            status.address = addressValidate(row.address);
            status.addressValid = static_cast<bool>(status.address);
        }

        uint64_t amount = 0;
        if (draft_.isMaxSend && !i)
        {
            // The amount is ours, so zero is fine:
            status.amountValid = true;
            if (amountParse(amount, row.amount, draft_.unit))
                status.amountSats = amount;
        }
        else if (amountParse(amount, row.amount, draft_.unit) && amount)
        {
            status.amountValid = true;
            status.amountSats = amount;
        }

        status.belowDust = status.amountValid && !(draft_.isMaxSend && !i) &&
            status.amountSats < config_.dustLimit;
        status.counted = status.addressValid && status.amountValid;
        out.push_back(status);
    }
    result = std::move(out);
}

SpendRequest
DraftController::makeRequest(const std::vector<RowStatus> &rows) const
{
    SpendRequest out;
    for (size_t i = 0; i < rows.size(); ++i)
        if (rows[i].counted)
            out.recipients.push_back(Recipient{
                textTrim(draft_.rows[i].address), rows[i].amountSats});
    out.feeRate = draft_.feeRate;
    out.coinSelection = draft_.coinSelection;
    out.isMaxSend = draft_.isMaxSend;
    out.label = draft_.label;
    return out;
}

bool
DraftController::sendable(const std::vector<RowStatus> &rows) const
{
    const auto count = std::count_if(rows.begin(), rows.end(),
        [](const RowStatus &row){ return row.counted; });

    if (committing_ || !connected_)
        return false;
    if (estimateGeneration_ != generation_ || !estimate_.error)
        return false;
    if (DraftMode::multi == draft_.mode)
        return 2 <= count;
    return 1 == count;
}

Status
DraftController::commitBegin(SpendRequest &request, Lock &lock)
{
    if (committing_)
        return SC_ERROR(SC_CC_CommitInFlight, "The draft is already being sent");

    std::vector<RowStatus> rows;
    rowsCheck(rows);
    if (!sendable(rows))
        return SC_ERROR(SC_CC_NotSendable, "The draft is not ready to send");

    committing_ = true;
    request = makeRequest(rows);
    SC_DebugLog("Committing %d recipients at %.3f sat/vB",
        static_cast<int>(request.recipients.size()), request.feeRate);

    // Unlocks, so the engine runs without our lock:
    publish(lock);
    return Status();
}

void
DraftController::commitEnd(Lock &lock, const Status &status,
                           const std::string &txid)
{
    committing_ = false;
    if (status)
    {
        // The draft and its saved copy go away together:
        resetDraft();
        store_.clear().log();
        ++generation_;
        timerArmed_ = false;
        inFlight_ = 0;
        finalState_ = DraftState::done;
        txid_ = txid;
        commitError_ = Status();
        SC_DebugLog("Commit succeeded %s", txid.c_str());
    }
    else
    {
        finalState_ = DraftState::failed;
        commitError_ = status;
        status.log();
    }
    publish(lock);
}

void
DraftController::dryRunDone(uint64_t tag, DryRunResult result)
{
    Lock lock(mutex_);
    if (tag != generation_ || tag != inFlight_)
    {
        SC_DebugLog("Dry run %llu superseded, dropping it",
                    static_cast<unsigned long long>(tag));
        return;
    }
    inFlight_ = 0;

    if (result.error)
    {
        SC_DebugLog("Dry run %llu: fee %llu, %d inputs, %.1f vB",
            static_cast<unsigned long long>(tag),
            static_cast<unsigned long long>(result.feeSats),
            static_cast<int>(result.numInputs), result.txVBytes);

        // The engine knows the exact max, so swap out our guess:
        if (draft_.isMaxSend)
        {
            auto text = amountFormat(result.recipientAmountSats, draft_.unit);
            if (text != draft_.rows[0].amount ||
                MaxAmountSource::exact != maxSource_)
            {
                draft_.rows[0].amount = text;
                maxSource_ = MaxAmountSource::exact;
                store_.save(draft_).log();
            }
        }
    }
    else
    {
        SC_DebugLog("Dry run %llu failed: %s",
            static_cast<unsigned long long>(tag),
            result.error.message().c_str());
    }

    estimate_ = std::move(result);
    estimateGeneration_ = tag;
    publish(lock);
}

void
DraftController::publish(Lock &lock)
{
    auto out = std::make_shared<DraftSnapshot>();
    out->version = ++version_;
    out->draft = draft_;
    rowsCheck(out->rows);

    out->validRecipientCount = 0;
    out->totalSendingSats = 0;
    for (const auto &row: out->rows)
    {
        if (!row.counted)
            continue;
        ++out->validRecipientCount;
        out->totalSendingSats += row.amountSats;
    }
    out->availableSats = available();
    out->maxAmountSource = maxSource_;

    out->connected = connected_;
    out->hasEstimate = estimateGeneration_ == generation_;
    if (out->hasEstimate)
        out->estimate = estimate_;
    out->canCommit = sendable(out->rows);
    out->txid = txid_;
    out->commitError = commitError_;

    const bool blank = draft_.coinSelection.empty() && !draft_.isMaxSend &&
        draft_.label.empty() && std::all_of(draft_.rows.begin(),
        draft_.rows.end(), [](const RecipientRow &row)
        {
            return textTrim(row.address).empty() &&
                textTrim(row.amount).empty();
        });

    if (committing_)
        out->state = DraftState::committing;
    else if (DraftState::editing != finalState_)
        out->state = finalState_;
    else if (blank && DraftMode::single == draft_.mode)
        out->state = DraftState::empty;
    else if (timerArmed_ || (inFlight_ && inFlight_ == generation_))
        out->state = DraftState::estimating;
    else if (out->hasEstimate)
        out->state = DraftState::estimated;
    else
        out->state = DraftState::editing;

    snapshot_ = out;
    std::vector<Watcher> watchers;
    for (const auto &i: watchers_)
        watchers.push_back(i.second);
    lock.unlock();

    for (const auto &watcher: watchers)
        watcher(out);
}

} // namespace sendcore
