/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_TEST_FAKE_ENGINE_HPP
#define SENDCORE_TEST_FAKE_ENGINE_HPP

#include "../sendcore/spend/DraftStore.hpp"
#include "../sendcore/spend/WalletEngine.hpp"

/**
 * Holds on to dry-run requests, so tests can answer them in any order.
 */
class FakeEngine:
    public sendcore::WalletEngine
{
public:
    std::vector<sendcore::SpendRequest> requests;
    std::vector<DryRunCallback> callbacks;

    std::vector<sendcore::SpendRequest> commits;
    sendcore::Status commitStatus;
    sendcore::DataChunk psbt;
    std::function<void()> onCommit;

    std::vector<sendcore::SignedPayload> broadcasts;
    sendcore::Status broadcastStatus;
    std::function<void()> onBroadcast;

    void
    dryRun(const sendcore::SpendRequest &request,
           DryRunCallback callback) override
    {
        requests.push_back(request);
        callbacks.push_back(callback);
    }

    sendcore::Status
    commitSend(std::string &txid,
               const sendcore::SpendRequest &request) override
    {
        commits.push_back(request);
        if (onCommit)
            onCommit();
        if (!commitStatus)
            return commitStatus;
        txid = "feedface";
        return sendcore::Status();
    }

    sendcore::Status
    commitPsbtCreate(sendcore::DataChunk &result,
                     const sendcore::SpendRequest &request) override
    {
        commits.push_back(request);
        if (onCommit)
            onCommit();
        if (!commitStatus)
            return commitStatus;
        result = psbt;
        return sendcore::Status();
    }

    sendcore::Status
    broadcastSigned(std::string &txid,
                    const sendcore::SignedPayload &payload) override
    {
        broadcasts.push_back(payload);
        if (onBroadcast)
            onBroadcast();
        if (!broadcastStatus)
            return broadcastStatus;
        txid = "beefcafe";
        return sendcore::Status();
    }

    /**
     * Answers the most recent dry-run.
     */
    void
    answer(uint64_t fee, uint64_t amount)
    {
        answer(callbacks.size() - 1, fee, amount);
    }

    void
    answer(size_t i, uint64_t fee, uint64_t amount)
    {
        sendcore::DryRunResult result;
        result.feeSats = fee;
        result.txVBytes = 141;
        result.recipientAmountSats = amount;
        result.numInputs = 1;
        result.effectiveFeeRate = fee / 141.0;
        callbacks[i](result);
    }

    void
    fail(tSC_CC code, const char *message)
    {
        sendcore::DryRunResult result;
        result.error = SC_ERROR(code, message);
        callbacks.back()(result);
    }
};

/**
 * Keeps the draft in memory.
 */
class FakeStore:
    public sendcore::DraftStore
{
public:
    bool saved = false;
    sendcore::SendDraft draft;
    size_t saves = 0;
    size_t clears = 0;

    sendcore::Status
    load(sendcore::SendDraft &result) override
    {
        if (!saved)
            return SC_ERROR(SC_CC_FileDoesNotExist, "No draft");
        result = draft;
        return sendcore::Status();
    }

    sendcore::Status
    save(const sendcore::SendDraft &value) override
    {
        draft = value;
        saved = true;
        ++saves;
        return sendcore::Status();
    }

    sendcore::Status
    clear() override
    {
        saved = false;
        ++clears;
        return sendcore::Status();
    }
};

#endif
