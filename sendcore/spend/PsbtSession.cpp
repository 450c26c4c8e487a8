/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "PsbtSession.hpp"
#include "WalletEngine.hpp"
#include "../crypto/Encoding.hpp"
#include "../util/Debug.hpp"
#include <map>

namespace sendcore {

const char *
psbtPhaseName(PsbtPhase phase)
{
    switch (phase)
    {
    case PsbtPhase::exporting:
        return "exporting";
    case PsbtPhase::awaitingSigned:
        return "awaiting-signed";
    case PsbtPhase::confirmingBroadcast:
        return "confirming-broadcast";
    case PsbtPhase::broadcasting:
        return "broadcasting";
    case PsbtPhase::done:
        return "done";
    case PsbtPhase::failed:
        return "failed";
    case PsbtPhase::cancelled:
        return "cancelled";
    }
    return "unknown";
}

Status
PsbtSession::create(std::shared_ptr<PsbtSession> &result,
                    WalletEngine &engine, DataSlice unsignedPayload)
{
    Psbt psbt;
    SC_CHECK(psbtDecode(psbt, unsignedPayload));
    if (psbt.tx.inputs.empty())
        return SC_ERROR(SC_CC_ParseError, "PSBT spends nothing");

    result.reset(new PsbtSession(engine,
        DataChunk(unsignedPayload.begin(), unsignedPayload.end()),
        std::move(psbt)));
    return Status();
}

PsbtSession::PsbtSession(WalletEngine &engine, DataChunk data, Psbt psbt):
    engine_(engine),
    unsignedData_(std::move(data)),
    unsigned_(std::move(psbt)),
    phase_(PsbtPhase::exporting),
    hasSigned_(false),
    totals_()
{
    SC_DebugLog("PSBT session started: %d inputs, %d outputs",
        static_cast<int>(unsigned_.tx.inputs.size()),
        static_cast<int>(unsigned_.tx.outputs.size()));
}

PsbtPhase
PsbtSession::phase() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

std::string
PsbtSession::unsignedBase64() const
{
    return base64Encode(unsignedData_);
}

Status
PsbtSession::exportComplete()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (PsbtPhase::exporting != phase_)
        return SC_ERROR(SC_CC_InvalidState,
            std::string("Cannot finish exporting while ") + psbtPhaseName(phase_));

    phase_ = PsbtPhase::awaitingSigned;
    return Status();
}

Status
PsbtSession::reconcile(ReconciledTotals &result,
                       const SignedPayload &payload) const
{
    const auto &tx = payload.psbt.tx;

    // Index what the unsigned payload knows:
    std::map<std::string, const PsbtInput *> knownInputs;
    for (size_t i = 0; i < unsigned_.tx.inputs.size(); ++i)
        knownInputs[unsigned_.tx.inputs[i].outpoint] = &unsigned_.inputs[i];

    ReconciledTotals out = {};
    out.hasTotalInput = true;
    out.inputCount = tx.inputs.size();

    size_t shared = 0;
    for (size_t i = 0; i < tx.inputs.size(); ++i)
    {
        const auto &info = payload.psbt.inputs[i];
        auto known = knownInputs.find(tx.inputs[i].outpoint);
        if (knownInputs.end() != known)
            ++shared;

        // Prefer the signer's UTXO data, but fall back on ours:
        if (info.hasValue)
            out.totalInputSats += info.value;
        else if (knownInputs.end() != known && known->second->hasValue)
            out.totalInputSats += known->second->value;
        else
            out.hasTotalInput = false;

        if (info.signatureCount || info.finalized)
            ++out.signedInputs;
    }
    if (!shared)
        return SC_ERROR(SC_CC_PsbtPayloadMismatch,
                        "Signed transaction spends different coins");
    if (!out.signedInputs)
        return SC_ERROR(SC_CC_PsbtNotSigned, "PSBT is not fully signed");

    for (size_t i = 0; i < tx.outputs.size(); ++i)
    {
        const auto &output = tx.outputs[i];
        out.totalOutputSats += output.value;

        // The signer may drop our derivation data, so check both copies:
        bool isChange = payload.psbt.outputs[i].hasDerivation;
        for (size_t j = 0; !isChange && j < unsigned_.tx.outputs.size(); ++j)
            isChange = unsigned_.outputs[j].hasDerivation &&
                unsigned_.tx.outputs[j].script == output.script;

        if (isChange)
            out.changeSats += output.value;
        else
            out.recipients.push_back(output);
    }

    if (out.hasTotalInput && out.totalOutputSats <= out.totalInputSats)
    {
        out.hasFee = true;
        out.feeSats = out.totalInputSats - out.totalOutputSats;
    }
    out.finalized = SignedPayload::Kind::rawTx == payload.kind ||
        psbtIsFinalized(payload.psbt);

    result = std::move(out);
    return Status();
}

Status
PsbtSession::acceptSignedPayload(const std::string &text)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (PsbtPhase::exporting != phase_ &&
            PsbtPhase::awaitingSigned != phase_)
            return SC_ERROR(SC_CC_InvalidState,
                std::string("Cannot accept a payload while ") +
                psbtPhaseName(phase_));
        phase_ = PsbtPhase::awaitingSigned;
    }

    // Decoding needs no lock, since the unsigned side never changes:
    SignedPayload payload;
    ReconciledTotals totals;
    SC_CHECK(signedPayloadDecode(payload, text));
    SC_CHECK(reconcile(totals, payload));

    std::lock_guard<std::mutex> lock(mutex_);
    if (PsbtPhase::awaitingSigned != phase_)
        return SC_ERROR(SC_CC_InvalidState,
            std::string("Session moved on to ") + psbtPhaseName(phase_));

    signed_ = std::move(payload);
    totals_ = std::move(totals);
    hasSigned_ = true;
    phase_ = PsbtPhase::confirmingBroadcast;

    SC_DebugLog("PSBT signed payload accepted: %d of %d inputs signed, fee %s",
        static_cast<int>(totals_.signedInputs),
        static_cast<int>(totals_.inputCount),
        totals_.hasFee ? std::to_string(totals_.feeSats).c_str() : "unknown");
    return Status();
}

Status
PsbtSession::totals(ReconciledTotals &result) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hasSigned_)
        return SC_ERROR(SC_CC_InvalidState, "No signed payload yet");

    result = totals_;
    return Status();
}

Status
PsbtSession::confirmBroadcast()
{
    SignedPayload payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (PsbtPhase::confirmingBroadcast != phase_)
            return SC_ERROR(SC_CC_InvalidState,
                std::string("Cannot broadcast while ") + psbtPhaseName(phase_));
        phase_ = PsbtPhase::broadcasting;
        payload = signed_;
    }

    std::string txid;
    Status s = engine_.broadcastSigned(txid, payload);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!s)
    {
        phase_ = PsbtPhase::failed;
        s.log();
        return SC_ERROR(SC_CC_PsbtBroadcastFailed,
                        "Broadcast failed: " + s.message());
    }

    phase_ = PsbtPhase::done;
    txid_ = txid;
    SC_DebugLog("PSBT broadcast as %s", txid_.c_str());
    return Status();
}

Status
PsbtSession::cancel()
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (phase_)
    {
    case PsbtPhase::exporting:
    case PsbtPhase::awaitingSigned:
    case PsbtPhase::confirmingBroadcast:
        break;
    default:
        return SC_ERROR(SC_CC_InvalidState,
            std::string("Cannot cancel while ") + psbtPhaseName(phase_));
    }

    // The signed copy goes away with the session:
    phase_ = PsbtPhase::cancelled;
    signed_ = SignedPayload();
    hasSigned_ = false;
    return Status();
}

std::string
PsbtSession::txid() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return txid_;
}

} // namespace sendcore
