/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "PsbtFixtures.hpp"
#include "../sendcore/bitcoin/Psbt.hpp"
#include "../sendcore/crypto/Encoding.hpp"
#include <catch.hpp>

using namespace fixtures;

TEST_CASE("Transaction decoding", "[bitcoin][tx]")
{
    sendcore::DataChunk raw;
    sendcore::Transaction tx;

    SECTION("segwit")
    {
        REQUIRE(sendcore::base16Decode(raw, segwitTxHex));
        REQUIRE(sendcore::decodeTx(tx, raw));
        REQUIRE(tx.segwit);
        REQUIRE(2 == tx.version);
        REQUIRE(0 == tx.locktime);
        REQUIRE(tx.txid == unsignedTxid);
        REQUIRE(2 == tx.inputs.size());
        REQUIRE(tx.inputs[0].outpoint == outpoint0);
        REQUIRE(tx.inputs[1].outpoint == outpoint1);
        REQUIRE(2 == tx.inputs[0].witness.size());
        REQUIRE(tx.inputs[0].script.empty());
        REQUIRE(2 == tx.outputs.size());
        REQUIRE(30000 == tx.outputs[0].value);
        REQUIRE(19000 == tx.outputs[1].value);
        REQUIRE(sendcore::base16Encode(tx.outputs[0].script) == recipientScript);
        REQUIRE(sendcore::isSigned(tx));
        REQUIRE(sendcore::isReplaceByFee(tx));
    }
    SECTION("legacy")
    {
        REQUIRE(sendcore::base16Decode(raw, legacyTxHex));
        REQUIRE(sendcore::decodeTx(tx, raw));
        REQUIRE_FALSE(tx.segwit);
        REQUIRE(tx.txid == legacyTxid);
        REQUIRE(1 == tx.inputs.size());
        REQUIRE(tx.inputs[0].outpoint == outpoint0);
        REQUIRE(tx.inputs[0].witness.empty());
        REQUIRE_FALSE(tx.inputs[0].script.empty());
        REQUIRE(1 == tx.outputs.size());
        REQUIRE(12345 == tx.outputs[0].value);
        REQUIRE(sendcore::isSigned(tx));
    }
    SECTION("truncated")
    {
        REQUIRE(sendcore::base16Decode(raw, legacyTxHex));
        raw.pop_back();
        REQUIRE_FALSE(sendcore::decodeTx(tx, raw));
    }
    SECTION("extra data")
    {
        REQUIRE(sendcore::base16Decode(raw, legacyTxHex));
        raw.push_back(0);
        REQUIRE_FALSE(sendcore::decodeTx(tx, raw));
    }
}

TEST_CASE("PSBT decoding", "[bitcoin][psbt]")
{
    sendcore::DataChunk raw;
    sendcore::Psbt psbt;

    SECTION("unsigned")
    {
        REQUIRE(sendcore::base64Decode(raw, unsignedPsbtBase64));
        REQUIRE(sendcore::psbtHasMagic(raw));
        REQUIRE(sendcore::psbtDecode(psbt, raw));
        REQUIRE(psbt.tx.txid == unsignedTxid);
        REQUIRE(2 == psbt.inputs.size());
        REQUIRE(psbt.inputs[0].hasValue);
        REQUIRE(25000 == psbt.inputs[0].value);
        REQUIRE(psbt.inputs[1].hasValue);
        REQUIRE(25000 == psbt.inputs[1].value);
        REQUIRE(0 == psbt.inputs[0].signatureCount);
        REQUIRE(2 == psbt.outputs.size());
        REQUIRE_FALSE(psbt.outputs[0].hasDerivation);
        REQUIRE(psbt.outputs[1].hasDerivation);
        REQUIRE_FALSE(sendcore::psbtIsSigned(psbt));
        REQUIRE_FALSE(sendcore::psbtIsFinalized(psbt));
    }
    SECTION("hex and base64 agree")
    {
        sendcore::DataChunk hex;
        REQUIRE(sendcore::base64Decode(raw, unsignedPsbtBase64));
        REQUIRE(sendcore::base16Decode(hex, unsignedPsbtHex));
        REQUIRE(raw == hex);
    }
    SECTION("partially signed")
    {
        REQUIRE(sendcore::base64Decode(raw, signedPsbtBase64));
        REQUIRE(sendcore::psbtDecode(psbt, raw));
        REQUIRE(psbt.inputs[0].hasValue);
        REQUIRE_FALSE(psbt.inputs[1].hasValue);
        REQUIRE(1 == psbt.inputs[0].signatureCount);
        REQUIRE(1 == psbt.inputs[1].signatureCount);
        REQUIRE_FALSE(psbt.outputs[1].hasDerivation);
        REQUIRE(sendcore::psbtIsSigned(psbt));
        REQUIRE_FALSE(sendcore::psbtIsFinalized(psbt));
    }
    SECTION("finalized")
    {
        REQUIRE(sendcore::base64Decode(raw, finalPsbtBase64));
        REQUIRE(sendcore::psbtDecode(psbt, raw));
        REQUIRE(sendcore::psbtIsSigned(psbt));
        REQUIRE(sendcore::psbtIsFinalized(psbt));
    }
    SECTION("truncated")
    {
        REQUIRE(sendcore::base64Decode(raw, truncatedPsbtBase64));
        REQUIRE(sendcore::psbtHasMagic(raw));
        REQUIRE_FALSE(sendcore::psbtDecode(psbt, raw));
    }
    SECTION("not a PSBT")
    {
        REQUIRE(sendcore::base16Decode(raw, legacyTxHex));
        REQUIRE_FALSE(sendcore::psbtHasMagic(raw));
        REQUIRE_FALSE(sendcore::psbtDecode(psbt, raw));
    }
}

TEST_CASE("Signed payload decoding", "[bitcoin][psbt]")
{
    sendcore::SignedPayload payload;

    SECTION("base64 PSBT")
    {
        REQUIRE(sendcore::signedPayloadDecode(payload, signedPsbtBase64));
        REQUIRE(sendcore::SignedPayload::Kind::psbt == payload.kind);
        REQUIRE(sendcore::psbtHasMagic(payload.data));
        REQUIRE(2 == payload.psbt.inputs.size());
    }
    SECTION("hex PSBT with whitespace")
    {
        REQUIRE(sendcore::signedPayloadDecode(payload,
            std::string("\n ") + unsignedPsbtHex + "  \n"));
        REQUIRE(sendcore::SignedPayload::Kind::psbt == payload.kind);
        REQUIRE(payload.psbt.tx.txid == unsignedTxid);
    }
    SECTION("raw transaction")
    {
        REQUIRE(sendcore::signedPayloadDecode(payload, segwitTxHex));
        REQUIRE(sendcore::SignedPayload::Kind::rawTx == payload.kind);
        REQUIRE(2 == payload.psbt.inputs.size());
        REQUIRE(payload.psbt.inputs[0].finalized);
        REQUIRE_FALSE(payload.psbt.inputs[0].hasValue);
        REQUIRE(2 == payload.psbt.outputs.size());
        REQUIRE(sendcore::psbtIsFinalized(payload.psbt));
    }

    const char *garbage[] =
    {
        "",
        "   ",
        "not a payload!",
        "cHNidP8=",
        "deadbeef",
        truncatedPsbtBase64
    };
    for (auto text: garbage)
    {
        INFO(text);
        sendcore::Status s = sendcore::signedPayloadDecode(payload, text);
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_PsbtUnparseableSignedPayload == s.value());
    }
}
