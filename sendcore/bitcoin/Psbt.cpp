/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Psbt.hpp"
#include "../util/Text.hpp"
#include "../crypto/Encoding.hpp"
#include <bitcoin/bitcoin.hpp>
#include <string.h>
#include <algorithm>

namespace sendcore {

static const uint8_t psbtMagic[] = {'p', 's', 'b', 't', 0xff};

// Key types from BIP 174 and BIP 371:
enum PsbtKeyType
{
    globalUnsignedTx = 0x00,
    inNonWitnessUtxo = 0x00,
    inWitnessUtxo = 0x01,
    inPartialSig = 0x02,
    inFinalScriptSig = 0x07,
    inFinalScriptWitness = 0x08,
    inTapKeySig = 0x13,
    inTapScriptSig = 0x14,
    outBip32Derivation = 0x02,
    outTapBip32Derivation = 0x07
};

/**
 * One key-value record from a PSBT map.
 */
struct PsbtRecord
{
    uint8_t type;
    DataChunk key;      // Key data after the type byte
    DataChunk value;
};

/**
 * Reads key-value records until the 0x00 separator.
 */
template <typename Deserializer>
static std::vector<PsbtRecord>
readMap(Deserializer &deserial)
{
    std::vector<PsbtRecord> out;
    while (true)
    {
        uint64_t keySize = deserial.read_variable_uint();
        if (!keySize)
            break;

        PsbtRecord record;
        record.type = deserial.read_byte();
        record.key = deserial.read_data(keySize - 1);
        uint64_t valueSize = deserial.read_variable_uint();
        record.value = deserial.read_data(valueSize);
        out.push_back(std::move(record));
    }
    return out;
}

/**
 * Finds the value of an output being spent by a non-witness UTXO record.
 */
static Status
nonWitnessValue(uint64_t &result, DataSlice rawTx, const std::string &outpoint)
{
    Transaction prev;
    SC_CHECK(decodeTx(prev, rawTx));
    for (uint32_t i = 0; i < prev.outputs.size(); ++i)
    {
        if (outpointString(prev.txid, i) == outpoint)
        {
            result = prev.outputs[i].value;
            return Status();
        }
    }
    return SC_ERROR(SC_CC_ParseError, "UTXO record does not match its input");
}

static Status
witnessValue(uint64_t &result, DataSlice record)
{
    try
    {
        auto deserial = bc::make_deserializer(record.begin(), record.end());
        result = deserial.read_8_bytes();
    }
    catch (const bc::end_of_stream &)
    {
        return SC_ERROR(SC_CC_ParseError, "Bad witness UTXO record");
    }
    return Status();
}

bool
psbtHasMagic(DataSlice data)
{
    return sizeof(psbtMagic) <= data.size() &&
        !memcmp(data.data(), psbtMagic, sizeof(psbtMagic));
}

Status
psbtDecode(Psbt &result, DataSlice data)
{
    if (!psbtHasMagic(data))
        return SC_ERROR(SC_CC_ParseError, "Missing PSBT magic bytes");

    Psbt out;
    std::vector<std::vector<PsbtRecord>> inputMaps;
    std::vector<std::vector<PsbtRecord>> outputMaps;
    try
    {
        auto deserial = bc::make_deserializer(
            data.begin() + sizeof(psbtMagic), data.end());

        // Global map:
        bool haveTx = false;
        for (const auto &record: readMap(deserial))
        {
            if (globalUnsignedTx != record.type)
                continue;
            if (haveTx)
                return SC_ERROR(SC_CC_ParseError, "Duplicate PSBT transaction");
            SC_CHECK(decodeTx(out.tx, record.value));
            haveTx = true;
        }
        if (!haveTx)
            return SC_ERROR(SC_CC_ParseError, "PSBT has no transaction");
        if (isSigned(out.tx))
            return SC_ERROR(SC_CC_ParseError, "PSBT transaction has scripts");

        for (size_t i = 0; i < out.tx.inputs.size(); ++i)
            inputMaps.push_back(readMap(deserial));
        for (size_t i = 0; i < out.tx.outputs.size(); ++i)
            outputMaps.push_back(readMap(deserial));
    }
    catch (const bc::end_of_stream &)
    {
        return SC_ERROR(SC_CC_ParseError, "Bad PSBT format - too little data");
    }

    for (size_t i = 0; i < inputMaps.size(); ++i)
    {
        PsbtInput input = {false, 0, 0, false};
        for (const auto &record: inputMaps[i])
        {
            switch (record.type)
            {
            case inNonWitnessUtxo:
                SC_CHECK(nonWitnessValue(input.value, record.value,
                                         out.tx.inputs[i].outpoint));
                input.hasValue = true;
                break;
            case inWitnessUtxo:
                // The full transaction wins if both are present:
                if (!input.hasValue)
                {
                    SC_CHECK(witnessValue(input.value, record.value));
                    input.hasValue = true;
                }
                break;
            case inPartialSig:
            case inTapKeySig:
            case inTapScriptSig:
                ++input.signatureCount;
                break;
            case inFinalScriptSig:
            case inFinalScriptWitness:
                input.finalized = true;
                break;
            default:
                break;
            }
        }
        out.inputs.push_back(input);
    }

    for (const auto &map: outputMaps)
    {
        PsbtOutput output = {false};
        for (const auto &record: map)
            if (outBip32Derivation == record.type ||
                outTapBip32Derivation == record.type)
                output.hasDerivation = true;
        out.outputs.push_back(output);
    }

    result = std::move(out);
    return Status();
}

bool
psbtIsSigned(const Psbt &psbt)
{
    for (const auto &input: psbt.inputs)
        if (input.signatureCount || input.finalized)
            return true;
    return false;
}

bool
psbtIsFinalized(const Psbt &psbt)
{
    if (psbt.inputs.empty())
        return false;
    for (const auto &input: psbt.inputs)
        if (!input.finalized)
            return false;
    return true;
}

static bool
isHex(const std::string &text)
{
    return std::all_of(text.begin(), text.end(), [](char c)
    {
        return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f') ||
            ('A' <= c && c <= 'F');
    });
}

Status
signedPayloadDecode(SignedPayload &result, const std::string &text)
{
    const auto clean = textTrim(text);
    if (clean.empty())
        return SC_ERROR(SC_CC_PsbtUnparseableSignedPayload, "Empty payload");

    // Hex is also valid base64, so it goes first:
    DataChunk data;
    if (!(isHex(clean) && base16Decode(data, clean)) &&
        !base64Decode(data, clean))
        return SC_ERROR(SC_CC_PsbtUnparseableSignedPayload,
                        "Payload is neither hex nor base64");

    SignedPayload out;
    if (psbtHasMagic(data))
    {
        out.kind = SignedPayload::Kind::psbt;
        Status s = psbtDecode(out.psbt, data);
        if (!s)
            return SC_ERROR(SC_CC_PsbtUnparseableSignedPayload, s.message());
    }
    else
    {
        out.kind = SignedPayload::Kind::rawTx;
        Status s = decodeTx(out.psbt.tx, data);
        if (!s)
            return SC_ERROR(SC_CC_PsbtUnparseableSignedPayload, s.message());
        if (out.psbt.tx.inputs.empty())
            return SC_ERROR(SC_CC_PsbtUnparseableSignedPayload,
                            "Transaction has no inputs");

        // Raw transactions say nothing about the coins they spend:
        for (const auto &input: out.psbt.tx.inputs)
        {
            PsbtInput info = {false, 0, 0,
                !input.script.empty() || !input.witness.empty()};
            out.psbt.inputs.push_back(info);
        }
        out.psbt.outputs.resize(out.psbt.tx.outputs.size(), PsbtOutput{false});
    }
    out.data = std::move(data);

    result = std::move(out);
    return Status();
}

} // namespace sendcore
