/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Transaction.hpp"
#include <bitcoin/bitcoin.hpp>

namespace sendcore {

std::string
outpointString(const std::string &txid, uint32_t index)
{
    return txid + ":" + std::to_string(index);
}

template <typename Deserializer>
static DataChunk
readChunk(Deserializer &deserial)
{
    uint64_t size = deserial.read_variable_uint();
    return deserial.read_data(size);
}

Status
decodeTx(Transaction &result, DataSlice rawTx)
{
    Transaction out;
    try
    {
        auto deserial = bc::make_deserializer(rawTx.begin(), rawTx.end());

        out.version = deserial.read_4_bytes();

        // Skip the marker and flag if this is segwit:
        const auto bodyStart = deserial.iterator();
        out.segwit = false;
        if (2 <= deserial.end() - deserial.iterator() &&
            deserial.iterator()[0] == 0x00 && deserial.iterator()[1] == 0x01)
        {
            out.segwit = true;
            deserial.read_2_bytes();
        }
        const auto inputStart = deserial.iterator();

        // Read inputs:
        uint64_t inputCount = deserial.read_variable_uint();
        for (uint64_t i = 0; i < inputCount; ++i)
        {
            TxInput input;
            auto hash = deserial.read_hash();
            uint32_t index = deserial.read_4_bytes();
            input.outpoint = outpointString(bc::encode_hash(hash), index);
            input.script = readChunk(deserial);
            input.sequence = deserial.read_4_bytes();
            out.inputs.push_back(std::move(input));
        }

        // Read outputs:
        uint64_t outputCount = deserial.read_variable_uint();
        for (uint64_t i = 0; i < outputCount; ++i)
        {
            TxOutput output;
            output.value = deserial.read_8_bytes();
            output.script = readChunk(deserial);
            out.outputs.push_back(std::move(output));
        }
        const auto witnessStart = deserial.iterator();

        // Read witnesses, one stack per input:
        if (out.segwit)
        {
            for (auto &input: out.inputs)
            {
                uint64_t itemCount = deserial.read_variable_uint();
                for (uint64_t i = 0; i < itemCount; ++i)
                    input.witness.push_back(readChunk(deserial));
            }
        }
        const auto locktimeStart = deserial.iterator();

        // Read locktime:
        out.locktime = deserial.read_4_bytes();
        if (deserial.iterator() != deserial.end())
            return SC_ERROR(SC_CC_ParseError, "Bad transaction format - extra data");

        // The txid leaves out the segwit parts:
        bc::data_chunk stripped(rawTx.begin(), bodyStart);
        stripped.insert(stripped.end(), inputStart, witnessStart);
        stripped.insert(stripped.end(), locktimeStart, deserial.iterator());
        out.txid = bc::encode_hash(bc::bitcoin_hash(stripped));
    }
    catch (const bc::end_of_stream &)
    {
        return SC_ERROR(SC_CC_ParseError, "Bad transaction format - too little data");
    }

    result = std::move(out);
    return Status();
}

bool
isSigned(const Transaction &tx)
{
    for (const auto &input: tx.inputs)
        if (!input.script.empty() || !input.witness.empty())
            return true;
    return false;
}

bool
isReplaceByFee(const Transaction &tx)
{
    for (const auto &input: tx.inputs)
        if (input.sequence < 0xffffffff - 1)
            return true;
    return false;
}

} // namespace sendcore
