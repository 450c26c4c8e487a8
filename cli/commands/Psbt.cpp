/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../sendcore/bitcoin/Psbt.hpp"
#include "../../sendcore/crypto/Encoding.hpp"
#include <iostream>

using namespace sendcore;

COMMAND(InitLevel::none, PsbtDecode, "psbt-decode",
        " <base64-or-hex>")
{
    if (argc != 1)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    SignedPayload payload;
    SC_CHECK(signedPayloadDecode(payload, argv[0]));
    const auto &psbt = payload.psbt;

    std::cout << (SignedPayload::Kind::psbt == payload.kind ?
                  "PSBT" : "Raw transaction") << " " << psbt.tx.txid << std::endl;
    for (size_t i = 0; i < psbt.tx.inputs.size(); ++i)
    {
        const auto &input = psbt.inputs[i];
        std::cout << "input " << psbt.tx.inputs[i].outpoint;
        if (input.hasValue)
            std::cout << " " << input.value << " sats";
        if (input.finalized)
            std::cout << " finalized";
        else if (input.signatureCount)
            std::cout << " " << input.signatureCount << " signatures";
        std::cout << std::endl;
    }
    for (size_t i = 0; i < psbt.tx.outputs.size(); ++i)
    {
        const auto &output = psbt.tx.outputs[i];
        std::cout << "output " << output.value << " sats " <<
                  base16Encode(output.script) <<
                  (psbt.outputs[i].hasDerivation ? " change" : "") << std::endl;
    }
    std::cout << (psbtIsFinalized(psbt) ? "Finalized" :
                  psbtIsSigned(psbt) ? "Partially signed" : "Unsigned") <<
              (isReplaceByFee(psbt.tx) ? ", replaceable" : "") << std::endl;

    return Status();
}
