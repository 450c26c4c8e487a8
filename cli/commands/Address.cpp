/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../sendcore/bitcoin/Address.hpp"
#include "../../sendcore/bitcoin/Amount.hpp"
#include "../../sendcore/bitcoin/Uri.hpp"
#include <iostream>

using namespace sendcore;

COMMAND(InitLevel::none, AddressValidate, "address-validate",
        " <address>...")
{
    if (argc < 1)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    // Check them all, but fail if any are bad:
    Status out;
    for (int i = 0; i < argc; ++i)
    {
        AddressInfo info;
        Status s = addressInspect(info, argv[i]);
        if (s)
        {
            std::cout << info.address << ": valid " <<
                      addressFormatName(info.format) << " " <<
                      addressNetworkName(info.network) << std::endl;
        }
        else
        {
            std::cout << argv[i] << ": " << s.message() << std::endl;
            out = s;
        }
    }

    return out;
}

COMMAND(InitLevel::none, AmountParse, "amount-parse",
        " <amount> <sats|btc>")
{
    if (argc != 2)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    AmountUnit unit;
    SC_CHECK(amountUnitFromName(unit, argv[1]));

    uint64_t amount;
    SC_CHECK(amountParse(amount, argv[0], unit));
    std::cout << amount << " sats (" <<
              amountFormat(amount, AmountUnit::btc) << " BTC)" << std::endl;

    return Status();
}

COMMAND(InitLevel::none, UriParse, "uri-parse",
        " <uri>")
{
    if (argc != 1)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    PaymentUri uri;
    SC_CHECK(uriParse(uri, argv[0]));
    SC_CHECK(addressValidate(uri.address));

    std::cout << "address: " << uri.address << std::endl;
    if (uri.hasAmount)
        std::cout << "amount: " << uri.amountSats << " sats" << std::endl;
    if (!uri.label.empty())
        std::cout << "label: " << uri.label << std::endl;
    if (!uri.message.empty())
        std::cout << "message: " << uri.message << std::endl;

    return Status();
}
