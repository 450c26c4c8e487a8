/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sendcore/bitcoin/Amount.hpp"
#include <catch.hpp>

using sendcore::AmountUnit;

TEST_CASE("Amount parsing", "[bitcoin][amount]")
{
    struct TestCase
    {
        const char *text;
        AmountUnit unit;
        uint64_t amount;
    };
    TestCase cases[] =
    {
        {"0.0005", AmountUnit::btc, 50000},
        {"1", AmountUnit::btc, 100000000},
        {"1.", AmountUnit::btc, 100000000},
        {"0.00000001", AmountUnit::btc, 1},
        {"21000000", AmountUnit::btc, 2100000000000000},
        {"1,000", AmountUnit::sats, 1000},
        {"12,345,678", AmountUnit::sats, 12345678},
        {"999", AmountUnit::sats, 999},
        {" 42 ", AmountUnit::sats, 42},
        {"0", AmountUnit::sats, 0}
    };

    for (auto &test: cases)
    {
        INFO(test.text);
        uint64_t result = 0;
        REQUIRE(sendcore::amountParse(result, test.text, test.unit));
        REQUIRE(test.amount == result);
    }
}

TEST_CASE("Bad amounts", "[bitcoin][amount]")
{
    struct TestCase
    {
        const char *text;
        AmountUnit unit;
    };
    TestCase cases[] =
    {
        {"1.5", AmountUnit::sats},
        {"0.123456789", AmountUnit::btc},
        {"1.2.3", AmountUnit::btc},
        {"abc", AmountUnit::sats},
        {"", AmountUnit::sats},
        {"   ", AmountUnit::btc},
        {".5", AmountUnit::btc},
        {"-5", AmountUnit::sats},
        {"1,000", AmountUnit::btc},
        {"1,2,3", AmountUnit::sats},
        {",100", AmountUnit::sats},
        {"1,00", AmountUnit::sats},
        {"1,000,", AmountUnit::sats},
        {"1234,567", AmountUnit::sats},
        {"1,0000", AmountUnit::sats},
        {"1e5", AmountUnit::sats},
        {"9999999999999999999", AmountUnit::sats},
        {"99999999999", AmountUnit::btc}
    };

    for (auto &test: cases)
    {
        INFO(test.text);
        uint64_t result = 7;
        sendcore::Status s = sendcore::amountParse(result, test.text, test.unit);
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_ParseError == s.value());
        REQUIRE(7 == result);
    }
}

TEST_CASE("Amount formatting", "[bitcoin][amount]")
{
    REQUIRE("50000" == sendcore::amountFormat(50000, AmountUnit::sats));
    REQUIRE("0.0005" == sendcore::amountFormat(50000, AmountUnit::btc));
    REQUIRE("1" == sendcore::amountFormat(100000000, AmountUnit::btc));
    REQUIRE("1.23456789" == sendcore::amountFormat(123456789, AmountUnit::btc));
}

TEST_CASE("Amount unit names", "[bitcoin][amount]")
{
    AmountUnit unit = AmountUnit::sats;
    REQUIRE(sendcore::amountUnitFromName(unit, "btc"));
    REQUIRE(AmountUnit::btc == unit);
    REQUIRE(std::string("btc") == sendcore::amountUnitName(unit));

    REQUIRE_FALSE(sendcore::amountUnitFromName(unit, "mBTC"));
    REQUIRE(AmountUnit::btc == unit);
}
