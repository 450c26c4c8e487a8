/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sendcore/spend/FeeBump.hpp"
#include <catch.hpp>

using sendcore::BumpMethod;

static sendcore::BumpRequest
rbfRequest(uint64_t fee, double vsize, uint64_t balance, double target)
{
    sendcore::BumpRequest out = {};
    out.method = BumpMethod::rbf;
    out.currentFeeSats = fee;
    out.vsize = vsize;
    out.availableBalanceSats = balance;
    out.targetFeeRate = target;
    return out;
}

static sendcore::BumpRequest
cpfpRequest(uint64_t parent, uint64_t balance, double target)
{
    sendcore::BumpRequest out = {};
    out.method = BumpMethod::cpfp;
    out.currentFeeSats = 200;
    out.vsize = 200;
    out.cpfpParentOutputSats = parent;
    out.availableBalanceSats = balance;
    out.targetFeeRate = target;
    return out;
}

TEST_CASE("Fee for size", "[spend][bump]")
{
    REQUIRE(2000 == sendcore::feeForSize(10, 200));
    REQUIRE(220 == sendcore::feeForSize(1.1, 200));
    REQUIRE(141 == sendcore::feeForSize(1, 140.25));
    REQUIRE(1401 == sendcore::feeForSize(10, 140.1));
    REQUIRE(2001 == sendcore::feeForSize(10.0004, 200));
    REQUIRE(0 == sendcore::feeForSize(0, 200));
    REQUIRE(0 == sendcore::feeForSize(5, 0));
}

TEST_CASE("RBF bump", "[spend][bump]")
{
    sendcore::FeeBumpResult result;

    SECTION("affordable")
    {
        REQUIRE(sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 200, 5000, 10)));
        REQUIRE(result.hasAdditionalCost);
        REQUIRE(2000 == result.newTotalFeeSats);
        REQUIRE(1000 == result.additionalCostSats);
        REQUIRE(result.affordable);
        REQUIRE_FALSE(result.willConsolidate);
        REQUIRE(sendcore::feeBumpRequireAffordable(result));
    }
    SECTION("exactly affordable")
    {
        REQUIRE(sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 200, 1000, 10)));
        REQUIRE(result.affordable);
    }
    SECTION("unaffordable")
    {
        REQUIRE(sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 200, 999, 10)));
        REQUIRE_FALSE(result.affordable);

        sendcore::Status s = sendcore::feeBumpRequireAffordable(result);
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_FeeBumpInsufficientFunds == s.value());
    }
    SECTION("fractional size")
    {
        REQUIRE(sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 140.1, 5000, 10)));
        REQUIRE(1401 == result.newTotalFeeSats);
        REQUIRE(401 == result.additionalCostSats);
    }
    SECTION("unknown size")
    {
        REQUIRE(sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 0, 0, 10)));
        REQUIRE_FALSE(result.hasAdditionalCost);
        REQUIRE(result.affordable);
    }
    SECTION("explicit current rate")
    {
        auto request = rbfRequest(1000, 200, 5000, 10);
        request.currentFeeRate = 12;
        sendcore::Status s = sendcore::feeBumpCalculate(result, request);
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_FeeBumpNotHigherThanCurrent == s.value());
    }
}

TEST_CASE("Bump rates must rise", "[spend][bump]")
{
    sendcore::FeeBumpResult result;

    // 1000 sats over 200 vbytes is 5 sat/vB:
    REQUIRE(5 == sendcore::feeBumpCurrentRate(rbfRequest(1000, 200, 0, 0)));

    const double targets[] = {5, 4};
    for (auto target: targets)
    {
        INFO(target);
        sendcore::Status s = sendcore::feeBumpCalculate(result,
            rbfRequest(1000, 200, 100000, target));
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_FeeBumpNotHigherThanCurrent == s.value());
    }

    // Nothing goes below the relay floor:
    const double lows[] = {0.5, 0};
    for (auto target: lows)
    {
        INFO(target);
        sendcore::Status s = sendcore::feeBumpCalculate(result,
            rbfRequest(0, 0, 100000, target));
        REQUIRE_FALSE(s);
        REQUIRE(SC_CC_FeeRateBelowMinimum == s.value());
    }

    // CPFP has the same floor:
    sendcore::Status s = sendcore::feeBumpCalculate(result,
        cpfpRequest(100000, 0, 0.9));
    REQUIRE(SC_CC_FeeRateBelowMinimum == s.value());
}

TEST_CASE("CPFP bump", "[spend][bump]")
{
    sendcore::FeeBumpResult result;

    SECTION("needs consolidation")
    {
        REQUIRE(sendcore::feeBumpCalculate(result, cpfpRequest(2000, 0, 10)));
        REQUIRE(result.hasAdditionalCost);
        REQUIRE(1500 == result.additionalCostSats);
        REQUIRE(2046 == result.requiredSats);
        REQUIRE(2000 == result.fundsAvailableSats);
        REQUIRE(result.willConsolidate);
        REQUIRE_FALSE(result.affordable);

        sendcore::Status s = sendcore::feeBumpRequireAffordable(result);
        REQUIRE(SC_CC_FeeBumpInsufficientFunds == s.value());
    }
    SECTION("wallet coins cover it")
    {
        REQUIRE(sendcore::feeBumpCalculate(result, cpfpRequest(2000, 46, 10)));
        REQUIRE(result.willConsolidate);
        REQUIRE(result.affordable);
    }
    SECTION("parent alone")
    {
        REQUIRE(sendcore::feeBumpCalculate(result, cpfpRequest(2047, 0, 10)));
        REQUIRE_FALSE(result.willConsolidate);
        REQUIRE(result.affordable);
    }
    SECTION("parent exactly at the floor")
    {
        REQUIRE(sendcore::feeBumpCalculate(result, cpfpRequest(2046, 0, 10)));
        REQUIRE(result.willConsolidate);
        REQUIRE(result.affordable);
    }
    SECTION("fractional rates round up")
    {
        REQUIRE(sendcore::feeBumpCalculate(result, cpfpRequest(2000, 0, 2.1)));
        REQUIRE(450 == result.additionalCostSats);

        REQUIRE(sendcore::feeBumpCalculate(result,
            cpfpRequest(2000, 0, 10.0004)));
        REQUIRE(1650 == result.additionalCostSats);
    }
}
