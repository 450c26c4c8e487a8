/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../sendcore/spend/FeeBump.hpp"
#include <iostream>

using namespace sendcore;

static void
printResult(const FeeBumpResult &result)
{
    if (result.newTotalFeeSats)
        std::cout << "New total fee: " << result.newTotalFeeSats << std::endl;
    if (result.hasAdditionalCost)
        std::cout << "Additional cost: " << result.additionalCostSats << std::endl;
    else
        std::cout << "Additional cost: unknown" << std::endl;
    std::cout << "Funds available: " << result.fundsAvailableSats << std::endl;
    std::cout << "Funds required: " << result.requiredSats << std::endl;
    if (result.willConsolidate)
        std::cout << "Will consolidate other wallet coins" << std::endl;
    std::cout << (result.affordable ? "Affordable" : "Not affordable") <<
              std::endl;
}

COMMAND(InitLevel::none, BumpRbf, "bump-rbf",
        " <current-fee-sats> <vsize> <balance-sats> <target-sat/vB>")
{
    if (argc != 4)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    BumpRequest request = {};
    request.method = BumpMethod::rbf;
    SC_CHECK(argUint(request.currentFeeSats, argv[0], "fee"));
    SC_CHECK(argNumber(request.vsize, argv[1], "vsize"));
    SC_CHECK(argUint(request.availableBalanceSats, argv[2], "balance"));
    SC_CHECK(argNumber(request.targetFeeRate, argv[3], "fee rate"));

    FeeBumpResult result;
    SC_CHECK(feeBumpCalculate(result, request));
    printResult(result);
    SC_CHECK(feeBumpRequireAffordable(result));

    return Status();
}

COMMAND(InitLevel::none, BumpCpfp, "bump-cpfp",
        " <current-sat/vB> <parent-output-sats> <balance-sats> <target-sat/vB>")
{
    if (argc != 4)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    BumpRequest request = {};
    request.method = BumpMethod::cpfp;
    SC_CHECK(argNumber(request.currentFeeRate, argv[0], "current rate"));
    SC_CHECK(argUint(request.cpfpParentOutputSats, argv[1], "parent output"));
    SC_CHECK(argUint(request.availableBalanceSats, argv[2], "balance"));
    SC_CHECK(argNumber(request.targetFeeRate, argv[3], "fee rate"));

    FeeBumpResult result;
    SC_CHECK(feeBumpCalculate(result, request));
    printResult(result);
    SC_CHECK(feeBumpRequireAffordable(result));

    return Status();
}
