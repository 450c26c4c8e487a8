/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FeeBump.hpp"
#include "../util/Debug.hpp"
#include <math.h>
#include <stdint.h>

namespace sendcore {

/**
 * Scales a value to a whole number, rounding up.
 * Products within a hair of a whole number are float noise, not fractions.
 */
static uint64_t
scaleUp(double value, double scale)
{
    const double scaled = value * scale;
    const double nearest = nearbyint(scaled);
    if (fabs(scaled - nearest) <= 1e-9 * (1 + scaled))
        return static_cast<uint64_t>(nearest);
    return static_cast<uint64_t>(ceil(scaled));
}

uint64_t
feeForSize(double rate, double vsize)
{
    if (rate <= 0 || vsize <= 0)
        return 0;

    // Fixed point: micro-satoshis per vbyte times milli-vbytes:
    const uint64_t rateMicro = scaleUp(rate, 1e6);
    const uint64_t sizeMilli = scaleUp(vsize, 1e3);
    const uint64_t denominator = 1000000000;
    if (sizeMilli && UINT64_MAX / sizeMilli < rateMicro)
        return scaleUp(rate * vsize, 1);
    return (rateMicro * sizeMilli + denominator - 1) / denominator;
}

/**
 * Rounds a rate up to a whole sat/vB.
 */
static uint64_t
ceilRate(double rate)
{
    return (scaleUp(rate, 1e6) + 999999) / 1000000;
}

double
feeBumpCurrentRate(const BumpRequest &request)
{
    if (0 < request.currentFeeRate)
        return request.currentFeeRate;
    if (0 < request.vsize && request.currentFeeSats)
        return request.currentFeeSats / request.vsize;
    return 0;
}

Status
feeBumpCalculate(FeeBumpResult &result, const BumpRequest &request)
{
    if (!(MIN_RELAY_FEE_RATE <= request.targetFeeRate))
        return SC_ERROR(SC_CC_FeeRateBelowMinimum,
                        "Fee rate is below the relay minimum");

    const double currentRate = feeBumpCurrentRate(request);
    if (request.targetFeeRate <= currentRate)
        return SC_ERROR(SC_CC_FeeBumpNotHigherThanCurrent,
                        "Fee rate must be higher than the current rate");

    FeeBumpResult out = {};
    switch (request.method)
    {
    case BumpMethod::rbf:
        out.fundsAvailableSats = request.availableBalanceSats;
        if (0 < request.vsize && request.currentFeeSats)
        {
            out.newTotalFeeSats = feeForSize(request.targetFeeRate, request.vsize);
            out.hasAdditionalCost = true;
            out.additionalCostSats =
                out.newTotalFeeSats <= request.currentFeeSats ? 0 :
                out.newTotalFeeSats - request.currentFeeSats;
            out.requiredSats = out.additionalCostSats;
            out.affordable =
                out.additionalCostSats <= request.availableBalanceSats;
        }
        else
        {
            // Without a size the wallet engine has the final word:
            out.affordable = true;
        }
        break;

    case BumpMethod::cpfp:
        // The child pays for its own bytes at a whole-number rate:
        out.hasAdditionalCost = true;
        out.additionalCostSats = ceilRate(request.targetFeeRate) *
            static_cast<uint64_t>(CPFP_CHILD_VBYTES);
        out.fundsAvailableSats =
            request.cpfpParentOutputSats + request.availableBalanceSats;
        out.requiredSats = out.additionalCostSats + FEE_BUMP_DUST_LIMIT;
        out.affordable = out.requiredSats <= out.fundsAvailableSats;
        out.willConsolidate =
            !(out.requiredSats < request.cpfpParentOutputSats);
        break;
    }

    SC_DebugLog("Fee bump %s to %.3f sat/vB: cost %llu, funds %llu, %s",
        BumpMethod::rbf == request.method ? "RBF" : "CPFP",
        request.targetFeeRate,
        static_cast<unsigned long long>(out.additionalCostSats),
        static_cast<unsigned long long>(out.fundsAvailableSats),
        out.affordable ? "affordable" : "unaffordable");

    result = out;
    return Status();
}

Status
feeBumpRequireAffordable(const FeeBumpResult &result)
{
    if (!result.affordable)
        return SC_ERROR(SC_CC_FeeBumpInsufficientFunds,
                        "Insufficient funds for this fee rate");
    return Status();
}

} // namespace sendcore
