/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Fee economics for speeding up a stuck transaction.
 */

#ifndef SENDCORE_SPEND_FEE_BUMP_HPP
#define SENDCORE_SPEND_FEE_BUMP_HPP

#include "../util/Status.hpp"
#include <stdint.h>

namespace sendcore {

/**
 * The child transaction size assumed for CPFP estimates.
 */
constexpr double CPFP_CHILD_VBYTES = 150;

/**
 * Change below this many satoshis is not worth creating.
 */
constexpr uint64_t FEE_BUMP_DUST_LIMIT = 546;

/**
 * The lowest fee rate nodes will relay, in sat/vB.
 */
constexpr double MIN_RELAY_FEE_RATE = 1.0;

enum class BumpMethod
{
    rbf,    // Replace the transaction with a higher-fee copy
    cpfp    // Spend one of its outputs with a high-fee child
};

/**
 * Describes a stuck transaction and the desired new fee rate.
 * Zero means unknown for the current fee, rate and size.
 */
struct BumpRequest
{
    BumpMethod method;
    uint64_t currentFeeSats;
    double currentFeeRate;              // sat/vB
    double vsize;                       // vbytes
    uint64_t availableBalanceSats;
    uint64_t cpfpParentOutputSats;      // The output the child will spend
    double targetFeeRate;               // sat/vB
};

struct FeeBumpResult
{
    /** False if the cost cannot be known from the request. */
    bool hasAdditionalCost;
    uint64_t additionalCostSats;

    bool affordable;

    /** CPFP must pull in other wallet coins besides the parent output. */
    bool willConsolidate;

    /** RBF replacement total fee, or zero if unknown. */
    uint64_t newTotalFeeSats;

    /** The funds the bump can draw on. */
    uint64_t fundsAvailableSats;

    /** The funds the bump needs, dust reserve included. */
    uint64_t requiredSats;
};

/**
 * Returns the current effective fee rate of the request,
 * or zero if it cannot be known.
 */
double
feeBumpCurrentRate(const BumpRequest &request);

/**
 * Works out what a fee bump would cost, and whether the wallet can pay.
 * Fails with SC_CC_FeeBumpNotHigherThanCurrent if the target rate
 * does not strictly exceed the current one, or is below the relay minimum.
 */
Status
feeBumpCalculate(FeeBumpResult &result, const BumpRequest &request);

/**
 * Fails with SC_CC_FeeBumpInsufficientFunds for an unaffordable bump.
 */
Status
feeBumpRequireAffordable(const FeeBumpResult &result);

/**
 * Returns ceil(rate * vsize) without floating-point rounding surprises.
 * The rate is taken up to the next 0.000001 sat/vB and the size
 * up to the next 0.001 vB.
 */
uint64_t
feeForSize(double rate, double vsize);

} // namespace sendcore

#endif
