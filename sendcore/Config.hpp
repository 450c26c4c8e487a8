/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Spending policy, loaded from a JSON file.
 *
 * Every setting has a default, so a missing file or key is not an error.
 */

#ifndef SENDCORE_CONFIG_HPP
#define SENDCORE_CONFIG_HPP

#include "util/Status.hpp"
#include <stdint.h>
#include <string>

namespace sendcore {

struct SpendConfig
{
    /** The lowest fee rate a draft may use, in sat/vB. */
    double minFeeRate = 1.0;

    /** Outputs below this are dust. */
    uint64_t dustLimit = 546;

    /** Quiet time after an edit before asking for an estimate. */
    unsigned debounceMs = 150;

    /** Transaction size used for the instant max-send guess. */
    double maxSendVbytes = 150;

    /** Count unconfirmed coins as spendable. */
    bool spendUnconfirmed = false;

    /** The wallet has no keys, so commits produce PSBTs. */
    bool watchOnly = false;

    std::string draftPath;
    std::string logPath;
};

/**
 * Loads the configuration file, falling back on defaults.
 */
Status
configLoad(SpendConfig &result, const std::string &path);

/**
 * Writes the configuration out, for a starting point to edit.
 */
Status
configSave(const SpendConfig &config, const std::string &path);

} // namespace sendcore

#endif
