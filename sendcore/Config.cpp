/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Config.hpp"
#include "json/JsonObject.hpp"
#include "util/Debug.hpp"
#include "util/FileIO.hpp"

namespace sendcore {

struct SpendConfigJson:
    public JsonObject
{
    SC_JSON_CONSTRUCTORS(SpendConfigJson, JsonObject)
    SC_JSON_NUMBER(minFeeRate, "minFeeRate", 1.0)
    SC_JSON_INTEGER(dustLimit, "dustLimit", 546)
    SC_JSON_INTEGER(debounceMs, "debounceMs", 150)
    SC_JSON_NUMBER(maxSendVbytes, "maxSendVbytes", 150)
    SC_JSON_BOOLEAN(spendUnconfirmed, "spendUnconfirmed", false)
    SC_JSON_BOOLEAN(watchOnly, "watchOnly", false)
    SC_JSON_STRING(draftPath, "draftPath", "")
    SC_JSON_STRING(logPath, "logPath", "")
};

Status
configLoad(SpendConfig &result, const std::string &path)
{
    SpendConfigJson json;
    if (fileExists(path))
        SC_CHECK(json.load(path));
    else
        SC_DebugLog("No config at %s, using defaults", path.c_str());

    SpendConfig out;
    out.minFeeRate = json.minFeeRate();
    out.dustLimit = json.dustLimit();
    out.debounceMs = json.debounceMs();
    out.maxSendVbytes = json.maxSendVbytes();
    out.spendUnconfirmed = json.spendUnconfirmed();
    out.watchOnly = json.watchOnly();
    out.draftPath = json.draftPath();
    out.logPath = json.logPath();

    if (out.minFeeRate <= 0 || out.maxSendVbytes <= 0 ||
        json.dustLimit() < 0 || json.debounceMs() < 0)
        return SC_ERROR(SC_CC_JSONError, "Negative or zero limit in " + path);

    result = out;
    return Status();
}

Status
configSave(const SpendConfig &config, const std::string &path)
{
    SpendConfigJson json;
    SC_CHECK(json.minFeeRateSet(config.minFeeRate));
    SC_CHECK(json.dustLimitSet(config.dustLimit));
    SC_CHECK(json.debounceMsSet(config.debounceMs));
    SC_CHECK(json.maxSendVbytesSet(config.maxSendVbytes));
    SC_CHECK(json.spendUnconfirmedSet(config.spendUnconfirmed));
    SC_CHECK(json.watchOnlySet(config.watchOnly));
    SC_CHECK(json.draftPathSet(config.draftPath));
    SC_CHECK(json.logPathSet(config.logPath));

    SC_CHECK(json.save(path));
    return Status();
}

} // namespace sendcore
