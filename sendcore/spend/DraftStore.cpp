/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "DraftStore.hpp"
#include "../json/JsonArray.hpp"
#include "../json/JsonObject.hpp"
#include "../util/Debug.hpp"
#include "../util/FileIO.hpp"

namespace sendcore {

struct RowJson:
    public JsonObject
{
    SC_JSON_CONSTRUCTORS(RowJson, JsonObject)
    SC_JSON_STRING(address, "address", "")
    SC_JSON_STRING(amount, "amount", "")
};

struct DraftJson:
    public JsonObject
{
    SC_JSON_CONSTRUCTORS(DraftJson, JsonObject)
    SC_JSON_STRING(mode, "mode", "single")
    SC_JSON_ARRAY(rows, "rows")
    SC_JSON_STRING(unit, "unit", "sats")
    SC_JSON_NUMBER(feeRate, "feeRate", 1.0)
    SC_JSON_ARRAY(coins, "coins")
    SC_JSON_BOOLEAN(maxSend, "maxSend", false)
    SC_JSON_STRING(label, "label", "")
};

DraftStore::~DraftStore()
{
}

JsonDraftStore::JsonDraftStore(const std::string &path):
    path_(path)
{
}

Status
JsonDraftStore::load(SendDraft &result)
{
    if (!fileExists(path_))
        return SC_ERROR(SC_CC_FileDoesNotExist, "No saved draft");

    DraftJson json;
    SC_CHECK(json.load(path_));

    SendDraft out;
    const std::string mode = json.mode();
    if ("multi" == mode)
        out.mode = DraftMode::multi;
    else if ("single" != mode)
        return SC_ERROR(SC_CC_JSONError, "Bad draft mode " + mode);

    out.rows.clear();
    auto rows = json.rows();
    for (size_t i = 0; i < rows.size(); ++i)
    {
        RowJson row(rows[i]);
        out.rows.push_back(RecipientRow{row.address(), row.amount()});
    }

    // Repair the row count if the file was edited by hand:
    const size_t minRows = DraftMode::multi == out.mode ? 2 : 1;
    if (out.rows.size() < minRows)
        out.rows.resize(minRows);
    if (DraftMode::single == out.mode)
        out.rows.resize(1);

    SC_CHECK(amountUnitFromName(out.unit, json.unit()));
    out.feeRate = json.feeRate();

    auto coins = json.coins();
    for (size_t i = 0; i < coins.size(); ++i)
    {
        std::string coin;
        SC_CHECK(coins.stringAt(coin, i));
        out.coinSelection.insert(coin);
    }

    out.isMaxSend = json.maxSend();
    out.label = json.label();

    result = std::move(out);
    return Status();
}

Status
JsonDraftStore::save(const SendDraft &draft)
{
    JsonArray rows;
    for (const auto &row: draft.rows)
    {
        RowJson rowJson;
        SC_CHECK(rowJson.addressSet(row.address));
        SC_CHECK(rowJson.amountSet(row.amount));
        SC_CHECK(rows.append(rowJson));
    }

    JsonArray coins;
    for (const auto &outpoint: draft.coinSelection)
        SC_CHECK(coins.appendString(outpoint));

    DraftJson json;
    SC_CHECK(json.modeSet(DraftMode::multi == draft.mode ? "multi" : "single"));
    SC_CHECK(json.rowsSet(rows));
    SC_CHECK(json.unitSet(amountUnitName(draft.unit)));
    SC_CHECK(json.feeRateSet(draft.feeRate));
    SC_CHECK(json.coinsSet(coins));
    SC_CHECK(json.maxSendSet(draft.isMaxSend));
    SC_CHECK(json.labelSet(draft.label));

    SC_CHECK(json.save(path_));
    return Status();
}

Status
JsonDraftStore::clear()
{
    SC_CHECK(fileDelete(path_));
    return Status();
}

} // namespace sendcore
