/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sendcore/Config.hpp"
#include "../sendcore/spend/DraftStore.hpp"
#include "../sendcore/util/Data.hpp"
#include "../sendcore/util/FileIO.hpp"
#include <catch.hpp>

TEST_CASE("Draft store round trip", "[spend][store]")
{
    const std::string path = "/tmp/sendcore-test/draft.json";
    sendcore::JsonDraftStore store(path);
    REQUIRE(store.clear());

    sendcore::SendDraft draft;
    sendcore::Status s = store.load(draft);
    REQUIRE(SC_CC_FileDoesNotExist == s.value());

    draft.mode = sendcore::DraftMode::multi;
    draft.rows.resize(3);
    draft.rows[0] = {"1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", "0.001"};
    draft.rows[1] = {"not yet", ""};
    draft.unit = sendcore::AmountUnit::btc;
    draft.feeRate = 12.5;
    draft.coinSelection = {"aa:0", "bb:1"};
    draft.label = "Rent \"March\"";
    REQUIRE(store.save(draft));
    REQUIRE(sendcore::fileExists(path));

    sendcore::SendDraft loaded;
    REQUIRE(store.load(loaded));
    REQUIRE(sendcore::DraftMode::multi == loaded.mode);
    REQUIRE(3 == loaded.rows.size());
    REQUIRE(loaded.rows[0].address == draft.rows[0].address);
    REQUIRE(loaded.rows[0].amount == "0.001");
    REQUIRE(loaded.rows[1].address == "not yet");
    REQUIRE(loaded.rows[2].address.empty());
    REQUIRE(sendcore::AmountUnit::btc == loaded.unit);
    REQUIRE(12.5 == loaded.feeRate);
    REQUIRE(draft.coinSelection == loaded.coinSelection);
    REQUIRE_FALSE(loaded.isMaxSend);
    REQUIRE(loaded.label == draft.label);

    REQUIRE(store.clear());
    REQUIRE_FALSE(sendcore::fileExists(path));
    REQUIRE(SC_CC_FileDoesNotExist == store.load(loaded).value());
}

TEST_CASE("Draft store repairs", "[spend][store]")
{
    const std::string path = "/tmp/sendcore-test/repair.json";
    sendcore::JsonDraftStore store(path);
    sendcore::SendDraft draft;

    SECTION("missing rows")
    {
        REQUIRE(sendcore::fileSave(std::string("{\"mode\": \"multi\"}"), path));
        REQUIRE(store.load(draft));
        REQUIRE(2 == draft.rows.size());
        REQUIRE(1.0 == draft.feeRate);
    }
    SECTION("extra rows in single mode")
    {
        REQUIRE(sendcore::fileSave(std::string(
            "{\"rows\": [{\"address\": \"a\"}, {\"address\": \"b\"}]}"), path));
        REQUIRE(store.load(draft));
        REQUIRE(1 == draft.rows.size());
        REQUIRE(draft.rows[0].address == "a");
    }
    SECTION("bad unit")
    {
        REQUIRE(sendcore::fileSave(std::string("{\"unit\": \"mBTC\"}"), path));
        REQUIRE_FALSE(store.load(draft));
    }
    SECTION("not json")
    {
        REQUIRE(sendcore::fileSave(std::string("{rows"), path));
        REQUIRE(SC_CC_JSONError == store.load(draft).value());
    }

    REQUIRE(store.clear());
}

TEST_CASE("Config defaults and overrides", "[config]")
{
    const std::string path = "/tmp/sendcore-test/sendcore.conf";
    REQUIRE(sendcore::fileDelete(path));

    sendcore::SpendConfig config;
    REQUIRE(sendcore::configLoad(config, path));
    REQUIRE(1.0 == config.minFeeRate);
    REQUIRE(150 == config.debounceMs);
    REQUIRE_FALSE(config.watchOnly);

    config.debounceMs = 300;
    config.watchOnly = true;
    config.draftPath = "/tmp/sendcore-test/draft.json";
    REQUIRE(sendcore::configSave(config, path));

    sendcore::SpendConfig loaded;
    REQUIRE(sendcore::configLoad(loaded, path));
    REQUIRE(300 == loaded.debounceMs);
    REQUIRE(loaded.watchOnly);
    REQUIRE(loaded.draftPath == config.draftPath);
    REQUIRE(546 == loaded.dustLimit);

    REQUIRE(sendcore::fileSave(std::string("{\"minFeeRate\": -1}"), path));
    REQUIRE_FALSE(sendcore::configLoad(loaded, path));

    REQUIRE(sendcore::fileDelete(path));
}
