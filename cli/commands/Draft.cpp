/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../sendcore/bitcoin/Address.hpp"
#include "../../sendcore/spend/DraftStore.hpp"
#include <iostream>

using namespace sendcore;

static Status
draftStore(std::unique_ptr<DraftStore> &result, const Session &session)
{
    if (session.config.draftPath.empty())
        return SC_ERROR(SC_CC_Error, "No draftPath in " + session.configPath);
    result.reset(new JsonDraftStore(session.config.draftPath));
    return Status();
}

COMMAND(InitLevel::config, DraftShow, "draft-show",
        "")
{
    if (argc != 0)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    std::unique_ptr<DraftStore> store;
    SC_CHECK(draftStore(store, session));

    SendDraft draft;
    SC_CHECK(store->load(draft));

    std::cout << (DraftMode::multi == draft.mode ? "Multi" : "Single") <<
              " recipient draft at " << draft.feeRate << " sat/vB" <<
              (draft.isMaxSend ? ", sending max" : "") << std::endl;
    for (const auto &row: draft.rows)
    {
        Status s = addressValidate(row.address);
        std::cout << "  " << row.address << " " << row.amount << " " <<
                  amountUnitName(draft.unit) <<
                  (s ? "" : " (" + s.message() + ")") << std::endl;
    }
    for (const auto &outpoint: draft.coinSelection)
        std::cout << "  coin " << outpoint << std::endl;
    if (!draft.label.empty())
        std::cout << "  label " << draft.label << std::endl;

    return Status();
}

COMMAND(InitLevel::config, DraftClear, "draft-clear",
        "")
{
    if (argc != 0)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    std::unique_ptr<DraftStore> store;
    SC_CHECK(draftStore(store, session));
    SC_CHECK(store->clear());

    return Status();
}

COMMAND(InitLevel::config, ConfigWrite, "config-write",
        "")
{
    if (argc != 0)
        return SC_ERROR(SC_CC_Error, helpString(*this));

    SC_CHECK(configSave(session.config, session.configPath));
    std::cout << "Wrote " << session.configPath << std::endl;

    return Status();
}
