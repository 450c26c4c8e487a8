/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_SPEND_DRAFT_STORE_HPP
#define SENDCORE_SPEND_DRAFT_STORE_HPP

#include "Draft.hpp"

namespace sendcore {

/**
 * Keeps the draft across restarts.
 */
class DraftStore
{
public:
    virtual ~DraftStore();

    /**
     * Loads the saved draft.
     * Fails with SC_CC_FileDoesNotExist if there is none.
     */
    virtual Status
    load(SendDraft &result) = 0;

    virtual Status
    save(const SendDraft &draft) = 0;

    /**
     * Forgets the saved draft. Clearing an empty store is fine.
     */
    virtual Status
    clear() = 0;
};

/**
 * Stores the draft as a JSON file.
 */
class JsonDraftStore:
    public DraftStore
{
public:
    explicit JsonDraftStore(const std::string &path);

    Status
    load(SendDraft &result) override;

    Status
    save(const SendDraft &draft) override;

    Status
    clear() override;

private:
    const std::string path_;
};

} // namespace sendcore

#endif
