/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_SPEND_DRAFT_WORKER_HPP
#define SENDCORE_SPEND_DRAFT_WORKER_HPP

#include <memory>
#include <thread>

namespace sendcore {

class DraftController;

/**
 * Runs a controller's timed work on a background thread.
 * Every new snapshot wakes the thread, so fresh edits are seen at once.
 * The controller must outlive the worker.
 */
class DraftWorker
{
public:
    explicit DraftWorker(DraftController &controller);
    ~DraftWorker();

    DraftWorker(const DraftWorker &) = delete;
    DraftWorker &operator=(const DraftWorker &) = delete;

private:
    struct Signal;

    DraftController &controller_;
    std::shared_ptr<Signal> signal_;
    size_t watchId_;
    std::thread thread_;

    void
    run();
};

} // namespace sendcore

#endif
