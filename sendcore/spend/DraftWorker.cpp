/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "DraftWorker.hpp"
#include "DraftController.hpp"
#include "../util/Debug.hpp"
#include <condition_variable>
#include <mutex>

namespace sendcore {

/**
 * Shared with the watcher, which can outlive the worker by a moment.
 */
struct DraftWorker::Signal
{
    std::mutex mutex;
    std::condition_variable wake;
    bool poked = false;
    bool stop = false;

    void
    notify(bool stopping)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            poked = true;
            stop = stop || stopping;
        }
        wake.notify_all();
    }
};

DraftWorker::DraftWorker(DraftController &controller):
    controller_(controller),
    signal_(std::make_shared<Signal>()),
    watchId_(0)
{
    auto signal = signal_;
    watchId_ = controller_.watch([signal](DraftSnapshotPtr)
    {
        signal->notify(false);
    });
    thread_ = std::thread(&DraftWorker::run, this);
}

DraftWorker::~DraftWorker()
{
    controller_.unwatch(watchId_);
    signal_->notify(true);
    thread_.join();
}

void
DraftWorker::run()
{
    SC_DebugLog("Draft worker started");

    auto &signal = *signal_;
    std::unique_lock<std::mutex> lock(signal.mutex);
    while (!signal.stop)
    {
        signal.poked = false;
        lock.unlock();
        const auto sleep = controller_.wakeup();
        lock.lock();

        auto ready = [&signal]{ return signal.stop || signal.poked; };
        if (sleep.count())
            signal.wake.wait_for(lock, sleep, ready);
        else
            signal.wake.wait(lock, ready);
    }

    SC_DebugLog("Draft worker stopped");
}

} // namespace sendcore
