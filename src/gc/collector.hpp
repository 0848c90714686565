/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_GC_COLLECTOR_HPP_
#define IMGENC_GC_COLLECTOR_HPP_

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <config/config.hpp>
#include <content/itf/store.hpp>
#include <images/itf/imagestore.hpp>
#include <leases/itf/leasemanager.hpp>

#include "itf/scheduler.hpp"

namespace imgenc::gc {

/**
 * Collection statistics.
 */
struct Stats {
    size_t mMarked {};
    size_t mRemoved {};
};

/**
 * Mark and sweep garbage collector of the content store.
 *
 * Roots are image targets and resources of active leases. Blobs reachable from roots through reference labels are
 * kept, all other blobs are removed.
 */
class Collector : public SchedulerItf {
public:
    /**
     * Initializes collector.
     *
     * @param config collector config.
     * @param contentStore content store.
     * @param leaseManager lease manager.
     * @param imageStore image store.
     * @return Error.
     */
    Error Init(const config::GC& config, content::StoreItf& contentStore, leases::ManagerItf& leaseManager,
        images::StoreItf& imageStore);

    /**
     * Starts background collection thread.
     *
     * @return Error.
     */
    Error Start();

    /**
     * Stops background collection thread.
     *
     * @return Error.
     */
    Error Stop();

    /**
     * Requests collection without waiting for it.
     */
    void Schedule() override;

    /**
     * Requests collection and waits until it is finished.
     *
     * @return Error.
     */
    Error ScheduleAndWait() override;

    /**
     * Performs collection in the caller thread.
     *
     * @return RetWithError<Stats>.
     */
    RetWithError<Stats> Collect();

private:
    void                                Run();
    RetWithError<std::set<std::string>> Mark();
    RetWithError<size_t>                Sweep(const std::set<std::string>& marked, const Time& markStart);

    config::GC          mConfig;
    content::StoreItf*  mContentStore {};
    leases::ManagerItf* mLeaseManager {};
    images::StoreItf*   mImageStore {};

    std::mutex              mCollectMutex;
    std::mutex              mMutex;
    std::condition_variable mCondVar;
    std::thread             mThread;
    bool                    mIsRunning {};
    uint64_t                mRequested {};
    uint64_t                mCompleted {};
    Error                   mLastError;
};

} // namespace imgenc::gc

#endif
