/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <deque>

#include <common/logger/logmodule.hpp>

#include "collector.hpp"
#include "labels.hpp"

namespace imgenc::gc {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Collector::Init(const config::GC& config, content::StoreItf& contentStore, leases::ManagerItf& leaseManager,
    images::StoreItf& imageStore)
{
    LOG_DBG() << "Init garbage collector" << Log::Field("enabled", config.mEnabled);

    mConfig       = config;
    mContentStore = &contentStore;
    mLeaseManager = &leaseManager;
    mImageStore   = &imageStore;

    return ErrorEnum::eNone;
}

Error Collector::Start()
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Start garbage collector";

    if (mIsRunning) {
        return ErrorEnum::eWrongState;
    }

    if (!mConfig.mEnabled) {
        return ErrorEnum::eNone;
    }

    mIsRunning = true;
    mThread    = std::thread(&Collector::Run, this);

    return ErrorEnum::eNone;
}

Error Collector::Stop()
{
    {
        std::lock_guard lock {mMutex};

        LOG_DBG() << "Stop garbage collector";

        if (!mIsRunning) {
            return ErrorEnum::eWrongState;
        }

        mIsRunning = false;
        mCondVar.notify_all();
    }

    if (mThread.joinable()) {
        mThread.join();
    }

    return ErrorEnum::eNone;
}

void Collector::Schedule()
{
    std::lock_guard lock {mMutex};

    if (!mIsRunning) {
        return;
    }

    mRequested++;
    mCondVar.notify_all();
}

Error Collector::ScheduleAndWait()
{
    if (!mConfig.mEnabled) {
        return ErrorEnum::eNone;
    }

    std::unique_lock lock {mMutex};

    if (!mIsRunning) {
        lock.unlock();

        return Collect().mError;
    }

    auto request = ++mRequested;

    mCondVar.notify_all();
    mCondVar.wait(lock, [this, request] { return !mIsRunning || mCompleted >= request; });

    if (mCompleted < request) {
        return Error(ErrorEnum::eWrongState, "garbage collector stopped");
    }

    return mLastError;
}

RetWithError<Stats> Collector::Collect()
{
    std::lock_guard lock {mCollectMutex};

    if (!mContentStore || !mLeaseManager || !mImageStore) {
        return {Stats(), Error(ErrorEnum::eWrongState, "garbage collector is not initialized")};
    }

    LOG_DBG() << "Collect garbage";

    Stats stats;
    auto  start = common::utils::Now();

    auto [marked, err] = Mark();
    if (!err.IsNone()) {
        return {Stats(), err};
    }

    stats.mMarked = marked.size();

    Tie(stats.mRemoved, err) = Sweep(marked, start);
    if (!err.IsNone()) {
        return {stats, err};
    }

    LOG_DBG() << "Garbage collected" << Log::Field("marked", stats.mMarked) << Log::Field("removed", stats.mRemoved);

    return stats;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Collector::Run()
{
    std::unique_lock lock {mMutex};

    while (mIsRunning) {
        auto hasWork = [this] { return !mIsRunning || mRequested > mCompleted; };

        if (mConfig.mCollectPeriod > Duration::zero()) {
            mCondVar.wait_for(lock, mConfig.mCollectPeriod, hasWork);
        } else {
            mCondVar.wait(lock, hasWork);
        }

        if (!mIsRunning) {
            break;
        }

        auto request = mRequested;

        lock.unlock();

        auto [stats, err] = Collect();
        if (!err.IsNone()) {
            LOG_ERR() << "Garbage collection failed" << Log::Field(err);
        }

        lock.lock();

        mCompleted = request;
        mLastError = err;

        mCondVar.notify_all();
    }
}

RetWithError<std::set<std::string>> Collector::Mark()
{
    std::set<std::string>   marked;
    std::deque<std::string> pending;

    auto [images, err] = mImageStore->List();
    if (!err.IsNone()) {
        return {marked, AOS_ERROR_WRAP(err)};
    }

    for (const auto& image : images) {
        pending.push_back(image.mTarget.mDigest);
    }

    std::vector<leases::Lease> activeLeases;

    Tie(activeLeases, err) = mLeaseManager->List();
    if (!err.IsNone()) {
        return {marked, AOS_ERROR_WRAP(err)};
    }

    for (const auto& lease : activeLeases) {
        std::vector<leases::Resource> resources;

        Tie(resources, err) = mLeaseManager->ListResources(lease);
        if (err.Is(ErrorEnum::eNotFound)) {
            continue;
        }

        if (!err.IsNone()) {
            return {marked, AOS_ERROR_WRAP(err)};
        }

        for (const auto& resource : resources) {
            if (resource.mType == cResourceContent) {
                pending.push_back(resource.mID);
            }
        }
    }

    while (!pending.empty()) {
        auto digest = std::move(pending.front());

        pending.pop_front();

        if (!marked.insert(digest).second) {
            continue;
        }

        content::Info info;

        Tie(info, err) = mContentStore->GetInfo(digest);
        if (err.Is(ErrorEnum::eNotFound)) {
            continue;
        }

        if (!err.IsNone()) {
            return {marked, AOS_ERROR_WRAP(err)};
        }

        for (const auto& [label, value] : info.mLabels) {
            if (IsRefLabel(label)) {
                pending.push_back(value);
            }
        }
    }

    return marked;
}

RetWithError<size_t> Collector::Sweep(const std::set<std::string>& marked, const Time& markStart)
{
    size_t removed = 0;

    auto err = mContentStore->Walk([&](const content::Info& info) -> Error {
        // Blobs touched during collection may be referenced by roots created after marking.
        if (marked.count(info.mDigest) != 0 || info.mUpdatedAt >= markStart) {
            return ErrorEnum::eNone;
        }

        LOG_DBG() << "Remove unreferenced blob" << Log::Field("digest", info.mDigest.c_str());

        if (auto deleteErr = mContentStore->Delete(info.mDigest);
            !deleteErr.IsNone() && !deleteErr.Is(ErrorEnum::eNotFound)) {
            return AOS_ERROR_WRAP(deleteErr);
        }

        removed++;

        return ErrorEnum::eNone;
    });
    if (!err.IsNone()) {
        return {removed, err};
    }

    return removed;
}

} // namespace imgenc::gc
