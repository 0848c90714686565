/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "leasemanager.hpp"

namespace imgenc::leases {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Manager::Init(gc::SchedulerItf& scheduler)
{
    LOG_DBG() << "Init lease manager";

    mScheduler = &scheduler;

    return ErrorEnum::eNone;
}

RetWithError<Lease> Manager::Create(const std::vector<CreateOpt>& opts)
{
    Lease lease;

    lease.mCreatedAt = std::chrono::system_clock::now();

    for (const auto& opt : opts) {
        if (auto err = opt(lease); !err.IsNone()) {
            return {Lease(), err};
        }
    }

    if (lease.mID.empty()) {
        return {Lease(), Error(ErrorEnum::eInvalidArgument, "lease ID is not set")};
    }

    std::lock_guard lock {mMutex};

    if (mLeases.count(lease.mID) != 0) {
        return {Lease(), Error(ErrorEnum::eAlreadyExist, ("lease " + lease.mID + " already exists").c_str())};
    }

    mLeases.emplace(lease.mID, LeaseEntry {lease, {}});

    LOG_DBG() << "Lease created" << Log::Field("lease", lease.mID.c_str());

    return lease;
}

Error Manager::Delete(const Lease& lease, const std::vector<DeleteOpt>& opts)
{
    DeleteOptions options;

    for (const auto& opt : opts) {
        opt(options);
    }

    {
        std::lock_guard lock {mMutex};

        if (mLeases.erase(lease.mID) == 0) {
            return Error(ErrorEnum::eNotFound, ("lease " + lease.mID + " not found").c_str());
        }
    }

    LOG_DBG() << "Lease deleted" << Log::Field("lease", lease.mID.c_str()) << Log::Field("sync", options.mSynchronous);

    if (!mScheduler) {
        return ErrorEnum::eNone;
    }

    if (options.mSynchronous) {
        if (auto err = mScheduler->ScheduleAndWait(); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        return ErrorEnum::eNone;
    }

    mScheduler->Schedule();

    return ErrorEnum::eNone;
}

RetWithError<std::vector<Lease>> Manager::List()
{
    std::lock_guard lock {mMutex};

    std::vector<Lease> leases;
    auto               now = std::chrono::system_clock::now();

    for (auto it = mLeases.begin(); it != mLeases.end();) {
        if (IsExpired(it->second.mLease, now)) {
            LOG_DBG() << "Lease expired" << Log::Field("lease", it->first.c_str());

            it = mLeases.erase(it);

            continue;
        }

        leases.push_back(it->second.mLease);
        ++it;
    }

    return leases;
}

Error Manager::AddResource(const Lease& lease, const Resource& resource)
{
    std::lock_guard lock {mMutex};

    auto it = mLeases.find(lease.mID);
    if (it == mLeases.end()) {
        return Error(ErrorEnum::eNotFound, ("lease " + lease.mID + " not found").c_str());
    }

    if (IsExpired(it->second.mLease, std::chrono::system_clock::now())) {
        return Error(ErrorEnum::eFailed, ("lease " + lease.mID + " expired").c_str());
    }

    it->second.mResources.insert(resource);

    return ErrorEnum::eNone;
}

Error Manager::DeleteResource(const Lease& lease, const Resource& resource)
{
    std::lock_guard lock {mMutex};

    auto it = mLeases.find(lease.mID);
    if (it == mLeases.end()) {
        return Error(ErrorEnum::eNotFound, ("lease " + lease.mID + " not found").c_str());
    }

    it->second.mResources.erase(resource);

    return ErrorEnum::eNone;
}

RetWithError<std::vector<Resource>> Manager::ListResources(const Lease& lease)
{
    std::lock_guard lock {mMutex};

    auto it = mLeases.find(lease.mID);
    if (it == mLeases.end()) {
        return {std::vector<Resource>(), Error(ErrorEnum::eNotFound, ("lease " + lease.mID + " not found").c_str())};
    }

    return std::vector<Resource>(it->second.mResources.begin(), it->second.mResources.end());
}

} // namespace imgenc::leases
