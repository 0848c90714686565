/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "leaseguard.hpp"

namespace imgenc::leases {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

LeaseGuard::LeaseGuard(ManagerItf& manager)
    : mManager(manager)
{
}

LeaseGuard::~LeaseGuard()
{
    if (auto err = Release(); !err.IsNone()) {
        LOG_ERR() << "Can't release lease" << Log::Field(err);
    }
}

Error LeaseGuard::Acquire(Duration expiration, const Labels& labels)
{
    if (mLease) {
        return Error(ErrorEnum::eWrongState, "lease already acquired");
    }

    auto [lease, err] = mManager.Create({WithRandomID(), WithExpiration(expiration), WithLabels(labels)});
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    LOG_DBG() << "Lease acquired" << Log::Field("lease", lease.mID.c_str());

    mLease = lease;

    return ErrorEnum::eNone;
}

Error LeaseGuard::Release(bool synchronous)
{
    if (!mLease) {
        return ErrorEnum::eNone;
    }

    auto lease = std::move(*mLease);

    mLease.reset();

    LOG_DBG() << "Release lease" << Log::Field("lease", lease.mID.c_str());

    std::vector<DeleteOpt> opts;

    if (synchronous) {
        opts.push_back(SynchronousDelete());
    }

    if (auto err = mManager.Delete(lease, opts); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::leases
