/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_LEASES_LEASEGUARD_HPP_
#define IMGENC_LEASES_LEASEGUARD_HPP_

#include <optional>

#include "itf/leasemanager.hpp"

namespace imgenc::leases {

/**
 * Scoped lease holder. Acquired lease is deleted synchronously when the guard goes out of scope unless it was
 * released before.
 */
class LeaseGuard {
public:
    /**
     * Creates lease guard.
     *
     * @param manager lease manager.
     */
    explicit LeaseGuard(ManagerItf& manager);

    /**
     * Releases lease if still held.
     */
    ~LeaseGuard();

    LeaseGuard(const LeaseGuard&)            = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

    /**
     * Creates lease with random ID.
     *
     * @param expiration lease expiration.
     * @param labels lease labels.
     * @return Error.
     */
    Error Acquire(Duration expiration, const Labels& labels = {});

    /**
     * Returns held lease.
     *
     * @return const Lease&.
     */
    const Lease& GetLease() const { return *mLease; }

    /**
     * Checks if lease is held.
     *
     * @return bool.
     */
    bool IsAcquired() const { return mLease.has_value(); }

    /**
     * Deletes held lease.
     *
     * @param synchronous wait for garbage collection.
     * @return Error.
     */
    Error Release(bool synchronous = true);

private:
    ManagerItf&          mManager;
    std::optional<Lease> mLease;
};

} // namespace imgenc::leases

#endif
