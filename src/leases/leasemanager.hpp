/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_LEASES_LEASEMANAGER_HPP_
#define IMGENC_LEASES_LEASEMANAGER_HPP_

#include <map>
#include <mutex>
#include <set>

#include <gc/itf/scheduler.hpp>

#include "itf/leasemanager.hpp"

namespace imgenc::leases {

/**
 * In-memory lease manager.
 */
class Manager : public ManagerItf {
public:
    /**
     * Initializes lease manager.
     *
     * @param scheduler garbage collection scheduler.
     * @return Error.
     */
    Error Init(gc::SchedulerItf& scheduler);

    /**
     * Creates lease.
     *
     * @param opts create options.
     * @return RetWithError<Lease>.
     */
    RetWithError<Lease> Create(const std::vector<CreateOpt>& opts) override;

    /**
     * Deletes lease.
     *
     * @param lease lease.
     * @param opts delete options.
     * @return Error.
     */
    Error Delete(const Lease& lease, const std::vector<DeleteOpt>& opts = {}) override;

    /**
     * Lists active leases.
     *
     * @return RetWithError<std::vector<Lease>>.
     */
    RetWithError<std::vector<Lease>> List() override;

    /**
     * Adds resource to lease.
     *
     * @param lease lease.
     * @param resource resource.
     * @return Error.
     */
    Error AddResource(const Lease& lease, const Resource& resource) override;

    /**
     * Deletes resource from lease.
     *
     * @param lease lease.
     * @param resource resource.
     * @return Error.
     */
    Error DeleteResource(const Lease& lease, const Resource& resource) override;

    /**
     * Lists lease resources.
     *
     * @param lease lease.
     * @return RetWithError<std::vector<Resource>>.
     */
    RetWithError<std::vector<Resource>> ListResources(const Lease& lease) override;

private:
    struct LeaseEntry {
        Lease              mLease;
        std::set<Resource> mResources;
    };

    gc::SchedulerItf*                 mScheduler {};
    std::mutex                        mMutex;
    std::map<std::string, LeaseEntry> mLeases;
};

} // namespace imgenc::leases

#endif
