/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_LEASES_ITF_LEASEMANAGER_HPP_
#define IMGENC_LEASES_ITF_LEASEMANAGER_HPP_

#include <vector>

#include <leases/lease.hpp>

namespace imgenc::leases {

/**
 * Lease manager interface.
 */
class ManagerItf {
public:
    /**
     * Destructor.
     */
    virtual ~ManagerItf() = default;

    /**
     * Creates lease.
     *
     * @param opts create options.
     * @return RetWithError<Lease>.
     */
    virtual RetWithError<Lease> Create(const std::vector<CreateOpt>& opts) = 0;

    /**
     * Deletes lease.
     *
     * @param lease lease.
     * @param opts delete options.
     * @return Error.
     */
    virtual Error Delete(const Lease& lease, const std::vector<DeleteOpt>& opts = {}) = 0;

    /**
     * Lists active leases. Expired leases are not returned and are dropped.
     *
     * @return RetWithError<std::vector<Lease>>.
     */
    virtual RetWithError<std::vector<Lease>> List() = 0;

    /**
     * Adds resource to lease.
     *
     * @param lease lease.
     * @param resource resource.
     * @return Error.
     */
    virtual Error AddResource(const Lease& lease, const Resource& resource) = 0;

    /**
     * Deletes resource from lease.
     *
     * @param lease lease.
     * @param resource resource.
     * @return Error.
     */
    virtual Error DeleteResource(const Lease& lease, const Resource& resource) = 0;

    /**
     * Lists lease resources.
     *
     * @param lease lease.
     * @return RetWithError<std::vector<Resource>>.
     */
    virtual RetWithError<std::vector<Resource>> ListResources(const Lease& lease) = 0;
};

} // namespace imgenc::leases

#endif
