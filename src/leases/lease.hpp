/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_LEASES_LEASE_HPP_
#define IMGENC_LEASES_LEASE_HPP_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include <common/utils/error.hpp>
#include <common/utils/time.hpp>

namespace imgenc::leases {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Lease labels.
 */
using Labels = std::map<std::string, std::string>;

/**
 * Lease.
 */
struct Lease {
    std::string mID;
    Time        mCreatedAt {};
    Labels      mLabels;

    /**
     * Compares leases.
     *
     * @param rhs other lease.
     * @return bool.
     */
    bool operator==(const Lease& rhs) const { return mID == rhs.mID; }

    /**
     * Compares leases.
     *
     * @param rhs other lease.
     * @return bool.
     */
    bool operator!=(const Lease& rhs) const { return !(*this == rhs); }
};

/**
 * Resource protected by lease.
 */
struct Resource {
    std::string mID;
    std::string mType;

    bool operator==(const Resource& rhs) const { return mID == rhs.mID && mType == rhs.mType; }
    bool operator!=(const Resource& rhs) const { return !(*this == rhs); }
    bool operator<(const Resource& rhs) const { return std::tie(mType, mID) < std::tie(rhs.mType, rhs.mID); }
};

/**
 * Lease delete options.
 */
struct DeleteOptions {
    bool mSynchronous = false;
};

/**
 * Lease create option.
 */
using CreateOpt = std::function<Error(Lease& lease)>;

/**
 * Lease delete option.
 */
using DeleteOpt = std::function<void(DeleteOptions& options)>;

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Sets random lease ID.
 *
 * @return CreateOpt.
 */
CreateOpt WithRandomID();

/**
 * Sets lease ID.
 *
 * @param id lease ID.
 * @return CreateOpt.
 */
CreateOpt WithID(const std::string& id);

/**
 * Sets lease expiration relative to now.
 *
 * @param expiration expiration duration.
 * @return CreateOpt.
 */
CreateOpt WithExpiration(Duration expiration);

/**
 * Adds lease labels.
 *
 * @param labels labels.
 * @return CreateOpt.
 */
CreateOpt WithLabels(const Labels& labels);

/**
 * Makes lease deletion wait for garbage collection.
 *
 * @return DeleteOpt.
 */
DeleteOpt SynchronousDelete();

/**
 * Returns lease expiration time if set.
 *
 * @param lease lease.
 * @return RetWithError<std::optional<Time>>.
 */
RetWithError<std::optional<Time>> GetExpiration(const Lease& lease);

/**
 * Checks if lease is expired.
 *
 * @param lease lease.
 * @param now current time.
 * @return bool.
 */
bool IsExpired(const Lease& lease, const Time& now);

} // namespace imgenc::leases

#endif
