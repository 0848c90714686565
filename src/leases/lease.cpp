/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/UUIDGenerator.h>

#include <common/logger/logmodule.hpp>
#include <gc/labels.hpp>

#include "lease.hpp"

namespace imgenc::leases {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

CreateOpt WithRandomID()
{
    return [](Lease& lease) {
        lease.mID = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();

        return ErrorEnum::eNone;
    };
}

CreateOpt WithID(const std::string& id)
{
    return [id](Lease& lease) -> Error {
        if (id.empty()) {
            return Error(ErrorEnum::eInvalidArgument, "empty lease ID");
        }

        lease.mID = id;

        return ErrorEnum::eNone;
    };
}

CreateOpt WithExpiration(Duration expiration)
{
    return [expiration](Lease& lease) -> Error {
        using SystemDuration = std::chrono::system_clock::duration;

        auto expireAt = std::chrono::system_clock::now() + std::chrono::duration_cast<SystemDuration>(expiration);

        auto [expire, err] = common::utils::ToUTCString(expireAt);
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        lease.mLabels[gc::cLabelExpire] = expire;

        return ErrorEnum::eNone;
    };
}

CreateOpt WithLabels(const Labels& labels)
{
    return [labels](Lease& lease) {
        for (const auto& [key, value] : labels) {
            lease.mLabels[key] = value;
        }

        return ErrorEnum::eNone;
    };
}

DeleteOpt SynchronousDelete()
{
    return [](DeleteOptions& options) { options.mSynchronous = true; };
}

RetWithError<std::optional<Time>> GetExpiration(const Lease& lease)
{
    auto it = lease.mLabels.find(gc::cLabelExpire);
    if (it == lease.mLabels.end()) {
        return std::optional<Time>();
    }

    auto [expire, err] = common::utils::FromUTCString(it->second);
    if (!err.IsNone()) {
        return {std::optional<Time>(), AOS_ERROR_WRAP(err)};
    }

    return std::optional<Time>(expire);
}

bool IsExpired(const Lease& lease, const Time& now)
{
    auto [expire, err] = GetExpiration(lease);
    if (!err.IsNone()) {
        LOG_WRN() << "Invalid lease expiration" << Log::Field("lease", lease.mID.c_str()) << Log::Field(err);

        return false;
    }

    return expire.has_value() && *expire <= now;
}

} // namespace imgenc::leases
