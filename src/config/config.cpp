/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <Poco/JSON/Parser.h>

#include <common/utils/exception.hpp>
#include <common/utils/filesystem.hpp>
#include <common/utils/json.hpp>

#include "config.hpp"

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cDefaultWorkingDir              = "/var/lib/imgenc";
constexpr auto cDefaultContentDir              = "content";
constexpr auto cDefaultLeaseExpiration         = "5m";
constexpr auto cDefaultGCCollectPeriod         = "1m";
constexpr auto cDefaultMaxConcurrentTransforms = 4;
constexpr auto cDefaultLogLevel                = "info";
constexpr auto cDefaultLogBackend              = "stdio";

namespace imgenc::config {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

void ParseGCConfig(const common::utils::CaseInsensitiveObjectWrapper& object, GC& config)
{
    config.mEnabled = object.GetValue<bool>("enabled", true);

    Error err = ErrorEnum::eNone;

    Tie(config.mCollectPeriod, err)
        = common::utils::ParseDuration(object.GetValue<std::string>("collectPeriod", cDefaultGCCollectPeriod));
    IMGENC_ERROR_CHECK_AND_THROW(err, "error parsing collectPeriod tag");
}

void ParseLoggingConfig(const common::utils::CaseInsensitiveObjectWrapper& object, Logging& config)
{
    Error err = ErrorEnum::eNone;

    auto level = object.GetValue<std::string>("level", cDefaultLogLevel);

    err = config.mLevel.FromString(aos::String(level.c_str()));
    IMGENC_ERROR_CHECK_AND_THROW(err, "error parsing logging level tag");

    Tie(config.mBackend, err)
        = common::logger::Logger::ParseBackend(object.GetValue<std::string>("backend", cDefaultLogBackend));
    IMGENC_ERROR_CHECK_AND_THROW(err, "error parsing logging backend tag");
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Error ParseConfig(const std::string& filename, Config& config)
{
    std::ifstream file(filename);

    if (!file.is_open()) {
        return ErrorEnum::eNotFound;
    }

    try {
        Poco::JSON::Parser                          parser;
        auto                                        result = parser.parse(file);
        common::utils::CaseInsensitiveObjectWrapper object(result);

        config.mWorkingDir = object.GetValue<std::string>("workingDir", cDefaultWorkingDir);
        config.mContentDir = object.GetOptionalValue<std::string>("contentDir")
                                 .value_or(common::utils::JoinPath(config.mWorkingDir, cDefaultContentDir));

        Error err = ErrorEnum::eNone;

        Tie(config.mLeaseExpiration, err)
            = common::utils::ParseDuration(object.GetValue<std::string>("leaseExpiration", cDefaultLeaseExpiration));
        IMGENC_ERROR_CHECK_AND_THROW(err, "error parsing leaseExpiration tag");

        auto maxConcurrentTransforms
            = object.GetValue<int64_t>("maxConcurrentTransforms", cDefaultMaxConcurrentTransforms);
        if (maxConcurrentTransforms <= 0) {
            IMGENC_ERROR_THROW(ErrorEnum::eInvalidArgument, "maxConcurrentTransforms should be positive");
        }

        config.mMaxConcurrentTransforms = static_cast<size_t>(maxConcurrentTransforms);

        auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

        ParseGCConfig(object.Has("gc") ? object.GetObject("gc") : empty, config.mGC);
        ParseLoggingConfig(object.Has("logging") ? object.GetObject("logging") : empty, config.mLogging);
    } catch (const std::exception& e) {
        return common::utils::ToError(e);
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::config
