/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_CONFIG_CONFIG_HPP_
#define IMGENC_CONFIG_CONFIG_HPP_

#include <string>

#include <common/logger/logger.hpp>
#include <common/utils/error.hpp>
#include <common/utils/time.hpp>

namespace imgenc::config {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * Garbage collector config.
 */
struct GC {
    bool     mEnabled = true;
    Duration mCollectPeriod {};
};

/*
 * Logging config.
 */
struct Logging {
    aos::LogLevel                   mLevel   = aos::LogLevelEnum::eInfo;
    common::logger::Logger::Backend mBackend = common::logger::Logger::Backend::eStdIO;
};

/*
 * Config instance.
 */
struct Config {
    std::string mWorkingDir;
    std::string mContentDir;
    Duration    mLeaseExpiration {};
    size_t      mMaxConcurrentTransforms {};
    GC          mGC;
    Logging     mLogging;
};

/*******************************************************************************
 * Functions
 ******************************************************************************/

/*
 * Parses config from file.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return Error.
 */
Error ParseConfig(const std::string& filename, Config& config);

} // namespace imgenc::config

#endif
