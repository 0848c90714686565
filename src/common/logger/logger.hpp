/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_LOGGER_LOGGER_HPP_
#define IMGENC_COMMON_LOGGER_LOGGER_HPP_

#include <string>

#include <core/common/tools/logger.hpp>

#include <common/utils/error.hpp>

namespace imgenc::common::logger {

/**
 * Logger. Routes aos log lines to Poco channels.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eSyslog,
    };

    /**
     * Parses backend from string.
     *
     * @param backend backend string.
     * @return RetWithError<Backend>.
     */
    static RetWithError<Backend> ParseBackend(const std::string& backend);

    /**
     * Initializes logger.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Sets log backend.
     *
     * @param backend log backend.
     */
    void SetBackend(Backend backend) { mBackend = backend; }

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    void SetLogLevel(aos::LogLevel level);

private:
    static constexpr auto cLogPattern = "%Y-%m-%d %H:%M:%S.%i [%p] [%s] %t";

    static void LogCallback(const char* module, aos::LogLevel level, const aos::String& message);

    Backend       mBackend  = Backend::eStdIO;
    aos::LogLevel mLogLevel = aos::LogLevelEnum::eInfo;
};

} // namespace imgenc::common::logger

#endif
