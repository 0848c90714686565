/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_TIME_HPP_
#define IMGENC_COMMON_UTILS_TIME_HPP_

#include <chrono>
#include <string>

#include "error.hpp"

namespace imgenc {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

using Duration = std::chrono::nanoseconds;
using Time     = std::chrono::system_clock::time_point;

} // namespace imgenc

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses duration from string. Accepts Go style ("1h30m", "5m", "250ms") and ISO 8601 ("PT5M", "P1DT3H") formats.
 *
 * @param duration duration string.
 * @return parsed duration.
 */
RetWithError<Duration> ParseDuration(const std::string& duration);

/**
 * Returns current time rounded down to microseconds, the precision time is persisted with.
 *
 * @return Time.
 */
Time Now();

/**
 * Creates time object from a UTC formatted string.
 *
 * @param utcTimeStr UTC formatted time string.
 * @return RetWithError<Time>.
 */
RetWithError<Time> FromUTCString(const std::string& utcTimeStr);

/**
 * Converts time into a UTC string.
 *
 * @param time time object.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> ToUTCString(const Time& time);

} // namespace imgenc::common::utils

#endif
