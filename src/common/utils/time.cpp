/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <regex>

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Timestamp.h>

#include "exception.hpp"
#include "time.hpp"

namespace imgenc::common::utils {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::regex cGoDurationRegex(R"(^(\d+(\.\d+)?(ns|us|µs|ms|s|m|h))+$)");
const std::regex cGoDurationPartRegex(R"((\d+(?:\.\d+)?)(ns|us|µs|ms|s|m|h))");
const std::regex cISO8601DurationRegex(
    R"(^P(?:(\d+)Y)?(?:(\d+)M)?(?:(\d+)W)?(?:(\d+)D)?(?:T(?:(\d+)H)?(?:(\d+)M)?(?:(\d+(?:\.\d+)?)S)?)?$)");

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Duration UnitToDuration(const std::string& unit)
{
    if (unit == "ns") {
        return std::chrono::nanoseconds(1);
    }

    if (unit == "us" || unit == "µs") {
        return std::chrono::microseconds(1);
    }

    if (unit == "ms") {
        return std::chrono::milliseconds(1);
    }

    if (unit == "s") {
        return std::chrono::seconds(1);
    }

    if (unit == "m") {
        return std::chrono::minutes(1);
    }

    return std::chrono::hours(1);
}

Duration ParseGoDuration(const std::string& duration)
{
    Duration result {};

    for (auto it = std::sregex_iterator(duration.begin(), duration.end(), cGoDurationPartRegex);
         it != std::sregex_iterator(); ++it) {
        auto value = std::stod((*it)[1].str());
        auto unit  = UnitToDuration((*it)[2].str());

        result += std::chrono::duration_cast<Duration>(std::chrono::duration<double, std::nano>(value * unit.count()));
    }

    return result;
}

Duration ParseISO8601Duration(const std::smatch& match)
{
    constexpr auto cDay   = std::chrono::hours(24);
    constexpr auto cWeek  = cDay * 7;
    constexpr auto cMonth = cDay * 30;
    constexpr auto cYear  = cDay * 365;

    auto number = [&match](size_t index) { return match[index].matched ? std::stoll(match[index].str()) : 0; };

    Duration result = cYear * number(1) + cMonth * number(2) + cWeek * number(3) + cDay * number(4)
        + std::chrono::hours(number(5)) + std::chrono::minutes(number(6));

    if (match[7].matched) {
        result += std::chrono::duration_cast<Duration>(std::chrono::duration<double>(std::stod(match[7].str())));
    }

    return result;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Duration> ParseDuration(const std::string& duration)
{
    try {
        if (duration == "0") {
            return Duration {};
        }

        if (std::regex_match(duration, cGoDurationRegex)) {
            return ParseGoDuration(duration);
        }

        if (std::smatch match; duration.size() > 1 && std::regex_match(duration, match, cISO8601DurationRegex)) {
            return ParseISO8601Duration(match);
        }
    } catch (const std::exception& e) {
        return {Duration {}, AOS_ERROR_WRAP(ToError(e, ErrorEnum::eInvalidArgument))};
    }

    return {Duration {}, Error(ErrorEnum::eInvalidArgument, "invalid duration format")};
}

Time Now()
{
    return std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
}

RetWithError<Time> FromUTCString(const std::string& utcTimeStr)
{
    try {
        int            tzd = 0;
        Poco::DateTime dateTime;

        if (!Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FRAC_FORMAT, utcTimeStr, dateTime, tzd)
            && !Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FORMAT, utcTimeStr, dateTime, tzd)) {
            return {Time {}, Error(ErrorEnum::eInvalidArgument, "invalid UTC time format")};
        }

        dateTime.makeUTC(tzd);

        return Time(std::chrono::microseconds(dateTime.timestamp().epochMicroseconds()));
    } catch (const std::exception& e) {
        return {Time {}, AOS_ERROR_WRAP(ToError(e, ErrorEnum::eInvalidArgument))};
    }
}

RetWithError<std::string> ToUTCString(const Time& time)
{
    try {
        auto microseconds
            = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();

        return Poco::DateTimeFormatter::format(
            Poco::Timestamp(microseconds), Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
    } catch (const std::exception& e) {
        return {std::string(), AOS_ERROR_WRAP(ToError(e))};
    }
}

} // namespace imgenc::common::utils
