/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>
#include <Poco/PatternFormatter.h>
#include <Poco/String.h>
#include <Poco/SyslogChannel.h>

#include <common/utils/exception.hpp>

#include "logger.hpp"

namespace imgenc::common::logger {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Poco::Message::Priority ToPocoPriority(aos::LogLevel level)
{
    switch (level.GetValue()) {
    case aos::LogLevelEnum::eDebug:
        return Poco::Message::PRIO_DEBUG;
    case aos::LogLevelEnum::eInfo:
        return Poco::Message::PRIO_INFORMATION;
    case aos::LogLevelEnum::eWarning:
        return Poco::Message::PRIO_WARNING;
    case aos::LogLevelEnum::eError:
        return Poco::Message::PRIO_ERROR;
    default:
        return Poco::Message::PRIO_INFORMATION;
    }
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Logger::Backend> Logger::ParseBackend(const std::string& backend)
{
    auto lower = Poco::toLower(backend);

    if (lower == "stdio") {
        return Backend::eStdIO;
    }

    if (lower == "syslog") {
        return Backend::eSyslog;
    }

    return {Backend::eStdIO, Error(ErrorEnum::eInvalidArgument, "unknown log backend")};
}

Error Logger::Init()
{
    try {
        Poco::AutoPtr<Poco::Channel> channel;

        if (mBackend == Backend::eSyslog) {
            channel = new Poco::SyslogChannel("imgenc");
        } else {
            channel = new Poco::ConsoleChannel();
        }

        Poco::AutoPtr<Poco::PatternFormatter>  formatter(new Poco::PatternFormatter(cLogPattern));
        Poco::AutoPtr<Poco::FormattingChannel> formattingChannel(new Poco::FormattingChannel(formatter, channel));

        Poco::Logger::root().setChannel(formattingChannel);
        Poco::Logger::setChannel("", formattingChannel);

        SetLogLevel(mLogLevel);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(utils::ToError(e));
    }

    aos::Log::SetCallback(LogCallback);

    return ErrorEnum::eNone;
}

void Logger::SetLogLevel(aos::LogLevel level)
{
    mLogLevel = level;

    Poco::Logger::root().setLevel(ToPocoPriority(level));
    Poco::Logger::setLevel("", ToPocoPriority(level));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Logger::LogCallback(const char* module, aos::LogLevel level, const aos::String& message)
{
    auto& logger   = Poco::Logger::get(module);
    auto  priority = ToPocoPriority(level);

    if (!logger.is(priority)) {
        return;
    }

    logger.log(Poco::Message(module, message.CStr(), priority));
}

} // namespace imgenc::common::logger
