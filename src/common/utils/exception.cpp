/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exception.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

ImgEncException::ImgEncException(const Error& err, const std::string& message)
    : Poco::Exception(message, err.Message(), err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
    std::string finalMessage;

    if (!message.empty()) {
        finalMessage = message;

        aos::StaticString<aos::cMaxErrorStrLen> errStr;
        if (errStr.Convert(err).IsNone()) {
            finalMessage += ": " + std::string(errStr.CStr());
        }
    } else {
        aos::StaticString<aos::cMaxErrorStrLen> errStr;
        if (errStr.Convert(err).IsNone()) {
            finalMessage = errStr.CStr();
        }
    }

    Poco::Exception::message(finalMessage);
}

Error ToError(const std::exception& e, ErrorEnum err)
{
    if (const auto* imgEncExc = dynamic_cast<const ImgEncException*>(&e)) {
        return imgEncExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return Error {err, pocoExc->displayText().c_str()};
    }

    return Error {err, e.what()};
}

} // namespace imgenc::common::utils
