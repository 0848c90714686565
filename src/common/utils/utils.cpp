/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/StreamCopier.h>
#include <Poco/StringTokenizer.h>

#include "exception.hpp"
#include "utils.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::string Base64Encode(const Bytes& data)
{
    std::ostringstream  oss;
    Poco::Base64Encoder encoder(oss);

    encoder.rdbuf()->setLineLength(0);
    encoder.write(reinterpret_cast<const char*>(data.data()), data.size());
    encoder.close();

    return oss.str();
}

RetWithError<Bytes> Base64Decode(const std::string& str)
{
    try {
        std::istringstream  iss(str);
        Poco::Base64Decoder decoder(iss);
        std::string         decoded;

        Poco::StreamCopier::copyToString(decoder, decoded);

        return ToBytes(decoded);
    } catch (const std::exception& e) {
        return {Bytes(), AOS_ERROR_WRAP(ToError(e, ErrorEnum::eInvalidArgument))};
    }
}

std::vector<std::string> Split(const std::string& str, const std::string& delimiter)
{
    Poco::StringTokenizer tokenizer(
        str, delimiter, Poco::StringTokenizer::TOK_IGNORE_EMPTY | Poco::StringTokenizer::TOK_TRIM);

    return std::vector<std::string>(tokenizer.begin(), tokenizer.end());
}

} // namespace imgenc::common::utils
