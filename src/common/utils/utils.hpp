/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_UTILS_HPP_
#define IMGENC_COMMON_UTILS_UTILS_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "error.hpp"

namespace imgenc {

/**
 * Byte buffer.
 */
using Bytes = std::vector<uint8_t>;

} // namespace imgenc

namespace imgenc::common::utils {

/**
 * Converts string to bytes.
 *
 * @param str string.
 * @return Bytes.
 */
inline Bytes ToBytes(const std::string& str)
{
    return Bytes(str.begin(), str.end());
}

/**
 * Converts bytes to string.
 *
 * @param data bytes.
 * @return std::string.
 */
inline std::string ToString(const Bytes& data)
{
    return std::string(data.begin(), data.end());
}

/**
 * Encodes bytes to base64 string without line breaks.
 *
 * @param data data.
 * @return std::string.
 */
std::string Base64Encode(const Bytes& data);

/**
 * Decodes base64 string.
 *
 * @param str base64 string.
 * @return RetWithError<Bytes>.
 */
RetWithError<Bytes> Base64Decode(const std::string& str);

/**
 * Splits string by delimiter skipping empty tokens.
 *
 * @param str string.
 * @param delimiter delimiter.
 * @return std::vector<std::string>.
 */
std::vector<std::string> Split(const std::string& str, const std::string& delimiter);

} // namespace imgenc::common::utils

#endif
