/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_DIGEST_HPP_
#define IMGENC_COMMON_UTILS_DIGEST_HPP_

#include <string>
#include <utility>

#include "error.hpp"
#include "utils.hpp"

namespace imgenc::common::utils {

using Digest = std::string;

/**
 * Canonical digest algorithm.
 */
constexpr auto cDigestAlgorithm = "sha256";

/**
 * Parses the digest string.
 *
 * @param digest digest string.
 * @return std::pair<std::string, std::string> algorithm and encoded parts.
 */
std::pair<std::string, std::string> ParseDigest(const Digest& digest);

/**
 * Validates the digest.
 *
 * @param digest digest string.
 * @return Error.
 */
Error ValidateDigest(const Digest& digest);

/**
 * Calculates canonical digest of data.
 *
 * @param data data.
 * @return Digest.
 */
Digest CalculateDigest(const Bytes& data);

/**
 * Verifies that data matches digest.
 *
 * @param digest expected digest.
 * @param data data.
 * @return Error.
 */
Error VerifyDigest(const Digest& digest, const Bytes& data);

} // namespace imgenc::common::utils

#endif
