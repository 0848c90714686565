/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_CRYPTOHELPER_HPP_
#define IMGENC_COMMON_UTILS_CRYPTOHELPER_HPP_

#include <memory>
#include <string>

#include <openssl/types.h>

#include "error.hpp"
#include "utils.hpp"

namespace imgenc::common::utils {

/**
 * Shared OpenSSL key.
 */
using PKeyPtr = std::shared_ptr<EVP_PKEY>;

/**
 * Returns a human-readable OpenSSL error string and clears OpenSSL error queue.
 *
 * @return std::string.
 */
std::string GetOpensslErrorString();

/**
 * Loads public key from PEM or DER encoded public key or X.509 certificate.
 *
 * @param data encoded key.
 * @return RetWithError<PKeyPtr>.
 */
RetWithError<PKeyPtr> LoadPublicKey(const Bytes& data);

/**
 * Loads private key from PEM or DER encoding.
 *
 * @param data encoded key.
 * @param password key password, empty if key is not encrypted.
 * @return RetWithError<PKeyPtr>.
 */
RetWithError<PKeyPtr> LoadPrivateKey(const Bytes& data, const Bytes& password = {});

/**
 * Checks whether both keys share the same public component.
 *
 * @param lhs first key.
 * @param rhs second key.
 * @return bool.
 */
bool IsSameKey(const PKeyPtr& lhs, const PKeyPtr& rhs);

/**
 * Fills buffer with cryptographically strong random bytes.
 *
 * @param size number of bytes.
 * @return RetWithError<Bytes>.
 */
RetWithError<Bytes> GenerateRandom(size_t size);

} // namespace imgenc::common::utils

#endif
