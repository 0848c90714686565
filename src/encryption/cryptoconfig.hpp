/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_CRYPTOCONFIG_HPP_
#define IMGENC_ENCRYPTION_CRYPTOCONFIG_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <common/utils/error.hpp>
#include <common/utils/utils.hpp>

namespace imgenc::encryption {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * Recipient public keys or X.509 certificates, PEM or DER encoded.
 */
constexpr auto cParamPubKeys = "pubkeys";

/**
 * Private keys, PEM or DER encoded.
 */
constexpr auto cParamPrivKeys = "privkeys";

/**
 * Private key passwords, positionally paired with private keys. Empty password means unencrypted key.
 */
constexpr auto cParamPrivKeysPasswords = "privkeys-passwords";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Crypto parameters: each name maps to ordered list of blobs.
 */
using Parameters = std::map<std::string, std::vector<Bytes>>;

/**
 * Decryption config.
 */
struct DecryptConfig {
    Parameters mParameters;
};

/**
 * Encryption config. Decryption config is used to access existing wrapped keys when recipients are added to already
 * encrypted layers.
 */
struct EncryptConfig {
    Parameters    mParameters;
    DecryptConfig mDecryptConfig;
};

/**
 * Crypto config. Present config determines operation direction.
 */
struct CryptoConfig {
    std::optional<EncryptConfig> mEncryptConfig;
    std::optional<DecryptConfig> mDecryptConfig;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Creates encryption crypto config for recipients.
 *
 * @param pubKeys recipient public keys or certificates.
 * @return RetWithError<CryptoConfig>.
 */
RetWithError<CryptoConfig> InitEncryption(const std::vector<Bytes>& pubKeys);

/**
 * Creates decryption crypto config.
 *
 * @param privKeys private keys.
 * @param passwords private key passwords, may be shorter than keys.
 * @return RetWithError<CryptoConfig>.
 */
RetWithError<CryptoConfig> InitDecryption(const std::vector<Bytes>& privKeys, const std::vector<Bytes>& passwords = {});

/**
 * Combines crypto configs: parameters of the same name are concatenated.
 *
 * @param configs configs.
 * @return CryptoConfig.
 */
CryptoConfig CombineCryptoConfigs(const std::vector<CryptoConfig>& configs);

/**
 * Attaches decryption config to encryption config.
 *
 * @param encryptConfig encryption config.
 * @param decryptConfig decryption config.
 * @return EncryptConfig.
 */
EncryptConfig AttachDecryptConfig(const EncryptConfig& encryptConfig, const DecryptConfig& decryptConfig);

/**
 * Returns parameter values or empty list.
 *
 * @param parameters parameters.
 * @param name parameter name.
 * @return const std::vector<Bytes>&.
 */
const std::vector<Bytes>& GetParameter(const Parameters& parameters, const std::string& name);

} // namespace imgenc::encryption

#endif
