/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/cryptohelper.hpp>

#include "cryptoconfig.hpp"

namespace imgenc::encryption {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void MergeParameters(Parameters& dst, const Parameters& src)
{
    for (const auto& [name, values] : src) {
        auto& dstValues = dst[name];

        dstValues.insert(dstValues.end(), values.begin(), values.end());
    }
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<CryptoConfig> InitEncryption(const std::vector<Bytes>& pubKeys)
{
    if (pubKeys.empty()) {
        return {CryptoConfig(), Error(ErrorEnum::eInvalidArgument, "no recipients specified")};
    }

    for (const auto& pubKey : pubKeys) {
        if (auto [key, err] = common::utils::LoadPublicKey(pubKey); !err.IsNone()) {
            return {CryptoConfig(), AOS_ERROR_WRAP(Error(err, "invalid public key"))};
        }
    }

    CryptoConfig config;

    config.mEncryptConfig.emplace();
    config.mEncryptConfig->mParameters[cParamPubKeys] = pubKeys;

    return config;
}

RetWithError<CryptoConfig> InitDecryption(const std::vector<Bytes>& privKeys, const std::vector<Bytes>& passwords)
{
    if (privKeys.empty()) {
        return {CryptoConfig(), Error(ErrorEnum::eInvalidArgument, "no private keys specified")};
    }

    if (passwords.size() > privKeys.size()) {
        return {CryptoConfig(), Error(ErrorEnum::eInvalidArgument, "more passwords than private keys")};
    }

    auto keyPasswords = passwords;

    keyPasswords.resize(privKeys.size());

    for (size_t i = 0; i < privKeys.size(); i++) {
        if (auto [key, err] = common::utils::LoadPrivateKey(privKeys[i], keyPasswords[i]); !err.IsNone()) {
            return {CryptoConfig(), AOS_ERROR_WRAP(Error(err, "invalid private key"))};
        }
    }

    CryptoConfig config;

    config.mDecryptConfig.emplace();
    config.mDecryptConfig->mParameters[cParamPrivKeys]          = privKeys;
    config.mDecryptConfig->mParameters[cParamPrivKeysPasswords] = keyPasswords;

    return config;
}

CryptoConfig CombineCryptoConfigs(const std::vector<CryptoConfig>& configs)
{
    CryptoConfig combined;

    for (const auto& config : configs) {
        if (config.mEncryptConfig) {
            if (!combined.mEncryptConfig) {
                combined.mEncryptConfig.emplace();
            }

            MergeParameters(combined.mEncryptConfig->mParameters, config.mEncryptConfig->mParameters);
            MergeParameters(combined.mEncryptConfig->mDecryptConfig.mParameters,
                config.mEncryptConfig->mDecryptConfig.mParameters);
        }

        if (config.mDecryptConfig) {
            if (!combined.mDecryptConfig) {
                combined.mDecryptConfig.emplace();
            }

            MergeParameters(combined.mDecryptConfig->mParameters, config.mDecryptConfig->mParameters);
        }
    }

    // Decryption keys are also needed to add recipients to already encrypted layers.
    if (combined.mEncryptConfig && combined.mDecryptConfig) {
        MergeParameters(combined.mEncryptConfig->mDecryptConfig.mParameters, combined.mDecryptConfig->mParameters);
    }

    return combined;
}

EncryptConfig AttachDecryptConfig(const EncryptConfig& encryptConfig, const DecryptConfig& decryptConfig)
{
    auto result = encryptConfig;

    MergeParameters(result.mDecryptConfig.mParameters, decryptConfig.mParameters);

    return result;
}

const std::vector<Bytes>& GetParameter(const Parameters& parameters, const std::string& name)
{
    static const std::vector<Bytes> cEmpty;

    auto it = parameters.find(name);
    if (it == parameters.end()) {
        return cEmpty;
    }

    return it->second;
}

} // namespace imgenc::encryption
