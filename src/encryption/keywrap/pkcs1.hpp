/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_KEYWRAP_PKCS1_HPP_
#define IMGENC_ENCRYPTION_KEYWRAP_PKCS1_HPP_

#include <common/utils/cryptohelper.hpp>

#include "itf/keywrapper.hpp"

namespace imgenc::encryption::keywrap {

/**
 * RSA-OAEP (SHA-256) key wrapper. Recipients are taken from cParamPubKeys, keys from cParamPrivKeys.
 */
class PKCS1KeyWrapper : public KeyWrapperItf {
public:
    /**
     * Annotation name.
     */
    static constexpr auto cAnnotationID = "org.opencontainers.image.enc.keys.pkcs1";

    /**
     * Returns annotation name.
     *
     * @return std::string.
     */
    std::string GetAnnotationID() const override { return cAnnotationID; }

    /**
     * Checks if encryption config has public keys.
     *
     * @param ec encryption config.
     * @return bool.
     */
    bool HasRecipients(const EncryptConfig& ec) const override;

    /**
     * Checks if decryption config has no private keys.
     *
     * @param dc decryption config.
     * @return bool.
     */
    bool NoPossibleKeys(const DecryptConfig& dc) const override;

    /**
     * Wraps private options for every public key.
     *
     * @param ec encryption config.
     * @param optsData private options.
     * @return RetWithError<std::vector<std::string>>.
     */
    RetWithError<std::vector<std::string>> WrapKeys(const EncryptConfig& ec, const Bytes& optsData) override;

    /**
     * Unwraps private options.
     *
     * @param dc decryption config.
     * @param annotation annotation value.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> UnwrapKey(const DecryptConfig& dc, const std::string& annotation) override;

    /**
     * Removes public keys of existing recipients.
     *
     * @param ec encryption config.
     * @param annotation annotation value.
     * @return RetWithError<EncryptConfig>.
     */
    RetWithError<EncryptConfig> FilterNewRecipients(const EncryptConfig& ec, const std::string& annotation) override;

private:
    static constexpr auto cHashAlgorithm = "sha256";

    struct WrappedKey {
        std::string mHash;
        Bytes       mWrappedKey;
    };

    RetWithError<std::vector<common::utils::PKeyPtr>> LoadPrivateKeys(const DecryptConfig& dc) const;
    RetWithError<std::vector<WrappedKey>>             ParseAnnotation(const std::string& annotation) const;
    RetWithError<Bytes>  Wrap(const common::utils::PKeyPtr& pubKey, const Bytes& data) const;
    RetWithError<Bytes>  Unwrap(const common::utils::PKeyPtr& privKey, const WrappedKey& wrappedKey) const;
    std::string          EncodeEntry(const Bytes& wrappedKey) const;
};

} // namespace imgenc::encryption::keywrap

#endif
