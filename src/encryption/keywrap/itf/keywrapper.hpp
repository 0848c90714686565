/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_KEYWRAP_ITF_KEYWRAPPER_HPP_
#define IMGENC_ENCRYPTION_KEYWRAP_ITF_KEYWRAPPER_HPP_

#include <string>
#include <vector>

#include <encryption/cryptoconfig.hpp>

namespace imgenc::encryption::keywrap {

/**
 * Key wrapper interface. Key wrapper protects layer private options for a set of recipients and stores wrapped
 * keys in its own layer annotation as comma separated entries.
 */
class KeyWrapperItf {
public:
    /**
     * Destructor.
     */
    virtual ~KeyWrapperItf() = default;

    /**
     * Returns annotation name used to store wrapped keys.
     *
     * @return std::string.
     */
    virtual std::string GetAnnotationID() const = 0;

    /**
     * Checks if encryption config has recipients handled by this wrapper.
     *
     * @param ec encryption config.
     * @return bool.
     */
    virtual bool HasRecipients(const EncryptConfig& ec) const = 0;

    /**
     * Checks if decryption config has no keys usable by this wrapper.
     *
     * @param dc decryption config.
     * @return bool.
     */
    virtual bool NoPossibleKeys(const DecryptConfig& dc) const = 0;

    /**
     * Wraps private options for every recipient of encryption config.
     *
     * @param ec encryption config.
     * @param optsData private options.
     * @return RetWithError<std::vector<std::string>> annotation entries.
     */
    virtual RetWithError<std::vector<std::string>> WrapKeys(const EncryptConfig& ec, const Bytes& optsData) = 0;

    /**
     * Unwraps private options with any key of decryption config.
     *
     * @param dc decryption config.
     * @param annotation annotation value.
     * @return RetWithError<Bytes> private options, TransformErrorEnum::eDecryptionKeyRequired if no key matches.
     */
    virtual RetWithError<Bytes> UnwrapKey(const DecryptConfig& dc, const std::string& annotation) = 0;

    /**
     * Removes recipients that already can unwrap annotation entries. Existing recipients are identified with the
     * private keys of the attached decryption config.
     *
     * @param ec encryption config.
     * @param annotation annotation value.
     * @return RetWithError<EncryptConfig> encryption config with new recipients only.
     */
    virtual RetWithError<EncryptConfig> FilterNewRecipients(const EncryptConfig& ec, const std::string& annotation) = 0;
};

} // namespace imgenc::encryption::keywrap

#endif
