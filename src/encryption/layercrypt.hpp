/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_LAYERCRYPT_HPP_
#define IMGENC_ENCRYPTION_LAYERCRYPT_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <common/ocispec/types.hpp>
#include <common/utils/error.hpp>

#include "blockcipher/blockcipher.hpp"
#include "cryptoconfig.hpp"
#include "keywrap/itf/keywrapper.hpp"

namespace imgenc::encryption {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * Prefix of all layer encryption annotations.
 */
constexpr auto cAnnotationEncPrefix = "org.opencontainers.image.enc.";

/**
 * Prefix of key wrapper annotations.
 */
constexpr auto cAnnotationKeysPrefix = "org.opencontainers.image.enc.keys.";

/**
 * Public options annotation.
 */
constexpr auto cAnnotationPubOpts = "org.opencontainers.image.enc.pubopts";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Layer transform result.
 */
struct LayerResult {
    Bytes           mData;
    oci::Descriptor mDescriptor;
};

/**
 * Encrypts and decrypts single image layers.
 *
 * Layer data is encrypted with a block cipher, private cipher options are wrapped by every key wrapper that has
 * recipients in the encryption config. Key wrappers are registered before use and must not be added while layers are
 * processed.
 */
class LayerCryptor {
public:
    /**
     * Initializes layer cryptor with default block ciphers and key wrappers.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Registers key wrapper.
     *
     * @param wrapper key wrapper.
     * @return Error.
     */
    Error RegisterKeyWrapper(std::unique_ptr<keywrap::KeyWrapperItf> wrapper);

    /**
     * Encrypts plain layer.
     *
     * @param ec encryption config.
     * @param plain layer data.
     * @param desc layer descriptor.
     * @return RetWithError<LayerResult>.
     */
    RetWithError<LayerResult> EncryptLayer(const EncryptConfig& ec, const Bytes& plain, const oci::Descriptor& desc);

    /**
     * Decrypts encrypted layer.
     *
     * @param dc decryption config.
     * @param cipher encrypted layer data.
     * @param desc layer descriptor.
     * @return RetWithError<LayerResult>.
     */
    RetWithError<LayerResult> DecryptLayer(const DecryptConfig& dc, const Bytes& cipher, const oci::Descriptor& desc);

    /**
     * Adds new recipients to already encrypted layer. Layer data is not changed, only wrapped key annotations are
     * extended. If the layer can't be unwrapped with the decryption config attached to the encryption config, the
     * descriptor is returned unchanged.
     *
     * @param ec encryption config.
     * @param desc encrypted layer descriptor.
     * @return RetWithError<oci::Descriptor>.
     */
    RetWithError<oci::Descriptor> AddRecipients(const EncryptConfig& ec, const oci::Descriptor& desc);

    /**
     * Checks that decryption config is able to unwrap layer keys.
     *
     * @param dc decryption config.
     * @param desc encrypted layer descriptor.
     * @return Error.
     */
    Error CheckLayerAuthorization(const DecryptConfig& dc, const oci::Descriptor& desc);

    /**
     * Returns key wrapping schemes found in layer annotations.
     *
     * @param desc layer descriptor.
     * @return std::vector<std::string>.
     */
    std::vector<std::string> GetLayerSchemes(const oci::Descriptor& desc) const;

private:
    RetWithError<Bytes> UnwrapPrivateOptions(const DecryptConfig& dc, const oci::Descriptor& desc);
    RetWithError<oci::Annotations> WrapPrivateOptions(const EncryptConfig& ec, const Bytes& privOpts);

    blockcipher::Handler                                            mCipherHandler;
    std::map<std::string, std::unique_ptr<keywrap::KeyWrapperItf>> mKeyWrappers;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Returns encrypted media type for plain layer media type.
 *
 * @param mediaType plain layer media type.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> GetEncryptedMediaType(const std::string& mediaType);

/**
 * Returns plain media type for encrypted layer media type.
 *
 * @param mediaType encrypted layer media type.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> GetDecryptedMediaType(const std::string& mediaType);

/**
 * Returns key wrapping scheme name for key wrapper annotation.
 *
 * @param annotationID key wrapper annotation.
 * @return std::string.
 */
std::string GetSchemeName(const std::string& annotationID);

} // namespace imgenc::encryption

#endif
