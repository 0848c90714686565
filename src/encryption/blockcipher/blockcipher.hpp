/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_BLOCKCIPHER_BLOCKCIPHER_HPP_
#define IMGENC_ENCRYPTION_BLOCKCIPHER_BLOCKCIPHER_HPP_

#include <map>
#include <memory>
#include <string>

#include <common/utils/error.hpp>
#include <common/utils/utils.hpp>

namespace imgenc::encryption::blockcipher {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * AES-256 in CTR mode with HMAC-SHA256 over ciphertext.
 */
constexpr auto cAES256CTR = "AES_256_CTR_HMAC_SHA256";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Cipher options: option name to value.
 */
using CipherOptions = std::map<std::string, Bytes>;

/**
 * Options stored in clear text next to encrypted layer.
 */
struct PublicOptions {
    std::string   mCipherType;
    Bytes         mHMAC;
    CipherOptions mCipherOptions;
};

/**
 * Options protected by key wrapping.
 */
struct PrivateOptions {
    Bytes         mSymmetricKey;
    CipherOptions mCipherOptions;
};

/**
 * Layer block cipher options.
 */
struct Options {
    PublicOptions  mPublic;
    PrivateOptions mPrivate;
};

/**
 * Layer block cipher interface.
 */
class BlockCipherItf {
public:
    /**
     * Destructor.
     */
    virtual ~BlockCipherItf() = default;

    /**
     * Encrypts data. Missing key material is generated and stored into options together with integrity data.
     *
     * @param plain plain data.
     * @param[in,out] opts cipher options.
     * @return RetWithError<Bytes>.
     */
    virtual RetWithError<Bytes> Encrypt(const Bytes& plain, Options& opts) = 0;

    /**
     * Verifies integrity data and decrypts data.
     *
     * @param cipher encrypted data.
     * @param opts cipher options.
     * @return RetWithError<Bytes>.
     */
    virtual RetWithError<Bytes> Decrypt(const Bytes& cipher, const Options& opts) = 0;
};

/**
 * Block cipher registry.
 */
class Handler {
public:
    /**
     * Registers supported ciphers.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Encrypts data with cipher selected by options public cipher type.
     *
     * @param plain plain data.
     * @param[in,out] opts cipher options.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> Encrypt(const Bytes& plain, Options& opts);

    /**
     * Decrypts data with cipher selected by options public cipher type.
     *
     * @param cipher encrypted data.
     * @param opts cipher options.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> Decrypt(const Bytes& cipher, const Options& opts);

private:
    RetWithError<BlockCipherItf*> GetCipher(const std::string& cipherType);

    std::map<std::string, std::unique_ptr<BlockCipherItf>> mCiphers;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Encodes public options to JSON.
 *
 * @param opts public options.
 * @return Bytes.
 */
Bytes EncodePublicOptions(const PublicOptions& opts);

/**
 * Decodes public options from JSON.
 *
 * @param data encoded options.
 * @return RetWithError<PublicOptions>.
 */
RetWithError<PublicOptions> DecodePublicOptions(const Bytes& data);

/**
 * Encodes private options to JSON.
 *
 * @param opts private options.
 * @return Bytes.
 */
Bytes EncodePrivateOptions(const PrivateOptions& opts);

/**
 * Decodes private options from JSON.
 *
 * @param data encoded options.
 * @return RetWithError<PrivateOptions>.
 */
RetWithError<PrivateOptions> DecodePrivateOptions(const Bytes& data);

} // namespace imgenc::encryption::blockcipher

#endif
