/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_BLOCKCIPHER_AESCTR_HPP_
#define IMGENC_ENCRYPTION_BLOCKCIPHER_AESCTR_HPP_

#include "blockcipher.hpp"

namespace imgenc::encryption::blockcipher {

/**
 * AES-256-CTR block cipher with HMAC-SHA256 of ciphertext.
 */
class AESCTRBlockCipher : public BlockCipherItf {
public:
    /**
     * Symmetric key length.
     */
    static constexpr size_t cKeyLen = 32;

    /**
     * Nonce length.
     */
    static constexpr size_t cNonceLen = 16;

    /**
     * Nonce cipher option name.
     */
    static constexpr auto cNonceOption = "nonce";

    /**
     * Max data size passed to a single cipher update.
     */
    static constexpr size_t cChunkSize = 1024 * 1024;

    /**
     * Encrypts data.
     *
     * @param plain plain data.
     * @param[in,out] opts cipher options.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> Encrypt(const Bytes& plain, Options& opts) override;

    /**
     * Decrypts data.
     *
     * @param cipher encrypted data.
     * @param opts cipher options.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> Decrypt(const Bytes& cipher, const Options& opts) override;

private:
    RetWithError<Bytes> Crypt(const Bytes& in, const Bytes& key, const Bytes& nonce) const;
    RetWithError<Bytes> CalculateHMAC(const Bytes& data, const Bytes& key) const;
};

} // namespace imgenc::encryption::blockcipher

#endif
