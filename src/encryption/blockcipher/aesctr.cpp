/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <common/utils/cryptohelper.hpp>

#include "aesctr.hpp"

namespace imgenc::encryption::blockcipher {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Bytes> AESCTRBlockCipher::Encrypt(const Bytes& plain, Options& opts)
{
    Error err;

    if (opts.mPrivate.mSymmetricKey.empty()) {
        Tie(opts.mPrivate.mSymmetricKey, err) = common::utils::GenerateRandom(cKeyLen);
        if (!err.IsNone()) {
            return {Bytes(), AOS_ERROR_WRAP(err)};
        }
    }

    auto& nonce = opts.mPrivate.mCipherOptions[cNonceOption];

    if (nonce.empty()) {
        Tie(nonce, err) = common::utils::GenerateRandom(cNonceLen);
        if (!err.IsNone()) {
            return {Bytes(), AOS_ERROR_WRAP(err)};
        }
    }

    Bytes cipher;

    Tie(cipher, err) = Crypt(plain, opts.mPrivate.mSymmetricKey, nonce);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    Tie(opts.mPublic.mHMAC, err) = CalculateHMAC(cipher, opts.mPrivate.mSymmetricKey);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    opts.mPublic.mCipherType = cAES256CTR;

    return cipher;
}

RetWithError<Bytes> AESCTRBlockCipher::Decrypt(const Bytes& cipher, const Options& opts)
{
    auto it = opts.mPrivate.mCipherOptions.find(cNonceOption);
    if (it == opts.mPrivate.mCipherOptions.end()) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "missing nonce")};
    }

    auto [hmac, err] = CalculateHMAC(cipher, opts.mPrivate.mSymmetricKey);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    if (hmac.size() != opts.mPublic.mHMAC.size()
        || CRYPTO_memcmp(hmac.data(), opts.mPublic.mHMAC.data(), hmac.size()) != 0) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "HMAC verification failed")};
    }

    return Crypt(cipher, opts.mPrivate.mSymmetricKey, it->second);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<Bytes> AESCTRBlockCipher::Crypt(const Bytes& in, const Bytes& key, const Bytes& nonce) const
{
    if (key.size() != cKeyLen) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "invalid symmetric key length")};
    }

    if (nonce.size() != cNonceLen) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "invalid nonce length")};
    }

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, common::utils::GetOpensslErrorString())};
    }

    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_ctr(), nullptr, key.data(), nonce.data(), 1) != 1) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, common::utils::GetOpensslErrorString())};
    }

    Bytes  out(in.size() + EVP_MAX_BLOCK_LENGTH);
    size_t outSize = 0;

    for (size_t offset = 0; offset < in.size(); offset += cChunkSize) {
        auto chunkSize = std::min(cChunkSize, in.size() - offset);
        int  outLen    = 0;

        if (EVP_CipherUpdate(ctx.get(), out.data() + outSize, &outLen, in.data() + offset, static_cast<int>(chunkSize))
            != 1) {
            return {
                Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, common::utils::GetOpensslErrorString())};
        }

        outSize += static_cast<size_t>(outLen);
    }

    int finalLen = 0;

    if (EVP_CipherFinal_ex(ctx.get(), out.data() + outSize, &finalLen) != 1) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, common::utils::GetOpensslErrorString())};
    }

    out.resize(outSize + static_cast<size_t>(finalLen));

    return out;
}

RetWithError<Bytes> AESCTRBlockCipher::CalculateHMAC(const Bytes& data, const Bytes& key) const
{
    static const unsigned char cEmpty[1] = {};

    if (key.size() != cKeyLen) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "invalid symmetric key length")};
    }

    Bytes        hmac(EVP_MAX_MD_SIZE);
    unsigned int hmacLen = 0;

    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.empty() ? cEmpty : data.data(), data.size(),
            hmac.data(), &hmacLen)
        == nullptr) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, common::utils::GetOpensslErrorString())};
    }

    hmac.resize(hmacLen);

    return hmac;
}

} // namespace imgenc::encryption::blockcipher
