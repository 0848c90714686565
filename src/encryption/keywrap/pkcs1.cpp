/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <Poco/JSON/Object.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

#include "pkcs1.hpp"

namespace imgenc::encryption::keywrap {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

Error CryptoError(const std::string& message)
{
    return TransformError(TransformErrorEnum::eCryptoFailure, message);
}

Error SetOAEPPadding(EVP_PKEY_CTX* ctx)
{
    if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0
        || EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0
        || EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
        return CryptoError(common::utils::GetOpensslErrorString());
    }

    return ErrorEnum::eNone;
}

bool IsRSAKey(const common::utils::PKeyPtr& key)
{
    return EVP_PKEY_base_id(key.get()) == EVP_PKEY_RSA;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

bool PKCS1KeyWrapper::HasRecipients(const EncryptConfig& ec) const
{
    return !GetParameter(ec.mParameters, cParamPubKeys).empty();
}

bool PKCS1KeyWrapper::NoPossibleKeys(const DecryptConfig& dc) const
{
    return GetParameter(dc.mParameters, cParamPrivKeys).empty();
}

RetWithError<std::vector<std::string>> PKCS1KeyWrapper::WrapKeys(const EncryptConfig& ec, const Bytes& optsData)
{
    std::vector<std::string> entries;

    for (const auto& pubKeyData : GetParameter(ec.mParameters, cParamPubKeys)) {
        auto [pubKey, err] = common::utils::LoadPublicKey(pubKeyData);
        if (!err.IsNone()) {
            return {std::vector<std::string>(),
                CryptoError(std::string("can't load public key: ") + err.Message())};
        }

        Bytes wrappedKey;

        Tie(wrappedKey, err) = Wrap(pubKey, optsData);
        if (!err.IsNone()) {
            return {std::vector<std::string>(), err};
        }

        entries.push_back(EncodeEntry(wrappedKey));
    }

    return entries;
}

RetWithError<Bytes> PKCS1KeyWrapper::UnwrapKey(const DecryptConfig& dc, const std::string& annotation)
{
    auto [privKeys, err] = LoadPrivateKeys(dc);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    std::vector<WrappedKey> wrappedKeys;

    Tie(wrappedKeys, err) = ParseAnnotation(annotation);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    auto supported = false;

    for (const auto& wrappedKey : wrappedKeys) {
        if (wrappedKey.mHash != cHashAlgorithm) {
            LOG_WRN() << "Skip pkcs1 entry with unsupported hash" << Log::Field("hash", wrappedKey.mHash.c_str());

            continue;
        }

        supported = true;

        for (const auto& privKey : privKeys) {
            auto [optsData, unwrapErr] = Unwrap(privKey, wrappedKey);
            if (unwrapErr.IsNone()) {
                return optsData;
            }

            if (!IsTransformError(unwrapErr, TransformErrorEnum::eDecryptionKeyRequired)) {
                return {Bytes(), unwrapErr};
            }
        }
    }

    if (!supported) {
        return {Bytes(), CryptoError("pkcs1 annotation has no entries with supported hash")};
    }

    return {Bytes(), TransformError(TransformErrorEnum::eDecryptionKeyRequired, "no suitable pkcs1 private key found")};
}

RetWithError<EncryptConfig> PKCS1KeyWrapper::FilterNewRecipients(const EncryptConfig& ec, const std::string& annotation)
{
    auto [privKeys, err] = LoadPrivateKeys(ec.mDecryptConfig);
    if (!err.IsNone()) {
        return {EncryptConfig(), err};
    }

    std::vector<WrappedKey> wrappedKeys;

    Tie(wrappedKeys, err) = ParseAnnotation(annotation);
    if (!err.IsNone()) {
        return {EncryptConfig(), err};
    }

    std::vector<common::utils::PKeyPtr> recipients;

    for (const auto& privKey : privKeys) {
        for (const auto& wrappedKey : wrappedKeys) {
            if (Unwrap(privKey, wrappedKey).mError.IsNone()) {
                recipients.push_back(privKey);
                break;
            }
        }
    }

    auto filtered = ec;
    auto& pubKeys = filtered.mParameters[cParamPubKeys];

    pubKeys.clear();

    for (const auto& pubKeyData : GetParameter(ec.mParameters, cParamPubKeys)) {
        auto [pubKey, loadErr] = common::utils::LoadPublicKey(pubKeyData);
        if (!loadErr.IsNone()) {
            return {EncryptConfig(),
                CryptoError(std::string("can't load public key: ") + loadErr.Message())};
        }

        auto isRecipient = std::any_of(recipients.begin(), recipients.end(),
            [&pubKey](const common::utils::PKeyPtr& recipient) { return common::utils::IsSameKey(pubKey, recipient); });

        if (!isRecipient) {
            pubKeys.push_back(pubKeyData);
        }
    }

    return filtered;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<std::vector<common::utils::PKeyPtr>> PKCS1KeyWrapper::LoadPrivateKeys(const DecryptConfig& dc) const
{
    const auto& privKeys  = GetParameter(dc.mParameters, cParamPrivKeys);
    const auto& passwords = GetParameter(dc.mParameters, cParamPrivKeysPasswords);

    std::vector<common::utils::PKeyPtr> keys;

    for (size_t i = 0; i < privKeys.size(); i++) {
        auto [key, err] = common::utils::LoadPrivateKey(privKeys[i], i < passwords.size() ? passwords[i] : Bytes());
        if (!err.IsNone()) {
            return {std::vector<common::utils::PKeyPtr>(),
                CryptoError(std::string("can't load private key: ") + err.Message())};
        }

        if (!IsRSAKey(key)) {
            LOG_DBG() << "Skip non RSA private key";

            continue;
        }

        keys.push_back(key);
    }

    return keys;
}

RetWithError<std::vector<PKCS1KeyWrapper::WrappedKey>> PKCS1KeyWrapper::ParseAnnotation(
    const std::string& annotation) const
{
    std::vector<WrappedKey> wrappedKeys;

    try {
        for (const auto& entry : common::utils::Split(annotation, ",")) {
            auto [entryData, err] = common::utils::Base64Decode(entry);
            IMGENC_ERROR_CHECK_AND_THROW(err, "can't decode pkcs1 entry");

            Poco::Dynamic::Var json;

            Tie(json, err) = common::utils::ParseJson(common::utils::ToString(entryData));
            IMGENC_ERROR_CHECK_AND_THROW(err, "can't parse pkcs1 entry");

            common::utils::CaseInsensitiveObjectWrapper object(json);
            WrappedKey                                  wrappedKey;

            wrappedKey.mHash = object.GetValue<std::string>("hash", cHashAlgorithm);

            Tie(wrappedKey.mWrappedKey, err) = common::utils::Base64Decode(object.GetValue<std::string>("wrappedkey"));
            IMGENC_ERROR_CHECK_AND_THROW(err, "can't decode pkcs1 wrapped key");

            if (wrappedKey.mWrappedKey.empty()) {
                IMGENC_ERROR_THROW(TransformError(TransformErrorEnum::eCryptoFailure), "empty pkcs1 wrapped key");
            }

            wrappedKeys.push_back(std::move(wrappedKey));
        }
    } catch (const std::exception& e) {
        return {std::vector<WrappedKey>(),
            TransformError(TransformErrorEnum::eCryptoFailure, std::string("malformed pkcs1 annotation: ") + e.what())};
    }

    if (wrappedKeys.empty()) {
        return {wrappedKeys, TransformError(TransformErrorEnum::eCryptoFailure, "pkcs1 annotation has no entries")};
    }

    return wrappedKeys;
}

RetWithError<Bytes> PKCS1KeyWrapper::Wrap(const common::utils::PKeyPtr& pubKey, const Bytes& data) const
{
    if (!IsRSAKey(pubKey)) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "pkcs1 key wrapping requires RSA key")};
    }

    PKeyCtxPtr ctx(EVP_PKEY_CTX_new(pubKey.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        return {Bytes(), CryptoError(common::utils::GetOpensslErrorString())};
    }

    if (auto err = SetOAEPPadding(ctx.get()); !err.IsNone()) {
        return {Bytes(), err};
    }

    size_t outLen = 0;

    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLen, data.data(), data.size()) <= 0) {
        return {Bytes(), CryptoError(common::utils::GetOpensslErrorString())};
    }

    Bytes out(outLen);

    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outLen, data.data(), data.size()) <= 0) {
        return {Bytes(), CryptoError(common::utils::GetOpensslErrorString())};
    }

    out.resize(outLen);

    return out;
}

RetWithError<Bytes> PKCS1KeyWrapper::Unwrap(const common::utils::PKeyPtr& privKey, const WrappedKey& wrappedKey) const
{
    if (wrappedKey.mHash != cHashAlgorithm) {
        return {Bytes(), CryptoError("unsupported pkcs1 hash " + wrappedKey.mHash)};
    }

    PKeyCtxPtr ctx(EVP_PKEY_CTX_new(privKey.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0) {
        return {Bytes(), CryptoError(common::utils::GetOpensslErrorString())};
    }

    if (auto err = SetOAEPPadding(ctx.get()); !err.IsNone()) {
        return {Bytes(), err};
    }

    size_t outLen = 0;

    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outLen, wrappedKey.mWrappedKey.data(), wrappedKey.mWrappedKey.size())
        <= 0) {
        ERR_clear_error();

        return {Bytes(), TransformError(TransformErrorEnum::eDecryptionKeyRequired)};
    }

    Bytes out(outLen);

    if (EVP_PKEY_decrypt(ctx.get(), out.data(), &outLen, wrappedKey.mWrappedKey.data(), wrappedKey.mWrappedKey.size())
        <= 0) {
        ERR_clear_error();

        return {Bytes(), TransformError(TransformErrorEnum::eDecryptionKeyRequired)};
    }

    out.resize(outLen);

    return out;
}

std::string PKCS1KeyWrapper::EncodeEntry(const Bytes& wrappedKey) const
{
    auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    object->set("hash", cHashAlgorithm);
    object->set("wrappedkey", common::utils::Base64Encode(wrappedKey));

    return common::utils::Base64Encode(common::utils::ToBytes(common::utils::Stringify(object)));
}

} // namespace imgenc::encryption::keywrap
