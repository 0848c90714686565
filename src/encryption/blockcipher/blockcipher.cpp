/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/JSON/Object.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

#include "aesctr.hpp"
#include "blockcipher.hpp"

namespace imgenc::encryption::blockcipher {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Poco::JSON::Object CipherOptionsToJSON(const CipherOptions& opts)
{
    Poco::JSON::Object object {Poco::JSON_PRESERVE_KEY_ORDER};

    for (const auto& [name, value] : opts) {
        object.set(name, common::utils::Base64Encode(value));
    }

    return object;
}

Bytes DecodeBase64Field(const std::string& value, const std::string& name)
{
    auto [data, err] = common::utils::Base64Decode(value);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't decode " + name);

    return data;
}

CipherOptions CipherOptionsFromJSON(const common::utils::CaseInsensitiveObjectWrapper& object)
{
    if (!object.Has("cipheroptions")) {
        return {};
    }

    auto          optsObject = object.GetObject("cipheroptions");
    CipherOptions opts;

    for (const auto& name : optsObject.GetNames()) {
        opts.emplace(name, DecodeBase64Field(optsObject.GetValue<std::string>(name), name));
    }

    return opts;
}

common::utils::CaseInsensitiveObjectWrapper ParseOptions(const Bytes& data)
{
    auto [json, err] = common::utils::ParseJson(common::utils::ToString(data));
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't parse options");

    if (json.type() != typeid(Poco::JSON::Object::Ptr)) {
        IMGENC_ERROR_THROW(TransformError(TransformErrorEnum::eCryptoFailure), "options are not a JSON object");
    }

    return common::utils::CaseInsensitiveObjectWrapper(json);
}

Error ToCryptoError(const std::exception& e)
{
    auto err = common::utils::ToError(e, ToErrorEnum(TransformErrorEnum::eCryptoFailure));

    if (IsTransformError(err, TransformErrorEnum::eCryptoFailure)) {
        return err;
    }

    return TransformError(TransformErrorEnum::eCryptoFailure, err.Message());
}

} // namespace

/***********************************************************************************************************************
 * Handler
 **********************************************************************************************************************/

Error Handler::Init()
{
    mCiphers.emplace(cAES256CTR, std::make_unique<AESCTRBlockCipher>());

    return ErrorEnum::eNone;
}

RetWithError<Bytes> Handler::Encrypt(const Bytes& plain, Options& opts)
{
    if (opts.mPublic.mCipherType.empty()) {
        opts.mPublic.mCipherType = cAES256CTR;
    }

    auto [cipher, err] = GetCipher(opts.mPublic.mCipherType);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    return cipher->Encrypt(plain, opts);
}

RetWithError<Bytes> Handler::Decrypt(const Bytes& cipherData, const Options& opts)
{
    auto [cipher, err] = GetCipher(opts.mPublic.mCipherType);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    return cipher->Decrypt(cipherData, opts);
}

RetWithError<BlockCipherItf*> Handler::GetCipher(const std::string& cipherType)
{
    auto it = mCiphers.find(cipherType);
    if (it == mCiphers.end()) {
        return {nullptr, TransformError(TransformErrorEnum::eCryptoFailure, "unsupported cipher " + cipherType)};
    }

    return it->second.get();
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Bytes EncodePublicOptions(const PublicOptions& opts)
{
    auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    object->set("cipher", opts.mCipherType);
    object->set("hmac", common::utils::Base64Encode(opts.mHMAC));
    object->set("cipheroptions", CipherOptionsToJSON(opts.mCipherOptions));

    return common::utils::ToBytes(common::utils::Stringify(object));
}

RetWithError<PublicOptions> DecodePublicOptions(const Bytes& data)
{
    try {
        auto          object = ParseOptions(data);
        PublicOptions opts;

        opts.mCipherType    = object.GetValue<std::string>("cipher");
        opts.mHMAC          = DecodeBase64Field(object.GetValue<std::string>("hmac"), "hmac");
        opts.mCipherOptions = CipherOptionsFromJSON(object);

        if (opts.mCipherType.empty()) {
            IMGENC_ERROR_THROW(TransformError(TransformErrorEnum::eCryptoFailure), "missing cipher type");
        }

        return opts;
    } catch (const std::exception& e) {
        return {PublicOptions(), AOS_ERROR_WRAP(ToCryptoError(e))};
    }
}

Bytes EncodePrivateOptions(const PrivateOptions& opts)
{
    auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    object->set("symkey", common::utils::Base64Encode(opts.mSymmetricKey));
    object->set("cipheroptions", CipherOptionsToJSON(opts.mCipherOptions));

    return common::utils::ToBytes(common::utils::Stringify(object));
}

RetWithError<PrivateOptions> DecodePrivateOptions(const Bytes& data)
{
    try {
        auto           object = ParseOptions(data);
        PrivateOptions opts;

        opts.mSymmetricKey  = DecodeBase64Field(object.GetValue<std::string>("symkey"), "symkey");
        opts.mCipherOptions = CipherOptionsFromJSON(object);

        if (opts.mSymmetricKey.empty()) {
            IMGENC_ERROR_THROW(TransformError(TransformErrorEnum::eCryptoFailure), "missing symmetric key");
        }

        return opts;
    } catch (const std::exception& e) {
        return {PrivateOptions(), AOS_ERROR_WRAP(ToCryptoError(e))};
    }
}

} // namespace imgenc::encryption::blockcipher
