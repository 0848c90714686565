/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>
#include <common/utils/digest.hpp>

#include "keywrap/pkcs1.hpp"
#include "layercrypt.hpp"

namespace imgenc::encryption {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

const std::map<std::string, std::string>& EncryptedMediaTypes()
{
    static const std::map<std::string, std::string> cMediaTypes = {
        {oci::cMediaTypeImageLayer, oci::cMediaTypeImageLayerEnc},
        {oci::cMediaTypeImageLayerGzip, oci::cMediaTypeImageLayerGzipEnc},
        {oci::cMediaTypeImageLayerZstd, oci::cMediaTypeImageLayerZstdEnc},
        {oci::cMediaTypeDockerSchema2Layer, oci::cMediaTypeDockerSchema2LayerEnc},
        {oci::cMediaTypeDockerSchema2LayerGzip, oci::cMediaTypeDockerSchema2LayerGzipEnc},
    };

    return cMediaTypes;
}

void RemoveEncAnnotations(oci::Annotations& annotations)
{
    for (auto it = annotations.begin(); it != annotations.end();) {
        if (it->first.rfind(cAnnotationEncPrefix, 0) == 0) {
            it = annotations.erase(it);
        } else {
            ++it;
        }
    }
}

std::string JoinEntries(const std::vector<std::string>& entries)
{
    std::string result;

    for (const auto& entry : entries) {
        if (!result.empty()) {
            result += ",";
        }

        result += entry;
    }

    return result;
}

void UpdateContent(oci::Descriptor& desc, const std::string& mediaType, const Bytes& data)
{
    desc.mMediaType = mediaType;
    desc.mDigest    = common::utils::CalculateDigest(data);
    desc.mSize      = data.size();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error LayerCryptor::Init()
{
    LOG_DBG() << "Init layer cryptor";

    if (auto err = mCipherHandler.Init(); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return RegisterKeyWrapper(std::make_unique<keywrap::PKCS1KeyWrapper>());
}

Error LayerCryptor::RegisterKeyWrapper(std::unique_ptr<keywrap::KeyWrapperItf> wrapper)
{
    auto annotationID = wrapper->GetAnnotationID();

    if (annotationID.rfind(cAnnotationKeysPrefix, 0) != 0) {
        return Error(ErrorEnum::eInvalidArgument, ("invalid key wrapper annotation " + annotationID).c_str());
    }

    auto scheme = GetSchemeName(annotationID);

    if (mKeyWrappers.count(scheme) != 0) {
        return Error(ErrorEnum::eAlreadyExist, ("key wrapper already registered: " + scheme).c_str());
    }

    LOG_DBG() << "Register key wrapper" << Log::Field("scheme", scheme.c_str());

    mKeyWrappers.emplace(scheme, std::move(wrapper));

    return ErrorEnum::eNone;
}

RetWithError<LayerResult> LayerCryptor::EncryptLayer(
    const EncryptConfig& ec, const Bytes& plain, const oci::Descriptor& desc)
{
    LOG_DBG() << "Encrypt layer" << Log::Field("digest", desc.mDigest.c_str())
              << Log::Field("mediaType", desc.mMediaType.c_str());

    auto [mediaType, err] = GetEncryptedMediaType(desc.mMediaType);
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    blockcipher::Options opts;
    Bytes                cipher;

    Tie(cipher, err) = mCipherHandler.Encrypt(plain, opts);
    if (!err.IsNone()) {
        return {LayerResult(), AOS_ERROR_WRAP(err)};
    }

    oci::Annotations keyAnnotations;

    Tie(keyAnnotations, err) = WrapPrivateOptions(ec, blockcipher::EncodePrivateOptions(opts.mPrivate));
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    LayerResult result {std::move(cipher), desc};

    RemoveEncAnnotations(result.mDescriptor.mAnnotations);
    result.mDescriptor.mAnnotations.insert(keyAnnotations.begin(), keyAnnotations.end());
    result.mDescriptor.mAnnotations[cAnnotationPubOpts]
        = common::utils::Base64Encode(blockcipher::EncodePublicOptions(opts.mPublic));

    UpdateContent(result.mDescriptor, mediaType, result.mData);

    return result;
}

RetWithError<LayerResult> LayerCryptor::DecryptLayer(
    const DecryptConfig& dc, const Bytes& cipher, const oci::Descriptor& desc)
{
    LOG_DBG() << "Decrypt layer" << Log::Field("digest", desc.mDigest.c_str())
              << Log::Field("mediaType", desc.mMediaType.c_str());

    auto [mediaType, err] = GetDecryptedMediaType(desc.mMediaType);
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    auto pubOptsIt = desc.mAnnotations.find(cAnnotationPubOpts);
    if (pubOptsIt == desc.mAnnotations.end()) {
        return {LayerResult(), TransformError(TransformErrorEnum::eCryptoFailure, "layer has no public options")};
    }

    Bytes privOptsData;

    Tie(privOptsData, err) = UnwrapPrivateOptions(dc, desc);
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    Bytes pubOptsData;

    Tie(pubOptsData, err) = common::utils::Base64Decode(pubOptsIt->second);
    if (!err.IsNone()) {
        return {LayerResult(), TransformError(TransformErrorEnum::eCryptoFailure, "can't decode public options")};
    }

    blockcipher::Options opts;

    Tie(opts.mPublic, err) = blockcipher::DecodePublicOptions(pubOptsData);
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    Tie(opts.mPrivate, err) = blockcipher::DecodePrivateOptions(privOptsData);
    if (!err.IsNone()) {
        return {LayerResult(), err};
    }

    Bytes plain;

    Tie(plain, err) = mCipherHandler.Decrypt(cipher, opts);
    if (!err.IsNone()) {
        return {LayerResult(), AOS_ERROR_WRAP(err)};
    }

    LayerResult result {std::move(plain), desc};

    RemoveEncAnnotations(result.mDescriptor.mAnnotations);
    UpdateContent(result.mDescriptor, mediaType, result.mData);

    return result;
}

RetWithError<oci::Descriptor> LayerCryptor::AddRecipients(const EncryptConfig& ec, const oci::Descriptor& desc)
{
    auto [privOptsData, err] = UnwrapPrivateOptions(ec.mDecryptConfig, desc);
    if (IsTransformError(err, TransformErrorEnum::eDecryptionKeyRequired)) {
        LOG_DBG() << "Layer already encrypted, keep recipients" << Log::Field("digest", desc.mDigest.c_str());

        return desc;
    }

    if (!err.IsNone()) {
        return {desc, err};
    }

    auto result = desc;

    for (const auto& [scheme, wrapper] : mKeyWrappers) {
        if (!wrapper->HasRecipients(ec)) {
            continue;
        }

        auto annotationID = wrapper->GetAnnotationID();
        auto it           = result.mAnnotations.find(annotationID);
        auto newConfig    = ec;

        if (it != result.mAnnotations.end()) {
            Tie(newConfig, err) = wrapper->FilterNewRecipients(ec, it->second);
            if (!err.IsNone()) {
                return {desc, AOS_ERROR_WRAP(err)};
            }

            if (!wrapper->HasRecipients(newConfig)) {
                continue;
            }
        }

        std::vector<std::string> entries;

        Tie(entries, err) = wrapper->WrapKeys(newConfig, privOptsData);
        if (!err.IsNone()) {
            return {desc, AOS_ERROR_WRAP(err)};
        }

        LOG_DBG() << "Add layer recipients" << Log::Field("digest", desc.mDigest.c_str())
                  << Log::Field("scheme", scheme.c_str())
                  << Log::Field("count", entries.size());

        if (it != result.mAnnotations.end()) {
            entries.insert(entries.begin(), it->second);
        }

        result.mAnnotations[annotationID] = JoinEntries(entries);
    }

    return result;
}

Error LayerCryptor::CheckLayerAuthorization(const DecryptConfig& dc, const oci::Descriptor& desc)
{
    return UnwrapPrivateOptions(dc, desc).mError;
}

std::vector<std::string> LayerCryptor::GetLayerSchemes(const oci::Descriptor& desc) const
{
    std::vector<std::string> schemes;

    for (const auto& [name, value] : desc.mAnnotations) {
        if (name.rfind(cAnnotationKeysPrefix, 0) == 0) {
            schemes.push_back(GetSchemeName(name));
        }
    }

    return schemes;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<Bytes> LayerCryptor::UnwrapPrivateOptions(const DecryptConfig& dc, const oci::Descriptor& desc)
{
    auto hasWrappedKeys = false;

    for (const auto& [scheme, wrapper] : mKeyWrappers) {
        auto it = desc.mAnnotations.find(wrapper->GetAnnotationID());
        if (it == desc.mAnnotations.end()) {
            continue;
        }

        hasWrappedKeys = true;

        if (wrapper->NoPossibleKeys(dc)) {
            continue;
        }

        auto [privOptsData, err] = wrapper->UnwrapKey(dc, it->second);
        if (err.IsNone()) {
            return privOptsData;
        }

        if (!IsTransformError(err, TransformErrorEnum::eDecryptionKeyRequired)) {
            return {Bytes(), AOS_ERROR_WRAP(err)};
        }

        LOG_DBG() << "No suitable key" << Log::Field("digest", desc.mDigest.c_str())
                  << Log::Field("scheme", scheme.c_str());
    }

    if (!hasWrappedKeys) {
        return {
            Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "layer has no wrapped keys: " + desc.mDigest)};
    }

    return {Bytes(),
        TransformError(TransformErrorEnum::eDecryptionKeyRequired, "missing private key for layer " + desc.mDigest)};
}

RetWithError<oci::Annotations> LayerCryptor::WrapPrivateOptions(const EncryptConfig& ec, const Bytes& privOpts)
{
    oci::Annotations annotations;

    for (const auto& [scheme, wrapper] : mKeyWrappers) {
        if (!wrapper->HasRecipients(ec)) {
            continue;
        }

        auto [entries, err] = wrapper->WrapKeys(ec, privOpts);
        if (!err.IsNone()) {
            return {oci::Annotations(), AOS_ERROR_WRAP(err)};
        }

        annotations.emplace(wrapper->GetAnnotationID(), JoinEntries(entries));
    }

    if (annotations.empty()) {
        return {annotations, Error(ErrorEnum::eInvalidArgument, "no recipients for layer encryption")};
    }

    return annotations;
}

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

RetWithError<std::string> GetEncryptedMediaType(const std::string& mediaType)
{
    const auto& mediaTypes = EncryptedMediaTypes();

    auto it = mediaTypes.find(mediaType);
    if (it == mediaTypes.end()) {
        return {"", Error(ErrorEnum::eNotSupported, ("unsupported layer media type " + mediaType).c_str())};
    }

    return it->second;
}

RetWithError<std::string> GetDecryptedMediaType(const std::string& mediaType)
{
    for (const auto& [plain, encrypted] : EncryptedMediaTypes()) {
        if (encrypted == mediaType) {
            return plain;
        }
    }

    return {"", Error(ErrorEnum::eNotSupported, ("unsupported encrypted layer media type " + mediaType).c_str())};
}

std::string GetSchemeName(const std::string& annotationID)
{
    std::string prefix = cAnnotationKeysPrefix;

    if (annotationID.rfind(prefix, 0) != 0) {
        return annotationID;
    }

    return annotationID.substr(prefix.size());
}

} // namespace imgenc::encryption
