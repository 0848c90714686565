/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <functional>
#include <future>

#include <common/logger/logmodule.hpp>
#include <common/utils/digest.hpp>
#include <common/utils/exception.hpp>
#include <gc/labels.hpp>

#include "imageencryptor.hpp"

namespace imgenc::encryption {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

using NodeTransform = std::function<RetWithError<TransformResult>(const oci::Descriptor& desc)>;

RetWithError<std::vector<TransformResult>> TransformNodes(
    const std::vector<oci::Descriptor>& descs, size_t maxConcurrent, const NodeTransform& transform)
{
    std::vector<TransformResult> results;

    results.reserve(descs.size());

    for (size_t start = 0; start < descs.size(); start += maxConcurrent) {
        auto  end      = std::min(descs.size(), start + maxConcurrent);
        Error firstErr = ErrorEnum::eNone;

        std::vector<std::future<RetWithError<TransformResult>>> futures;

        try {
            for (size_t i = start; i < end; i++) {
                futures.push_back(std::async(std::launch::async, transform, std::cref(descs[i])));
            }
        } catch (const std::exception& e) {
            firstErr = AOS_ERROR_WRAP(common::utils::ToError(e));
        }

        // All started transforms are joined before the wave result is inspected.
        for (auto& future : futures) {
            try {
                auto result = future.get();

                if (!result.mError.IsNone() && firstErr.IsNone()) {
                    firstErr = result.mError;
                }

                results.push_back(std::move(result.mValue));
            } catch (const std::exception& e) {
                if (firstErr.IsNone()) {
                    firstErr = AOS_ERROR_WRAP(common::utils::ToError(e));
                }
            }
        }

        if (!firstErr.IsNone()) {
            return {std::vector<TransformResult>(), firstErr};
        }
    }

    return results;
}

bool IsAnyModified(const std::vector<TransformResult>& results)
{
    return std::any_of(
        results.begin(), results.end(), [](const TransformResult& result) { return result.mModified; });
}

oci::Descriptor UpdateDescriptor(const oci::Descriptor& desc, const Bytes& data)
{
    auto result = desc;

    result.mDigest = common::utils::CalculateDigest(data);
    result.mSize   = data.size();

    return result;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ImageEncryptor::Init(content::StoreItf& store, leases::ManagerItf& leaseManager, size_t maxConcurrentTransforms)
{
    LOG_DBG() << "Init image encryptor" << Log::Field("maxConcurrentTransforms", maxConcurrentTransforms);

    if (maxConcurrentTransforms == 0) {
        return Error(ErrorEnum::eInvalidArgument, "max concurrent transforms should be positive");
    }

    mStore                   = &store;
    mLeaseManager            = &leaseManager;
    mMaxConcurrentTransforms = maxConcurrentTransforms;

    if (auto err = mWalker.Init(store); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mCryptor.Init(); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<TransformResult> ImageEncryptor::Transform(common::utils::Context& ctx, const leases::Lease& lease,
    const oci::Descriptor& root, Direction direction, const CryptoConfig& cc, const LayerFilter& filter)
{
    LOG_INF() << "Transform image" << Log::Field("root", root.mDigest.c_str())
              << Log::Field("direction", direction == Direction::eEncrypt ? "encrypt" : "decrypt")
              << Log::Field("lease", lease.mID.c_str());

    if (!mStore || !mLeaseManager) {
        return {TransformResult {root}, Error(ErrorEnum::eFailed, "image encryptor is not initialized")};
    }

    if (direction == Direction::eEncrypt && !cc.mEncryptConfig.has_value()) {
        return {TransformResult {root}, Error(ErrorEnum::eInvalidArgument, "encryption config is not set")};
    }

    if (direction == Direction::eDecrypt && !cc.mDecryptConfig.has_value()) {
        return {TransformResult {root}, Error(ErrorEnum::eInvalidArgument, "decryption config is not set")};
    }

    if (!filter) {
        return {TransformResult {root}, Error(ErrorEnum::eInvalidArgument, "layer filter is not set")};
    }

    TransformContext tc {ctx, lease, direction, cc, filter};

    auto [result, err] = CryptImage(tc, root);
    if (!err.IsNone()) {
        LOG_ERR() << "Can't transform image" << Log::Field("root", root.mDigest.c_str()) << Log::Field(err);

        return {TransformResult {root}, err};
    }

    result.mModified = result.mDescriptor.mDigest != root.mDigest;

    LOG_INF() << "Image transformed" << Log::Field("root", result.mDescriptor.mDigest.c_str())
              << Log::Field("modified", result.mModified);

    return result;
}

Error ImageEncryptor::CheckAuthorization(
    common::utils::Context& ctx, const oci::Descriptor& root, const DecryptConfig& dc)
{
    LOG_DBG() << "Check image authorization" << Log::Field("root", root.mDigest.c_str());

    auto [layers, err] = mWalker.GetImageLayerDescriptors(root);
    if (!err.IsNone()) {
        return err;
    }

    for (const auto& layer : layers) {
        if (err = ctx.Err(); !err.IsNone()) {
            return err;
        }

        if (!oci::IsEncryptedLayerType(layer.mMediaType)) {
            continue;
        }

        if (err = mCryptor.CheckLayerAuthorization(dc, layer); !err.IsNone()) {
            return err;
        }
    }

    return ErrorEnum::eNone;
}

RetWithError<std::vector<LayerInfo>> ImageEncryptor::GetImageLayerInfo(const oci::Descriptor& root)
{
    std::vector<LayerInfo> layers;

    auto err = mWalker.Walk(root, [this, &layers](const oci::Descriptor& desc) -> RetWithError<images::WalkAction> {
        if (!oci::IsManifestType(desc.mMediaType)) {
            return images::WalkAction::eContinue;
        }

        auto [manifest, readErr] = mWalker.ReadManifest(desc);
        if (!readErr.IsNone()) {
            return {images::WalkAction::eStop, readErr};
        }

        auto platform = desc.mPlatform;

        if (!platform.has_value()) {
            Tie(platform, readErr) = mWalker.ReadPlatform(manifest);
            if (!readErr.IsNone()) {
                return {images::WalkAction::eStop, readErr};
            }
        }

        for (size_t i = 0; i < manifest.mLayers.size(); i++) {
            const auto& layer = manifest.mLayers[i];

            layers.push_back({i, layer, platform, mCryptor.GetLayerSchemes(layer)});
        }

        return images::WalkAction::eSkipChildren;
    });
    if (!err.IsNone()) {
        return {std::vector<LayerInfo>(), err};
    }

    return layers;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<TransformResult> ImageEncryptor::CryptImage(const TransformContext& tc, const oci::Descriptor& desc)
{
    if (oci::IsIndexType(desc.mMediaType)) {
        return CryptIndex(tc, desc);
    }

    if (oci::IsManifestType(desc.mMediaType)) {
        return CryptManifest(tc, desc, desc.mPlatform);
    }

    return {TransformResult {desc},
        Error(ErrorEnum::eNotSupported, ("unsupported image media type " + desc.mMediaType).c_str())};
}

RetWithError<TransformResult> ImageEncryptor::CryptIndex(const TransformContext& tc, const oci::Descriptor& desc)
{
    if (auto err = tc.mCtx.Err(); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    LOG_DBG() << "Transform index" << Log::Field("digest", desc.mDigest.c_str());

    auto [index, err] = mWalker.ReadIndex(desc);
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    std::vector<TransformResult> children;

    Tie(children, err) = TransformNodes(
        index.mManifests, mMaxConcurrentTransforms, [this, &tc](const oci::Descriptor& child) {
            if (oci::IsIndexType(child.mMediaType) || oci::IsManifestType(child.mMediaType)) {
                return CryptImage(tc, child);
            }

            return RetWithError<TransformResult>(TransformResult {child});
        });
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    if (err = tc.mCtx.Err(); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    if (!IsAnyModified(children)) {
        return TransformResult {desc};
    }

    content::Labels labels;

    for (size_t i = 0; i < children.size(); i++) {
        index.mManifests[i] = children[i].mDescriptor;
        labels.emplace(gc::ManifestRefLabel(i), children[i].mDescriptor.mDigest);
    }

    Bytes data;

    if (err = mOCISpec.EncodeImageIndex(index, data); !err.IsNone()) {
        return {TransformResult {desc}, AOS_ERROR_WRAP(err)};
    }

    auto newDesc = UpdateDescriptor(desc, data);

    if (err = WriteContent(tc, newDesc, data, labels); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    return TransformResult {newDesc, true};
}

RetWithError<TransformResult> ImageEncryptor::CryptManifest(
    const TransformContext& tc, const oci::Descriptor& desc, const std::optional<oci::Platform>& platform)
{
    if (auto err = tc.mCtx.Err(); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    LOG_DBG() << "Transform manifest" << Log::Field("digest", desc.mDigest.c_str());

    auto [manifest, err] = mWalker.ReadManifest(desc);
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    auto manifestPlatform = platform;

    if (!manifestPlatform.has_value()) {
        Tie(manifestPlatform, err) = mWalker.ReadPlatform(manifest);
        if (!err.IsNone()) {
            return {TransformResult {desc}, err};
        }
    }

    std::vector<TransformResult> layers;

    auto cryptLayer = [this, &tc, &manifestPlatform](const oci::Descriptor& layer) {
        return CryptLayer(tc, layer, manifestPlatform);
    };

    Tie(layers, err) = TransformNodes(manifest.mLayers, mMaxConcurrentTransforms, cryptLayer);
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    if (err = tc.mCtx.Err(); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    if (!IsAnyModified(layers)) {
        return TransformResult {desc};
    }

    content::Labels labels;

    labels.emplace(gc::ConfigRefLabel(), manifest.mConfig.mDigest);

    for (size_t i = 0; i < layers.size(); i++) {
        manifest.mLayers[i] = layers[i].mDescriptor;
        labels.emplace(gc::LayerRefLabel(i), layers[i].mDescriptor.mDigest);
    }

    Bytes data;

    if (err = mOCISpec.EncodeImageManifest(manifest, data); !err.IsNone()) {
        return {TransformResult {desc}, AOS_ERROR_WRAP(err)};
    }

    auto newDesc = UpdateDescriptor(desc, data);

    if (err = WriteContent(tc, newDesc, data, labels); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    return TransformResult {newDesc, true};
}

RetWithError<TransformResult> ImageEncryptor::CryptLayer(
    const TransformContext& tc, const oci::Descriptor& desc, const std::optional<oci::Platform>& platform)
{
    if (auto err = tc.mCtx.Err(); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    auto selected = desc;

    selected.mPlatform = platform;

    if (!tc.mFilter(selected)) {
        return TransformResult {desc};
    }

    auto encrypted = oci::IsEncryptedLayerType(desc.mMediaType);

    if (tc.mDirection == Direction::eDecrypt) {
        if (!encrypted) {
            return TransformResult {desc};
        }

        auto [data, err] = ReadLayer(desc);
        if (!err.IsNone()) {
            return {TransformResult {desc}, err};
        }

        LayerResult layer;

        Tie(layer, err) = mCryptor.DecryptLayer(*tc.mConfig.mDecryptConfig, data, desc);
        if (!err.IsNone()) {
            return {TransformResult {desc}, err};
        }

        if (err = WriteContent(tc, layer.mDescriptor, layer.mData); !err.IsNone()) {
            return {TransformResult {desc}, err};
        }

        return TransformResult {layer.mDescriptor, true};
    }

    const auto& ec = *tc.mConfig.mEncryptConfig;

    if (encrypted) {
        auto [newDesc, err] = mCryptor.AddRecipients(ec, desc);
        if (!err.IsNone()) {
            return {TransformResult {desc}, err};
        }

        return TransformResult {newDesc, newDesc != desc};
    }

    if (!GetEncryptedMediaType(desc.mMediaType).mError.IsNone()) {
        LOG_DBG() << "Skip layer" << Log::Field("digest", desc.mDigest.c_str())
                  << Log::Field("mediaType", desc.mMediaType.c_str());

        return TransformResult {desc};
    }

    auto [data, err] = ReadLayer(desc);
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    LayerResult layer;

    Tie(layer, err) = mCryptor.EncryptLayer(ec, data, desc);
    if (!err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    if (err = WriteContent(tc, layer.mDescriptor, layer.mData); !err.IsNone()) {
        return {TransformResult {desc}, err};
    }

    return TransformResult {layer.mDescriptor, true};
}

RetWithError<Bytes> ImageEncryptor::ReadLayer(const oci::Descriptor& desc)
{
    auto [data, err] = mStore->ReadBlob(desc.mDigest);
    if (!err.IsNone()) {
        return {Bytes(), AOS_ERROR_WRAP(err)};
    }

    if (err = common::utils::VerifyDigest(desc.mDigest, data); !err.IsNone()) {
        return {Bytes(), TransformError(TransformErrorEnum::eCryptoFailure, "layer digest mismatch " + desc.mDigest)};
    }

    return data;
}

Error ImageEncryptor::WriteContent(
    const TransformContext& tc, const oci::Descriptor& desc, const Bytes& data, const content::Labels& labels)
{
    LOG_DBG() << "Write content" << Log::Field("digest", desc.mDigest.c_str())
              << Log::Field("mediaType", desc.mMediaType.c_str());

    if (auto err = mLeaseManager->AddResource(tc.mLease, {desc.mDigest, gc::cResourceContent}); !err.IsNone()) {
        return TransformError(
            TransformErrorEnum::eWriteFailure, std::string("can't add lease resource: ") + err.Message());
    }

    if (auto err = mStore->WriteBlob(desc, data, labels); !err.IsNone()) {
        return TransformError(
            TransformErrorEnum::eWriteFailure, "can't write content " + desc.mDigest + ": " + err.Message());
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

RetWithError<TransformResult> EncryptImage(common::utils::Context& ctx, content::StoreItf& store,
    leases::ManagerItf& leaseManager, const leases::Lease& lease, const oci::Descriptor& root, const CryptoConfig& cc,
    const LayerFilter& filter)
{
    ImageEncryptor encryptor;

    if (auto err = encryptor.Init(store, leaseManager); !err.IsNone()) {
        return {TransformResult {root}, err};
    }

    return encryptor.Transform(ctx, lease, root, Direction::eEncrypt, cc, filter);
}

RetWithError<TransformResult> DecryptImage(common::utils::Context& ctx, content::StoreItf& store,
    leases::ManagerItf& leaseManager, const leases::Lease& lease, const oci::Descriptor& root, const CryptoConfig& cc,
    const LayerFilter& filter)
{
    ImageEncryptor encryptor;

    if (auto err = encryptor.Init(store, leaseManager); !err.IsNone()) {
        return {TransformResult {root}, err};
    }

    return encryptor.Transform(ctx, lease, root, Direction::eDecrypt, cc, filter);
}

} // namespace imgenc::encryption
