/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "walker.hpp"

namespace imgenc::images {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ImageWalker::Init(content::ProviderItf& provider)
{
    mProvider = &provider;

    return ErrorEnum::eNone;
}

RetWithError<std::vector<oci::Descriptor>> ImageWalker::Children(const oci::Descriptor& desc) const
{
    if (oci::IsIndexType(desc.mMediaType)) {
        auto [index, err] = ReadIndex(desc);
        if (!err.IsNone()) {
            return {std::vector<oci::Descriptor>(), err};
        }

        return index.mManifests;
    }

    if (oci::IsManifestType(desc.mMediaType)) {
        auto [manifest, err] = ReadManifest(desc);
        if (!err.IsNone()) {
            return {std::vector<oci::Descriptor>(), err};
        }

        std::vector<oci::Descriptor> children;

        children.reserve(manifest.mLayers.size() + 1);
        children.push_back(manifest.mConfig);
        children.insert(children.end(), manifest.mLayers.begin(), manifest.mLayers.end());

        return children;
    }

    return std::vector<oci::Descriptor>();
}

Error ImageWalker::Walk(const oci::Descriptor& root, const WalkHandler& handler) const
{
    return WalkRecursive(root, handler).mError;
}

RetWithError<oci::ImageManifest> ImageWalker::ReadManifest(const oci::Descriptor& desc) const
{
    auto [data, err] = ReadContent(desc);
    if (!err.IsNone()) {
        return {oci::ImageManifest(), err};
    }

    oci::ImageManifest manifest;

    if (err = mOCISpec.DecodeImageManifest(data, manifest); !err.IsNone()) {
        return {oci::ImageManifest(), Error(err, ("can't decode manifest " + desc.mDigest).c_str())};
    }

    return manifest;
}

RetWithError<oci::ImageIndex> ImageWalker::ReadIndex(const oci::Descriptor& desc) const
{
    auto [data, err] = ReadContent(desc);
    if (!err.IsNone()) {
        return {oci::ImageIndex(), err};
    }

    oci::ImageIndex index;

    if (err = mOCISpec.DecodeImageIndex(data, index); !err.IsNone()) {
        return {oci::ImageIndex(), Error(err, ("can't decode index " + desc.mDigest).c_str())};
    }

    return index;
}

RetWithError<std::optional<oci::Platform>> ImageWalker::ReadPlatform(const oci::ImageManifest& manifest) const
{
    if (!oci::IsConfigType(manifest.mConfig.mMediaType)) {
        return std::optional<oci::Platform>();
    }

    auto [data, err] = ReadContent(manifest.mConfig);
    if (!err.IsNone()) {
        return {std::optional<oci::Platform>(), err};
    }

    oci::ImageConfig config;

    if (err = mOCISpec.DecodeImageConfig(data, config); !err.IsNone()) {
        return {std::optional<oci::Platform>(), err};
    }

    return std::optional<oci::Platform>(
        oci::Platform {config.mArchitecture, config.mOS, config.mOSVersion, config.mVariant, config.mOSFeatures});
}

RetWithError<std::vector<oci::Descriptor>> ImageWalker::GetImageLayerDescriptors(const oci::Descriptor& root) const
{
    std::vector<oci::Descriptor> layers;

    if (auto err = CollectLayers(root, root.mPlatform, layers); !err.IsNone()) {
        return {std::vector<oci::Descriptor>(), err};
    }

    return layers;
}

RetWithError<bool> ImageWalker::HasEncryptedLayers(const oci::Descriptor& root) const
{
    bool found = false;

    auto err = Walk(root, [&found](const oci::Descriptor& desc) -> RetWithError<WalkAction> {
        if (oci::IsEncryptedLayerType(desc.mMediaType)) {
            found = true;

            return WalkAction::eStop;
        }

        return WalkAction::eContinue;
    });
    if (!err.IsNone()) {
        return {false, err};
    }

    return found;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<Bytes> ImageWalker::ReadContent(const oci::Descriptor& desc) const
{
    if (!mProvider) {
        return {Bytes(), Error(ErrorEnum::eFailed, "walker is not initialized")};
    }

    auto [data, err] = mProvider->ReadBlob(desc.mDigest);
    if (!err.IsNone()) {
        return {Bytes(), AOS_ERROR_WRAP(err)};
    }

    return data;
}

RetWithError<WalkAction> ImageWalker::WalkRecursive(const oci::Descriptor& desc, const WalkHandler& handler) const
{
    auto [action, err] = handler(desc);
    if (!err.IsNone()) {
        return {WalkAction::eStop, err};
    }

    if (action != WalkAction::eContinue) {
        return action;
    }

    std::vector<oci::Descriptor> children;

    Tie(children, err) = Children(desc);
    if (!err.IsNone()) {
        return {WalkAction::eStop, err};
    }

    for (const auto& child : children) {
        WalkAction childAction;

        Tie(childAction, err) = WalkRecursive(child, handler);
        if (!err.IsNone()) {
            return {WalkAction::eStop, err};
        }

        if (childAction == WalkAction::eStop) {
            return WalkAction::eStop;
        }
    }

    return WalkAction::eContinue;
}

Error ImageWalker::CollectLayers(const oci::Descriptor& desc, const std::optional<oci::Platform>& platform,
    std::vector<oci::Descriptor>& layers) const
{
    if (oci::IsIndexType(desc.mMediaType)) {
        auto [index, err] = ReadIndex(desc);
        if (!err.IsNone()) {
            return err;
        }

        for (const auto& manifest : index.mManifests) {
            if (err = CollectLayers(manifest, manifest.mPlatform, layers); !err.IsNone()) {
                return err;
            }
        }

        return ErrorEnum::eNone;
    }

    if (!oci::IsManifestType(desc.mMediaType)) {
        return ErrorEnum::eNone;
    }

    auto [manifest, err] = ReadManifest(desc);
    if (!err.IsNone()) {
        return err;
    }

    auto manifestPlatform = platform;

    if (!manifestPlatform.has_value()) {
        Tie(manifestPlatform, err) = ReadPlatform(manifest);
        if (!err.IsNone()) {
            return err;
        }
    }

    for (auto layer : manifest.mLayers) {
        if (!oci::IsLayerType(layer.mMediaType)) {
            continue;
        }

        layer.mPlatform = manifestPlatform;
        layers.push_back(std::move(layer));
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::images
