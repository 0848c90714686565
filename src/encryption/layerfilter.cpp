/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>
#include <set>
#include <string>

#include <common/logger/logmodule.hpp>

#include "layerfilter.hpp"

namespace imgenc::encryption {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

LayerFilter SelectDigestSet(std::set<std::string> digests)
{
    auto allowed = std::make_shared<const std::set<std::string>>(std::move(digests));

    return [allowed](const oci::Descriptor& desc) { return allowed->count(desc.mDigest) != 0; };
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

LayerFilter SelectAll()
{
    return [](const oci::Descriptor&) { return true; };
}

LayerFilter SelectDigests(const std::vector<oci::Descriptor>& descs)
{
    std::set<std::string> digests;

    for (const auto& desc : descs) {
        digests.insert(desc.mDigest);
    }

    return SelectDigestSet(std::move(digests));
}

RetWithError<LayerFilter> SelectPlatform(
    const images::ImageWalker& walker, const oci::Descriptor& root, const platforms::Matcher& matcher)
{
    auto [layers, err] = walker.GetImageLayerDescriptors(root);
    if (!err.IsNone()) {
        return {LayerFilter(), err};
    }

    std::set<std::string> digests;

    for (const auto& layer : layers) {
        if (layer.mPlatform.has_value() && matcher.Match(*layer.mPlatform)) {
            digests.insert(layer.mDigest);
        }
    }

    LOG_DBG() << "Layers selected by platform" << Log::Field("root", root.mDigest.c_str())
              << Log::Field("count", digests.size());

    return SelectDigestSet(std::move(digests));
}

RetWithError<LayerFilter> SelectByIndices(
    const images::ImageWalker& walker, const oci::Descriptor& root, const std::vector<int>& indices)
{
    std::set<std::string> digests;

    auto err = walker.Walk(root, [&](const oci::Descriptor& desc) -> RetWithError<images::WalkAction> {
        if (!oci::IsManifestType(desc.mMediaType)) {
            return images::WalkAction::eContinue;
        }

        auto [manifest, readErr] = walker.ReadManifest(desc);
        if (!readErr.IsNone()) {
            return {images::WalkAction::eStop, readErr};
        }

        auto count = static_cast<int>(manifest.mLayers.size());

        for (auto index : indices) {
            auto position = index < 0 ? count + index : index;

            if (position < 0 || position >= count) {
                continue;
            }

            digests.insert(manifest.mLayers[position].mDigest);
        }

        return images::WalkAction::eSkipChildren;
    });
    if (!err.IsNone()) {
        return {LayerFilter(), err};
    }

    return SelectDigestSet(std::move(digests));
}

} // namespace imgenc::encryption
