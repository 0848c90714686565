/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_LAYERFILTER_HPP_
#define IMGENC_ENCRYPTION_LAYERFILTER_HPP_

#include <functional>
#include <vector>

#include <common/ocispec/types.hpp>
#include <common/utils/error.hpp>
#include <images/walker.hpp>
#include <platforms/platforms.hpp>

namespace imgenc::encryption {

/**
 * Layer selection predicate. Called once per layer of every visited manifest, the layer descriptor has its platform
 * set to the platform of the manifest it belongs to.
 */
using LayerFilter = std::function<bool(const oci::Descriptor& desc)>;

/**
 * Selects all layers.
 *
 * @return LayerFilter.
 */
LayerFilter SelectAll();

/**
 * Selects layers which digests are in the list.
 *
 * @param descs allowed layer descriptors.
 * @return LayerFilter.
 */
LayerFilter SelectDigests(const std::vector<oci::Descriptor>& descs);

/**
 * Selects layers of manifests matching platform matcher. Layer set is computed once from the image.
 *
 * @param walker image walker.
 * @param root image root descriptor.
 * @param matcher platform matcher.
 * @return RetWithError<LayerFilter>.
 */
RetWithError<LayerFilter> SelectPlatform(
    const images::ImageWalker& walker, const oci::Descriptor& root, const platforms::Matcher& matcher);

/**
 * Selects layers by their position in manifest. Negative index counts from the last layer.
 *
 * @param walker image walker.
 * @param root image root descriptor.
 * @param indices layer indices.
 * @return RetWithError<LayerFilter>.
 */
RetWithError<LayerFilter> SelectByIndices(
    const images::ImageWalker& walker, const oci::Descriptor& root, const std::vector<int>& indices);

} // namespace imgenc::encryption

#endif
