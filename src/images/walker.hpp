/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_IMAGES_WALKER_HPP_
#define IMGENC_IMAGES_WALKER_HPP_

#include <functional>
#include <vector>

#include <common/ocispec/ocispec.hpp>
#include <content/itf/store.hpp>

namespace imgenc::images {

/**
 * Walk action returned by walk handler.
 */
enum class WalkAction {
    eContinue,
    eSkipChildren,
    eStop,
};

/**
 * Walk handler.
 */
using WalkHandler = std::function<RetWithError<WalkAction>(const oci::Descriptor& desc)>;

/**
 * Descriptor tree walker. Resolves children of image indexes and manifests through the content provider.
 */
class ImageWalker {
public:
    /**
     * Initializes walker.
     *
     * @param provider content provider.
     * @return Error.
     */
    Error Init(content::ProviderItf& provider);

    /**
     * Returns children of descriptor: index manifests, or manifest config followed by layers. Other descriptors have
     * no children.
     *
     * @param desc descriptor.
     * @return RetWithError<std::vector<oci::Descriptor>>.
     */
    RetWithError<std::vector<oci::Descriptor>> Children(const oci::Descriptor& desc) const;

    /**
     * Walks descriptor tree depth first.
     *
     * @param root root descriptor.
     * @param handler walk handler.
     * @return Error.
     */
    Error Walk(const oci::Descriptor& root, const WalkHandler& handler) const;

    /**
     * Reads image manifest.
     *
     * @param desc manifest descriptor.
     * @return RetWithError<oci::ImageManifest>.
     */
    RetWithError<oci::ImageManifest> ReadManifest(const oci::Descriptor& desc) const;

    /**
     * Reads image index.
     *
     * @param desc index descriptor.
     * @return RetWithError<oci::ImageIndex>.
     */
    RetWithError<oci::ImageIndex> ReadIndex(const oci::Descriptor& desc) const;

    /**
     * Reads platform of manifest from its config.
     *
     * @param manifest image manifest.
     * @return RetWithError<std::optional<oci::Platform>> empty if config is not an image config.
     */
    RetWithError<std::optional<oci::Platform>> ReadPlatform(const oci::ImageManifest& manifest) const;

    /**
     * Returns layers of all manifests reachable from root. Every layer gets the platform of its manifest.
     *
     * @param root root descriptor.
     * @return RetWithError<std::vector<oci::Descriptor>>.
     */
    RetWithError<std::vector<oci::Descriptor>> GetImageLayerDescriptors(const oci::Descriptor& root) const;

    /**
     * Checks if any descriptor reachable from root has encrypted layer media type.
     *
     * @param root root descriptor.
     * @return RetWithError<bool>.
     */
    RetWithError<bool> HasEncryptedLayers(const oci::Descriptor& root) const;

private:
    RetWithError<Bytes>      ReadContent(const oci::Descriptor& desc) const;
    RetWithError<WalkAction> WalkRecursive(const oci::Descriptor& desc, const WalkHandler& handler) const;
    Error CollectLayers(const oci::Descriptor& desc, const std::optional<oci::Platform>& platform,
        std::vector<oci::Descriptor>& layers) const;

    content::ProviderItf* mProvider {};
    common::oci::OCISpec  mOCISpec;
};

} // namespace imgenc::images

#endif
