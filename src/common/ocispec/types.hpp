/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_OCISPEC_TYPES_HPP_
#define IMGENC_COMMON_OCISPEC_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Poco/JSON/Object.h>

namespace imgenc::oci {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * OCI media types.
 */
constexpr auto cMediaTypeImageIndex                    = "application/vnd.oci.image.index.v1+json";
constexpr auto cMediaTypeImageManifest                 = "application/vnd.oci.image.manifest.v1+json";
constexpr auto cMediaTypeImageConfig                   = "application/vnd.oci.image.config.v1+json";
constexpr auto cMediaTypeImageLayer                    = "application/vnd.oci.image.layer.v1.tar";
constexpr auto cMediaTypeImageLayerGzip                = "application/vnd.oci.image.layer.v1.tar+gzip";
constexpr auto cMediaTypeImageLayerZstd                = "application/vnd.oci.image.layer.v1.tar+zstd";
constexpr auto cMediaTypeImageLayerNonDistributable    = "application/vnd.oci.image.layer.nondistributable.v1.tar";
constexpr auto cMediaTypeImageLayerNonDistributableGzip
    = "application/vnd.oci.image.layer.nondistributable.v1.tar+gzip";
constexpr auto cMediaTypeImageLayerNonDistributableZstd
    = "application/vnd.oci.image.layer.nondistributable.v1.tar+zstd";

/**
 * OCI encrypted layer media types.
 */
constexpr auto cMediaTypeImageLayerEnc     = "application/vnd.oci.image.layer.v1.tar+encrypted";
constexpr auto cMediaTypeImageLayerGzipEnc = "application/vnd.oci.image.layer.v1.tar+gzip+encrypted";
constexpr auto cMediaTypeImageLayerZstdEnc = "application/vnd.oci.image.layer.v1.tar+zstd+encrypted";

/**
 * Docker schema 2 media types.
 */
constexpr auto cMediaTypeDockerSchema2Manifest     = "application/vnd.docker.distribution.manifest.v2+json";
constexpr auto cMediaTypeDockerSchema2ManifestList = "application/vnd.docker.distribution.manifest.list.v2+json";
constexpr auto cMediaTypeDockerSchema2Config       = "application/vnd.docker.container.image.v1+json";
constexpr auto cMediaTypeDockerSchema2Layer        = "application/vnd.docker.image.rootfs.diff.tar";
constexpr auto cMediaTypeDockerSchema2LayerGzip    = "application/vnd.docker.image.rootfs.diff.tar.gzip";
constexpr auto cMediaTypeDockerSchema2LayerForeign = "application/vnd.docker.image.rootfs.foreign.diff.tar";
constexpr auto cMediaTypeDockerSchema2LayerForeignGzip
    = "application/vnd.docker.image.rootfs.foreign.diff.tar.gzip";

/**
 * Docker schema 2 encrypted layer media types.
 */
constexpr auto cMediaTypeDockerSchema2LayerEnc     = "application/vnd.docker.image.rootfs.diff.tar.encrypted";
constexpr auto cMediaTypeDockerSchema2LayerGzipEnc = "application/vnd.docker.image.rootfs.diff.tar.gzip+encrypted";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Annotations.
 */
using Annotations = std::map<std::string, std::string>;

/**
 * Platform.
 */
struct Platform {
    std::string              mArchitecture;
    std::string              mOS;
    std::string              mOSVersion;
    std::string              mVariant;
    std::vector<std::string> mOSFeatures;

    bool operator==(const Platform& rhs) const
    {
        return mArchitecture == rhs.mArchitecture && mOS == rhs.mOS && mOSVersion == rhs.mOSVersion
            && mVariant == rhs.mVariant && mOSFeatures == rhs.mOSFeatures;
    }

    bool operator!=(const Platform& rhs) const { return !(*this == rhs); }
};

/**
 * Content descriptor.
 */
struct Descriptor {
    std::string              mMediaType;
    std::string              mDigest;
    uint64_t                 mSize {};
    std::vector<std::string> mURLs;
    Annotations              mAnnotations;
    std::optional<Platform>  mPlatform;
    std::string              mArtifactType;

    bool operator==(const Descriptor& rhs) const
    {
        return mMediaType == rhs.mMediaType && mDigest == rhs.mDigest && mSize == rhs.mSize && mURLs == rhs.mURLs
            && mAnnotations == rhs.mAnnotations && mPlatform == rhs.mPlatform && mArtifactType == rhs.mArtifactType;
    }

    bool operator!=(const Descriptor& rhs) const { return !(*this == rhs); }
};

/**
 * Image manifest.
 */
struct ImageManifest {
    int                     mSchemaVersion = 2;
    std::string             mMediaType;
    Descriptor              mConfig;
    std::vector<Descriptor> mLayers;
    Annotations             mAnnotations;
    // Source document, used to keep unknown fields on re-encoding.
    Poco::JSON::Object::Ptr mRaw;
};

/**
 * Image index (manifest list).
 */
struct ImageIndex {
    int                     mSchemaVersion = 2;
    std::string             mMediaType;
    std::vector<Descriptor> mManifests;
    Annotations             mAnnotations;
    // Source document, used to keep unknown fields on re-encoding.
    Poco::JSON::Object::Ptr mRaw;
};

/**
 * Platform related part of image config.
 */
struct ImageConfig {
    std::string              mArchitecture;
    std::string              mOS;
    std::string              mOSVersion;
    std::string              mVariant;
    std::vector<std::string> mOSFeatures;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Checks if media type is an image index or manifest list.
 *
 * @param mediaType media type.
 * @return bool.
 */
bool IsIndexType(const std::string& mediaType);

/**
 * Checks if media type is an image manifest.
 *
 * @param mediaType media type.
 * @return bool.
 */
bool IsManifestType(const std::string& mediaType);

/**
 * Checks if media type is an image config.
 *
 * @param mediaType media type.
 * @return bool.
 */
bool IsConfigType(const std::string& mediaType);

/**
 * Checks if media type is a layer, either plain or encrypted.
 *
 * @param mediaType media type.
 * @return bool.
 */
bool IsLayerType(const std::string& mediaType);

/**
 * Checks if media type is an encrypted layer.
 *
 * @param mediaType media type.
 * @return bool.
 */
bool IsEncryptedLayerType(const std::string& mediaType);

} // namespace imgenc::oci

#endif
