/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <set>

#include "types.hpp"

namespace imgenc::oci {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::set<std::string> cPlainLayerTypes = {
    cMediaTypeImageLayer,
    cMediaTypeImageLayerGzip,
    cMediaTypeImageLayerZstd,
    cMediaTypeImageLayerNonDistributable,
    cMediaTypeImageLayerNonDistributableGzip,
    cMediaTypeImageLayerNonDistributableZstd,
    cMediaTypeDockerSchema2Layer,
    cMediaTypeDockerSchema2LayerGzip,
    cMediaTypeDockerSchema2LayerForeign,
    cMediaTypeDockerSchema2LayerForeignGzip,
};

const std::set<std::string> cEncryptedLayerTypes = {
    cMediaTypeImageLayerEnc,
    cMediaTypeImageLayerGzipEnc,
    cMediaTypeImageLayerZstdEnc,
    cMediaTypeDockerSchema2LayerEnc,
    cMediaTypeDockerSchema2LayerGzipEnc,
};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

bool IsIndexType(const std::string& mediaType)
{
    return mediaType == cMediaTypeImageIndex || mediaType == cMediaTypeDockerSchema2ManifestList;
}

bool IsManifestType(const std::string& mediaType)
{
    return mediaType == cMediaTypeImageManifest || mediaType == cMediaTypeDockerSchema2Manifest;
}

bool IsConfigType(const std::string& mediaType)
{
    return mediaType == cMediaTypeImageConfig || mediaType == cMediaTypeDockerSchema2Config;
}

bool IsLayerType(const std::string& mediaType)
{
    return cPlainLayerTypes.count(mediaType) != 0 || IsEncryptedLayerType(mediaType);
}

bool IsEncryptedLayerType(const std::string& mediaType)
{
    return cEncryptedLayerTypes.count(mediaType) != 0;
}

} // namespace imgenc::oci
