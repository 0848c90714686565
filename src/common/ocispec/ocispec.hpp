/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_OCISPEC_OCISPEC_HPP_
#define IMGENC_COMMON_OCISPEC_OCISPEC_HPP_

#include <common/utils/error.hpp>
#include <common/utils/utils.hpp>

#include "types.hpp"

namespace imgenc::common::oci {

/**
 * OCI spec codec. Decoding failures are reported as TransformErrorEnum::eMalformedManifest.
 */
class OCISpec {
public:
    /**
     * Decodes OCI image index or Docker manifest list.
     *
     * @param data encoded document.
     * @param[out] index image index.
     * @return Error.
     */
    Error DecodeImageIndex(const Bytes& data, imgenc::oci::ImageIndex& index) const;

    /**
     * Encodes image index.
     *
     * @param index image index.
     * @param[out] data encoded document.
     * @return Error.
     */
    Error EncodeImageIndex(const imgenc::oci::ImageIndex& index, Bytes& data) const;

    /**
     * Decodes OCI or Docker image manifest.
     *
     * @param data encoded document.
     * @param[out] manifest image manifest.
     * @return Error.
     */
    Error DecodeImageManifest(const Bytes& data, imgenc::oci::ImageManifest& manifest) const;

    /**
     * Encodes image manifest.
     *
     * @param manifest image manifest.
     * @param[out] data encoded document.
     * @return Error.
     */
    Error EncodeImageManifest(const imgenc::oci::ImageManifest& manifest, Bytes& data) const;

    /**
     * Decodes platform part of image config.
     *
     * @param data encoded document.
     * @param[out] imageConfig image config.
     * @return Error.
     */
    Error DecodeImageConfig(const Bytes& data, imgenc::oci::ImageConfig& imageConfig) const;

    /**
     * Encodes image config.
     *
     * @param imageConfig image config.
     * @param[out] data encoded document.
     * @return Error.
     */
    Error EncodeImageConfig(const imgenc::oci::ImageConfig& imageConfig, Bytes& data) const;
};

} // namespace imgenc::common::oci

#endif
