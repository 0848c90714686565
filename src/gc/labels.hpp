/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_GC_LABELS_HPP_
#define IMGENC_GC_LABELS_HPP_

#include <cstddef>
#include <string>

namespace imgenc::gc {

/**
 * Prefix of blob labels referencing other blobs. The label value is the referenced digest.
 */
constexpr auto cLabelRefContent = "imgenc.gc.ref.content";

/**
 * Lease expiration label. The value is a UTC time string.
 */
constexpr auto cLabelExpire = "imgenc.gc.expire";

/**
 * Lease resource type for content blobs.
 */
constexpr auto cResourceContent = "content";

/**
 * Returns reference label for image config.
 *
 * @return std::string.
 */
inline std::string ConfigRefLabel()
{
    return std::string(cLabelRefContent) + ".config";
}

/**
 * Returns reference label for manifest layer.
 *
 * @param index layer index.
 * @return std::string.
 */
inline std::string LayerRefLabel(size_t index)
{
    return std::string(cLabelRefContent) + ".l." + std::to_string(index);
}

/**
 * Returns reference label for index manifest.
 *
 * @param index manifest index.
 * @return std::string.
 */
inline std::string ManifestRefLabel(size_t index)
{
    return std::string(cLabelRefContent) + ".m." + std::to_string(index);
}

/**
 * Checks if label is a content reference.
 *
 * @param label label name.
 * @return bool.
 */
inline bool IsRefLabel(const std::string& label)
{
    return label.rfind(cLabelRefContent, 0) == 0;
}

} // namespace imgenc::gc

#endif
