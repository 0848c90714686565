/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_PLATFORMS_PLATFORMS_HPP_
#define IMGENC_PLATFORMS_PLATFORMS_HPP_

#include <string>
#include <vector>

#include <common/ocispec/types.hpp>
#include <common/utils/error.hpp>

namespace imgenc::platforms {

/**
 * Parses platform specifier in form "os", "os/arch" or "os/arch/variant". The result is normalized.
 *
 * @param specifier platform specifier.
 * @return RetWithError<oci::Platform>.
 */
RetWithError<oci::Platform> Parse(const std::string& specifier);

/**
 * Normalizes platform: lower case, canonical architecture and variant names.
 *
 * @param platform platform.
 * @return oci::Platform.
 */
oci::Platform Normalize(const oci::Platform& platform);

/**
 * Formats platform as "os/arch[/variant]".
 *
 * @param platform platform.
 * @return std::string.
 */
std::string Format(const oci::Platform& platform);

/**
 * Returns platform of the running host.
 *
 * @return oci::Platform.
 */
oci::Platform Default();

/**
 * Platform matcher.
 */
class Matcher {
public:
    /**
     * Creates matcher for single platform.
     *
     * @param platform platform to match.
     */
    explicit Matcher(const oci::Platform& platform);

    /**
     * Creates matcher for any of platforms.
     *
     * @param platforms platforms to match.
     */
    explicit Matcher(const std::vector<oci::Platform>& platforms);

    /**
     * Checks if platform matches. OS and architecture must be equal, variant must be equal if both are set.
     *
     * @param platform platform.
     * @return bool.
     */
    bool Match(const oci::Platform& platform) const;

private:
    std::vector<oci::Platform> mPlatforms;
};

} // namespace imgenc::platforms

#endif
