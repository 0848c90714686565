/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

#include <Poco/Environment.h>
#include <Poco/String.h>

#include <common/utils/utils.hpp>

#include "platforms.hpp"

namespace imgenc::platforms {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::pair<std::string, std::string> NormalizeArch(const std::string& arch, const std::string& variant)
{
    auto lowerArch    = Poco::toLower(arch);
    auto lowerVariant = Poco::toLower(variant);

    if (lowerArch == "i386") {
        return {"386", ""};
    }

    if (lowerArch == "x86_64" || lowerArch == "x86-64" || lowerArch == "amd64") {
        return {"amd64", lowerVariant == "v1" ? "" : lowerVariant};
    }

    if (lowerArch == "aarch64" || lowerArch == "arm64") {
        return {"arm64", (lowerVariant == "8" || lowerVariant == "v8") ? "" : lowerVariant};
    }

    if (lowerArch == "armhf") {
        return {"arm", "v7"};
    }

    if (lowerArch == "armel") {
        return {"arm", "v6"};
    }

    if (lowerArch == "arm") {
        if (lowerVariant.empty() || lowerVariant == "7") {
            return {"arm", "v7"};
        }

        if (lowerVariant == "5" || lowerVariant == "6" || lowerVariant == "8") {
            return {"arm", "v" + lowerVariant};
        }
    }

    return {lowerArch, lowerVariant};
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<oci::Platform> Parse(const std::string& specifier)
{
    auto parts = common::utils::Split(specifier, "/");

    if (parts.empty() || parts.size() > 3 || specifier.find("//") != std::string::npos) {
        return {oci::Platform(), Error(ErrorEnum::eInvalidArgument, ("invalid platform " + specifier).c_str())};
    }

    oci::Platform platform;

    platform.mOS = parts[0];

    if (parts.size() > 1) {
        platform.mArchitecture = parts[1];
    } else {
        platform.mArchitecture = Default().mArchitecture;
    }

    if (parts.size() > 2) {
        platform.mVariant = parts[2];
    }

    return Normalize(platform);
}

oci::Platform Normalize(const oci::Platform& platform)
{
    auto normalized = platform;

    normalized.mOS = Poco::toLower(platform.mOS);

    if (normalized.mOS == "macos") {
        normalized.mOS = "darwin";
    }

    std::tie(normalized.mArchitecture, normalized.mVariant) = NormalizeArch(platform.mArchitecture, platform.mVariant);

    return normalized;
}

std::string Format(const oci::Platform& platform)
{
    auto str = platform.mOS.empty() ? std::string("unknown") : platform.mOS;

    str += "/" + platform.mArchitecture;

    if (!platform.mVariant.empty()) {
        str += "/" + platform.mVariant;
    }

    return str;
}

oci::Platform Default()
{
    oci::Platform platform;

    platform.mOS           = Poco::Environment::osName();
    platform.mArchitecture = Poco::Environment::osArchitecture();

    return Normalize(platform);
}

Matcher::Matcher(const oci::Platform& platform)
    : mPlatforms {Normalize(platform)}
{
}

Matcher::Matcher(const std::vector<oci::Platform>& platforms)
{
    std::transform(platforms.begin(), platforms.end(), std::back_inserter(mPlatforms), Normalize);
}

bool Matcher::Match(const oci::Platform& platform) const
{
    auto normalized = Normalize(platform);

    return std::any_of(mPlatforms.begin(), mPlatforms.end(), [&normalized](const oci::Platform& expected) {
        if (expected.mOS != normalized.mOS || expected.mArchitecture != normalized.mArchitecture) {
            return false;
        }

        return expected.mVariant.empty() || normalized.mVariant.empty() || expected.mVariant == normalized.mVariant;
    });
}

} // namespace imgenc::platforms
