/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>

#include <common/utils/exception.hpp>
#include <leases/leaseguard.hpp>
#include <platforms/platforms.hpp>

#include "imgenccore.hpp"

namespace imgenc::core {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void ImageEncCore::Init(const std::string& configFile)
{
    auto config = std::make_unique<config::Config>();

    auto err = config::ParseConfig(configFile.empty() ? cDefaultConfigFile : configFile, *config);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't parse config");

    Init(*config);
}

void ImageEncCore::Init(const config::Config& config)
{
    mConfig = config;

    mLogger.SetBackend(mConfig.mLogging.mBackend);
    mLogger.SetLogLevel(mConfig.mLogging.mLevel);

    auto err = mLogger.Init();
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize logger");

    LOG_INF() << "Init image encryption core" << Log::Field("workingDir", mConfig.mWorkingDir.c_str());

    // Initialize content store

    err = mContentStore.Init(mConfig.mContentDir);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize content store");

    // Initialize garbage collector

    err = mCollector.Init(mConfig.mGC, mContentStore, mLeaseManager, mImageStore);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize garbage collector");

    // Initialize lease manager

    err = mLeaseManager.Init(mCollector);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize lease manager");

    // Initialize image store

    err = mImageStore.Init(mCollector);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize image store");

    // Initialize image walker

    err = mWalker.Init(mContentStore);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize image walker");

    // Initialize image encryptor

    err = mImageEncryptor.Init(mContentStore, mLeaseManager, mConfig.mMaxConcurrentTransforms);
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't initialize image encryptor");
}

void ImageEncCore::Start()
{
    auto err = mCollector.Start();
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't start garbage collector");

    mCleanupManager.AddCleanup([this]() {
        if (auto err = mCollector.Stop(); !err.IsNone()) {
            LOG_ERR() << "Can't stop garbage collector" << Log::Field(err);
        }
    });
}

void ImageEncCore::Stop()
{
    mCleanupManager.ExecuteCleanups();
}

RetWithError<encryption::TransformResult> ImageEncCore::EncryptImage(common::utils::Context& ctx,
    const std::string& name, const std::string& newName, const encryption::CryptoConfig& cc,
    const std::vector<std::string>& platforms)
{
    return TransformImage(ctx, name, newName, encryption::Direction::eEncrypt, cc, platforms);
}

RetWithError<encryption::TransformResult> ImageEncCore::DecryptImage(common::utils::Context& ctx,
    const std::string& name, const std::string& newName, const encryption::CryptoConfig& cc,
    const std::vector<std::string>& platforms)
{
    return TransformImage(ctx, name, newName, encryption::Direction::eDecrypt, cc, platforms);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<encryption::TransformResult> ImageEncCore::TransformImage(common::utils::Context& ctx,
    const std::string& name, const std::string& newName, encryption::Direction direction,
    const encryption::CryptoConfig& cc, const std::vector<std::string>& platforms)
{
    auto [image, err] = mImageStore.Get(name);
    if (!err.IsNone()) {
        return {encryption::TransformResult(), err};
    }

    leases::LeaseGuard lease(mLeaseManager);

    if (err = lease.Acquire(mConfig.mLeaseExpiration); !err.IsNone()) {
        return {encryption::TransformResult {image.mTarget}, err};
    }

    encryption::LayerFilter filter;

    Tie(filter, err) = CreateFilter(image.mTarget, platforms);
    if (!err.IsNone()) {
        return {encryption::TransformResult {image.mTarget}, err};
    }

    encryption::TransformResult result;

    Tie(result, err) = mImageEncryptor.Transform(ctx, lease.GetLease(), image.mTarget, direction, cc, filter);
    if (!err.IsNone()) {
        return {encryption::TransformResult {image.mTarget}, err};
    }

    if (result.mModified || (!newName.empty() && newName != name)) {
        if (err = RegisterImage(image, newName, result.mDescriptor); !err.IsNone()) {
            return {result, err};
        }
    }

    if (err = lease.Release(); !err.IsNone()) {
        return {result, err};
    }

    return result;
}

RetWithError<encryption::LayerFilter> ImageEncCore::CreateFilter(
    const oci::Descriptor& root, const std::vector<std::string>& platforms)
{
    if (platforms.empty()) {
        return encryption::SelectAll();
    }

    std::vector<oci::Platform> parsed;

    for (const auto& specifier : platforms) {
        auto [platform, err] = platforms::Parse(specifier);
        if (!err.IsNone()) {
            return {encryption::LayerFilter(), err};
        }

        parsed.push_back(platform);
    }

    return encryption::SelectPlatform(mWalker, root, platforms::Matcher(parsed));
}

Error ImageEncCore::RegisterImage(
    const images::Image& source, const std::string& newName, const oci::Descriptor& target)
{
    auto image = source;

    image.mName   = newName.empty() ? source.mName : newName;
    image.mTarget = target;

    LOG_INF() << "Register image" << Log::Field("name", image.mName.c_str())
              << Log::Field("target", target.mDigest.c_str());

    if (image.mName == source.mName) {
        return mImageStore.Update(image).mError;
    }

    auto err = mImageStore.Get(image.mName).mError;
    if (err.IsNone()) {
        return mImageStore.Update(image).mError;
    }

    if (!err.Is(ErrorEnum::eNotFound)) {
        return err;
    }

    return mImageStore.Create(image).mError;
}

} // namespace imgenc::core
