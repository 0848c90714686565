/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_CORE_IMGENCCORE_HPP_
#define IMGENC_CORE_IMGENCCORE_HPP_

#include <string>
#include <vector>

#include <common/logger/logger.hpp>
#include <common/utils/cleanupmanager.hpp>
#include <common/utils/context.hpp>
#include <config/config.hpp>
#include <content/localstore.hpp>
#include <encryption/imageencryptor.hpp>
#include <gc/collector.hpp>
#include <images/imagestore.hpp>
#include <images/walker.hpp>
#include <leases/leasemanager.hpp>

namespace imgenc::core {

/**
 * Image encryption core instance.
 */
class ImageEncCore {
public:
    /**
     * Initializes core from config file.
     *
     * @param configFile config file path.
     */
    void Init(const std::string& configFile);

    /**
     * Initializes core from config.
     *
     * @param config config.
     */
    void Init(const config::Config& config);

    /**
     * Starts core.
     */
    void Start();

    /**
     * Stops core.
     */
    void Stop();

    /**
     * Encrypts image layers and registers result image.
     *
     * @param ctx cancellation context.
     * @param name source image name.
     * @param newName result image name, source image is updated if empty.
     * @param cc crypto config.
     * @param platforms platforms to encrypt, all layers are encrypted if empty.
     * @return RetWithError<encryption::TransformResult>.
     */
    RetWithError<encryption::TransformResult> EncryptImage(common::utils::Context& ctx, const std::string& name,
        const std::string& newName, const encryption::CryptoConfig& cc, const std::vector<std::string>& platforms = {});

    /**
     * Decrypts image layers and registers result image.
     *
     * @param ctx cancellation context.
     * @param name source image name.
     * @param newName result image name, source image is updated if empty.
     * @param cc crypto config.
     * @param platforms platforms to decrypt, all layers are decrypted if empty.
     * @return RetWithError<encryption::TransformResult>.
     */
    RetWithError<encryption::TransformResult> DecryptImage(common::utils::Context& ctx, const std::string& name,
        const std::string& newName, const encryption::CryptoConfig& cc, const std::vector<std::string>& platforms = {});

    /**
     * Returns content store.
     *
     * @return content::StoreItf&.
     */
    content::StoreItf& GetContentStore() { return mContentStore; }

    /**
     * Returns image store.
     *
     * @return images::StoreItf&.
     */
    images::StoreItf& GetImageStore() { return mImageStore; }

    /**
     * Returns lease manager.
     *
     * @return leases::ManagerItf&.
     */
    leases::ManagerItf& GetLeaseManager() { return mLeaseManager; }

    /**
     * Returns garbage collector.
     *
     * @return gc::Collector&.
     */
    gc::Collector& GetCollector() { return mCollector; }

private:
    static constexpr auto cDefaultConfigFile = "imgenc.cfg";

    RetWithError<encryption::TransformResult> TransformImage(common::utils::Context& ctx, const std::string& name,
        const std::string& newName, encryption::Direction direction, const encryption::CryptoConfig& cc,
        const std::vector<std::string>& platforms);
    RetWithError<encryption::LayerFilter> CreateFilter(
        const oci::Descriptor& root, const std::vector<std::string>& platforms);
    Error RegisterImage(const images::Image& source, const std::string& newName, const oci::Descriptor& target);

    config::Config mConfig = {};

    common::logger::Logger        mLogger;
    common::utils::CleanupManager mCleanupManager;

    content::LocalStore         mContentStore;
    encryption::ImageEncryptor  mImageEncryptor;
    gc::Collector               mCollector;
    images::ImageStore          mImageStore;
    images::ImageWalker         mWalker;
    leases::Manager             mLeaseManager;
};

} // namespace imgenc::core

#endif
