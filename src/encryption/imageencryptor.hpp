/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_ENCRYPTION_IMAGEENCRYPTOR_HPP_
#define IMGENC_ENCRYPTION_IMAGEENCRYPTOR_HPP_

#include <optional>
#include <string>
#include <vector>

#include <common/ocispec/ocispec.hpp>
#include <common/utils/context.hpp>
#include <content/itf/store.hpp>
#include <images/walker.hpp>
#include <leases/itf/leasemanager.hpp>

#include "cryptoconfig.hpp"
#include "layercrypt.hpp"
#include "layerfilter.hpp"

namespace imgenc::encryption {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Transform direction.
 */
enum class Direction {
    eEncrypt,
    eDecrypt,
};

/**
 * Transform result.
 */
struct TransformResult {
    oci::Descriptor mDescriptor;
    bool            mModified = false;
};

/**
 * Image layer info.
 */
struct LayerInfo {
    size_t                       mIndex {};
    oci::Descriptor              mDescriptor;
    std::optional<oci::Platform> mPlatform;
    std::vector<std::string>     mSchemes;
};

/**
 * Image encryptor.
 *
 * Rebuilds image tree bottom up: selected layers are encrypted or decrypted, manifests and indexes referencing changed
 * children are re-encoded and written to the content store. Every written blob is attached to the caller lease before
 * it is written.
 */
class ImageEncryptor {
public:
    /**
     * Default number of sibling nodes transformed concurrently.
     */
    static constexpr size_t cDefaultMaxConcurrentTransforms = 4;

    /**
     * Initializes image encryptor.
     *
     * @param store content store.
     * @param leaseManager lease manager.
     * @param maxConcurrentTransforms number of sibling nodes transformed concurrently.
     * @return Error.
     */
    Error Init(content::StoreItf& store, leases::ManagerItf& leaseManager,
        size_t maxConcurrentTransforms = cDefaultMaxConcurrentTransforms);

    /**
     * Transforms image.
     *
     * @param ctx cancellation context.
     * @param lease lease protecting written content.
     * @param root image root descriptor.
     * @param direction transform direction.
     * @param cc crypto config.
     * @param filter layer filter.
     * @return RetWithError<TransformResult>.
     */
    RetWithError<TransformResult> Transform(common::utils::Context& ctx, const leases::Lease& lease,
        const oci::Descriptor& root, Direction direction, const CryptoConfig& cc, const LayerFilter& filter);

    /**
     * Checks that decryption config is able to decrypt every encrypted layer of the image.
     *
     * @param ctx cancellation context.
     * @param root image root descriptor.
     * @param dc decryption config.
     * @return Error.
     */
    Error CheckAuthorization(common::utils::Context& ctx, const oci::Descriptor& root, const DecryptConfig& dc);

    /**
     * Returns info of every image layer.
     *
     * @param root image root descriptor.
     * @return RetWithError<std::vector<LayerInfo>>.
     */
    RetWithError<std::vector<LayerInfo>> GetImageLayerInfo(const oci::Descriptor& root);

private:
    struct TransformContext {
        common::utils::Context& mCtx;
        const leases::Lease&    mLease;
        Direction               mDirection;
        const CryptoConfig&     mConfig;
        const LayerFilter&      mFilter;
    };

    RetWithError<TransformResult> CryptImage(const TransformContext& tc, const oci::Descriptor& desc);
    RetWithError<TransformResult> CryptIndex(const TransformContext& tc, const oci::Descriptor& desc);
    RetWithError<TransformResult> CryptManifest(
        const TransformContext& tc, const oci::Descriptor& desc, const std::optional<oci::Platform>& platform);
    RetWithError<TransformResult> CryptLayer(
        const TransformContext& tc, const oci::Descriptor& desc, const std::optional<oci::Platform>& platform);
    RetWithError<Bytes>           ReadLayer(const oci::Descriptor& desc);
    Error WriteContent(const TransformContext& tc, const oci::Descriptor& desc, const Bytes& data,
        const content::Labels& labels = {});

    content::StoreItf*   mStore {};
    leases::ManagerItf*  mLeaseManager {};
    size_t               mMaxConcurrentTransforms = cDefaultMaxConcurrentTransforms;
    images::ImageWalker  mWalker;
    LayerCryptor         mCryptor;
    common::oci::OCISpec mOCISpec;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Encrypts selected image layers.
 *
 * @param ctx cancellation context.
 * @param store content store.
 * @param leaseManager lease manager.
 * @param lease lease protecting written content.
 * @param root image root descriptor.
 * @param cc crypto config with encryption config.
 * @param filter layer filter.
 * @return RetWithError<TransformResult>.
 */
RetWithError<TransformResult> EncryptImage(common::utils::Context& ctx, content::StoreItf& store,
    leases::ManagerItf& leaseManager, const leases::Lease& lease, const oci::Descriptor& root, const CryptoConfig& cc,
    const LayerFilter& filter);

/**
 * Decrypts selected image layers.
 *
 * @param ctx cancellation context.
 * @param store content store.
 * @param leaseManager lease manager.
 * @param lease lease protecting written content.
 * @param root image root descriptor.
 * @param cc crypto config with decryption config.
 * @param filter layer filter.
 * @return RetWithError<TransformResult>.
 */
RetWithError<TransformResult> DecryptImage(common::utils::Context& ctx, content::StoreItf& store,
    leases::ManagerItf& leaseManager, const leases::Lease& lease, const oci::Descriptor& root, const CryptoConfig& cc,
    const LayerFilter& filter);

} // namespace imgenc::encryption

#endif
