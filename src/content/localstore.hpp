/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_CONTENT_LOCALSTORE_HPP_
#define IMGENC_CONTENT_LOCALSTORE_HPP_

#include <mutex>
#include <string>

#include "itf/store.hpp"

namespace imgenc::content {

/**
 * Filesystem content store.
 *
 * Blobs are kept under <root>/blobs/<algorithm>/<hex>, blob metadata (timestamps and labels) under
 * <root>/metadata/<algorithm>/<hex>.json.
 */
class LocalStore : public StoreItf {
public:
    /**
     * Initializes store.
     *
     * @param root store root directory.
     * @return Error.
     */
    Error Init(const std::string& root);

    /**
     * Reads whole blob.
     *
     * @param digest blob digest.
     * @return RetWithError<Bytes>.
     */
    RetWithError<Bytes> ReadBlob(const std::string& digest) override;

    /**
     * Returns blob info.
     *
     * @param digest blob digest.
     * @return RetWithError<Info>.
     */
    RetWithError<Info> GetInfo(const std::string& digest) override;

    /**
     * Writes blob.
     *
     * @param desc blob descriptor.
     * @param data blob data.
     * @param labels blob labels.
     * @return Error.
     */
    Error WriteBlob(const oci::Descriptor& desc, const Bytes& data, const Labels& labels = {}) override;

    /**
     * Deletes blob.
     *
     * @param digest blob digest.
     * @return Error.
     */
    Error Delete(const std::string& digest) override;

    /**
     * Calls function for every blob in the store.
     *
     * @param walkFunc walk callback.
     * @return Error.
     */
    Error Walk(const WalkFunc& walkFunc) override;

    /**
     * Updates blob labels. Labels with empty value are removed.
     *
     * @param digest blob digest.
     * @param labels labels to set.
     * @return RetWithError<Info>.
     */
    RetWithError<Info> UpdateLabels(const std::string& digest, const Labels& labels) override;

private:
    static constexpr auto cBlobsDir    = "blobs";
    static constexpr auto cMetadataDir = "metadata";

    RetWithError<std::string> BlobPath(const std::string& digest) const;
    RetWithError<std::string> MetadataPath(const std::string& digest) const;
    RetWithError<Info>        ReadInfo(const std::string& digest) const;
    Error                     WriteInfo(const Info& info) const;

    std::string mRoot;
    std::mutex  mMutex;
};

} // namespace imgenc::content

#endif
