/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_CONTENT_ITF_STORE_HPP_
#define IMGENC_CONTENT_ITF_STORE_HPP_

#include <functional>
#include <map>
#include <string>

#include <common/ocispec/types.hpp>
#include <common/utils/error.hpp>
#include <common/utils/time.hpp>
#include <common/utils/utils.hpp>

namespace imgenc::content {

/**
 * Blob labels.
 */
using Labels = std::map<std::string, std::string>;

/**
 * Blob info.
 */
struct Info {
    std::string mDigest;
    uint64_t    mSize {};
    Time        mCreatedAt {};
    Time        mUpdatedAt {};
    Labels      mLabels;
};

/**
 * Read side of the content store.
 */
class ProviderItf {
public:
    /**
     * Destructor.
     */
    virtual ~ProviderItf() = default;

    /**
     * Reads whole blob.
     *
     * @param digest blob digest.
     * @return RetWithError<Bytes>.
     */
    virtual RetWithError<Bytes> ReadBlob(const std::string& digest) = 0;

    /**
     * Returns blob info.
     *
     * @param digest blob digest.
     * @return RetWithError<Info>.
     */
    virtual RetWithError<Info> GetInfo(const std::string& digest) = 0;
};

/**
 * Write side of the content store.
 */
class IngesterItf {
public:
    /**
     * Destructor.
     */
    virtual ~IngesterItf() = default;

    /**
     * Writes blob. Data must match descriptor digest and size. Writing an existing blob keeps its data, merges
     * labels and refreshes update time.
     *
     * @param desc blob descriptor.
     * @param data blob data.
     * @param labels blob labels.
     * @return Error.
     */
    virtual Error WriteBlob(const oci::Descriptor& desc, const Bytes& data, const Labels& labels = {}) = 0;
};

/**
 * Content store.
 */
class StoreItf : public ProviderItf, public IngesterItf {
public:
    /**
     * Walk callback.
     */
    using WalkFunc = std::function<Error(const Info& info)>;

    /**
     * Deletes blob.
     *
     * @param digest blob digest.
     * @return Error.
     */
    virtual Error Delete(const std::string& digest) = 0;

    /**
     * Calls function for every blob in the store. Iteration stops on first error.
     *
     * @param walkFunc walk callback.
     * @return Error.
     */
    virtual Error Walk(const WalkFunc& walkFunc) = 0;

    /**
     * Replaces blob labels. Labels with empty value are removed.
     *
     * @param digest blob digest.
     * @param labels labels to set.
     * @return RetWithError<Info> updated info.
     */
    virtual RetWithError<Info> UpdateLabels(const std::string& digest, const Labels& labels) = 0;
};

} // namespace imgenc::content

#endif
