/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_IMAGES_ITF_IMAGESTORE_HPP_
#define IMGENC_IMAGES_ITF_IMAGESTORE_HPP_

#include <map>
#include <string>
#include <vector>

#include <common/ocispec/types.hpp>
#include <common/utils/error.hpp>
#include <common/utils/time.hpp>

namespace imgenc::images {

/**
 * Image record.
 */
struct Image {
    std::string                        mName;
    oci::Descriptor                    mTarget;
    std::map<std::string, std::string> mLabels;
    Time                               mCreatedAt {};
    Time                               mUpdatedAt {};
};

/**
 * Image metadata store interface. Image targets are garbage collection roots.
 */
class StoreItf {
public:
    /**
     * Destructor.
     */
    virtual ~StoreItf() = default;

    /**
     * Returns image by name.
     *
     * @param name image name.
     * @return RetWithError<Image>.
     */
    virtual RetWithError<Image> Get(const std::string& name) = 0;

    /**
     * Lists images.
     *
     * @return RetWithError<std::vector<Image>>.
     */
    virtual RetWithError<std::vector<Image>> List() = 0;

    /**
     * Creates image.
     *
     * @param image image.
     * @return RetWithError<Image> created image.
     */
    virtual RetWithError<Image> Create(const Image& image) = 0;

    /**
     * Updates image target and labels.
     *
     * @param image image.
     * @return RetWithError<Image> updated image.
     */
    virtual RetWithError<Image> Update(const Image& image) = 0;

    /**
     * Deletes image.
     *
     * @param name image name.
     * @param synchronous wait for garbage collection.
     * @return Error.
     */
    virtual Error Delete(const std::string& name, bool synchronous = false) = 0;
};

} // namespace imgenc::images

#endif
