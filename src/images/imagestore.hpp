/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_IMAGES_IMAGESTORE_HPP_
#define IMGENC_IMAGES_IMAGESTORE_HPP_

#include <map>
#include <mutex>

#include <gc/itf/scheduler.hpp>

#include "itf/imagestore.hpp"

namespace imgenc::images {

/**
 * In-memory image store.
 */
class ImageStore : public StoreItf {
public:
    /**
     * Initializes image store.
     *
     * @param scheduler garbage collection scheduler.
     * @return Error.
     */
    Error Init(gc::SchedulerItf& scheduler);

    /**
     * Returns image by name.
     *
     * @param name image name.
     * @return RetWithError<Image>.
     */
    RetWithError<Image> Get(const std::string& name) override;

    /**
     * Lists images.
     *
     * @return RetWithError<std::vector<Image>>.
     */
    RetWithError<std::vector<Image>> List() override;

    /**
     * Creates image.
     *
     * @param image image.
     * @return RetWithError<Image>.
     */
    RetWithError<Image> Create(const Image& image) override;

    /**
     * Updates image.
     *
     * @param image image.
     * @return RetWithError<Image>.
     */
    RetWithError<Image> Update(const Image& image) override;

    /**
     * Deletes image.
     *
     * @param name image name.
     * @param synchronous wait for garbage collection.
     * @return Error.
     */
    Error Delete(const std::string& name, bool synchronous = false) override;

private:
    Error ValidateImage(const Image& image) const;

    gc::SchedulerItf*            mScheduler {};
    std::mutex                   mMutex;
    std::map<std::string, Image> mImages;
};

} // namespace imgenc::images

#endif
