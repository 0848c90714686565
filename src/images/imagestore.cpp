/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>
#include <common/utils/digest.hpp>

#include "imagestore.hpp"

namespace imgenc::images {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ImageStore::Init(gc::SchedulerItf& scheduler)
{
    LOG_DBG() << "Init image store";

    mScheduler = &scheduler;

    return ErrorEnum::eNone;
}

RetWithError<Image> ImageStore::Get(const std::string& name)
{
    std::lock_guard lock {mMutex};

    auto it = mImages.find(name);
    if (it == mImages.end()) {
        return {Image(), Error(ErrorEnum::eNotFound, ("image " + name + " not found").c_str())};
    }

    return it->second;
}

RetWithError<std::vector<Image>> ImageStore::List()
{
    std::lock_guard lock {mMutex};

    std::vector<Image> images;

    for (const auto& [name, image] : mImages) {
        images.push_back(image);
    }

    return images;
}

RetWithError<Image> ImageStore::Create(const Image& image)
{
    if (auto err = ValidateImage(image); !err.IsNone()) {
        return {Image(), err};
    }

    std::lock_guard lock {mMutex};

    if (mImages.count(image.mName) != 0) {
        return {Image(), Error(ErrorEnum::eAlreadyExist, ("image " + image.mName + " already exists").c_str())};
    }

    auto created       = image;
    created.mCreatedAt = std::chrono::system_clock::now();
    created.mUpdatedAt = created.mCreatedAt;

    mImages.emplace(created.mName, created);

    LOG_DBG() << "Image created" << Log::Field("name", created.mName.c_str())
              << Log::Field("digest", created.mTarget.mDigest.c_str());

    return created;
}

RetWithError<Image> ImageStore::Update(const Image& image)
{
    if (auto err = ValidateImage(image); !err.IsNone()) {
        return {Image(), err};
    }

    bool targetChanged = false;
    auto updated       = image;

    {
        std::lock_guard lock {mMutex};

        auto it = mImages.find(image.mName);
        if (it == mImages.end()) {
            return {Image(), Error(ErrorEnum::eNotFound, ("image " + image.mName + " not found").c_str())};
        }

        targetChanged      = it->second.mTarget.mDigest != image.mTarget.mDigest;
        updated.mCreatedAt = it->second.mCreatedAt;
        updated.mUpdatedAt = std::chrono::system_clock::now();

        it->second = updated;
    }

    LOG_DBG() << "Image updated" << Log::Field("name", updated.mName.c_str())
              << Log::Field("digest", updated.mTarget.mDigest.c_str());

    if (targetChanged && mScheduler) {
        mScheduler->Schedule();
    }

    return updated;
}

Error ImageStore::Delete(const std::string& name, bool synchronous)
{
    {
        std::lock_guard lock {mMutex};

        if (mImages.erase(name) == 0) {
            return Error(ErrorEnum::eNotFound, ("image " + name + " not found").c_str());
        }
    }

    LOG_DBG() << "Image deleted" << Log::Field("name", name.c_str());

    if (!mScheduler) {
        return ErrorEnum::eNone;
    }

    if (synchronous) {
        if (auto err = mScheduler->ScheduleAndWait(); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        return ErrorEnum::eNone;
    }

    mScheduler->Schedule();

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error ImageStore::ValidateImage(const Image& image) const
{
    if (image.mName.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "image name is empty");
    }

    if (image.mTarget.mMediaType.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "image target media type is empty");
    }

    if (auto err = common::utils::ValidateDigest(image.mTarget.mDigest); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::images
