/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <vector>

#include <Poco/JSON/Object.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/digest.hpp>
#include <common/utils/exception.hpp>
#include <common/utils/filesystem.hpp>
#include <common/utils/json.hpp>

#include "localstore.hpp"

namespace fs = std::filesystem;

namespace imgenc::content {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

constexpr auto cMetadataExt = ".json";
constexpr auto cTmpMarker   = ".tmp-";

Poco::JSON::Object::Ptr InfoToJSON(const Info& info)
{
    auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);
    auto labels = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    for (const auto& [key, value] : info.mLabels) {
        labels->set(key, value);
    }

    object->set("digest", info.mDigest);
    object->set("size", info.mSize);
    object->set("createdAt", common::utils::ToUTCString(info.mCreatedAt).mValue);
    object->set("updatedAt", common::utils::ToUTCString(info.mUpdatedAt).mValue);
    object->set("labels", labels);

    return object;
}

Info InfoFromJSON(const common::utils::CaseInsensitiveObjectWrapper& object)
{
    Info info;

    info.mDigest = object.GetValue<std::string>("digest");
    info.mSize   = object.GetValue<uint64_t>("size");

    Error err;

    Tie(info.mCreatedAt, err) = common::utils::FromUTCString(object.GetValue<std::string>("createdAt"));
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't parse creation time");

    Tie(info.mUpdatedAt, err) = common::utils::FromUTCString(object.GetValue<std::string>("updatedAt"));
    IMGENC_ERROR_CHECK_AND_THROW(err, "can't parse update time");

    if (object.Has("labels")) {
        auto labels = object.GetObject("labels");

        for (const auto& key : labels.GetNames()) {
            info.mLabels[key] = labels.GetValue<std::string>(key);
        }
    }

    return info;
}

void MergeLabels(Labels& dst, const Labels& src)
{
    for (const auto& [key, value] : src) {
        if (value.empty()) {
            dst.erase(key);
            continue;
        }

        dst[key] = value;
    }
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error LocalStore::Init(const std::string& root)
{
    LOG_DBG() << "Init content store" << Log::Field("root", root.c_str());

    try {
        mRoot = root;

        fs::create_directories(common::utils::JoinPath(mRoot, cBlobsDir, common::utils::cDigestAlgorithm));
        fs::create_directories(common::utils::JoinPath(mRoot, cMetadataDir, common::utils::cDigestAlgorithm));
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToError(e));
    }

    return ErrorEnum::eNone;
}

RetWithError<Bytes> LocalStore::ReadBlob(const std::string& digest)
{
    auto [path, err] = BlobPath(digest);
    if (!err.IsNone()) {
        return {Bytes(), err};
    }

    Bytes data;

    Tie(data, err) = common::utils::ReadFile(path);
    if (err.Is(ErrorEnum::eNotFound)) {
        return {Bytes(), Error(ErrorEnum::eNotFound, ("content " + digest + " not found").c_str())};
    }

    if (!err.IsNone()) {
        return {Bytes(), AOS_ERROR_WRAP(err)};
    }

    return data;
}

RetWithError<Info> LocalStore::GetInfo(const std::string& digest)
{
    std::lock_guard lock {mMutex};

    return ReadInfo(digest);
}

Error LocalStore::WriteBlob(const oci::Descriptor& desc, const Bytes& data, const Labels& labels)
{
    LOG_DBG() << "Write blob" << Log::Field("digest", desc.mDigest.c_str()) << Log::Field("size", data.size());

    if (desc.mSize != data.size()) {
        return Error(ErrorEnum::eInvalidArgument, "blob size mismatch");
    }

    if (auto err = common::utils::VerifyDigest(desc.mDigest, data); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    auto [path, err] = BlobPath(desc.mDigest);
    if (!err.IsNone()) {
        return err;
    }

    std::lock_guard lock {mMutex};

    auto now = common::utils::Now();

    if (fs::exists(path)) {
        Info info;

        Tie(info, err) = ReadInfo(desc.mDigest);
        if (!err.IsNone()) {
            return err;
        }

        MergeLabels(info.mLabels, labels);
        info.mUpdatedAt = now;

        return WriteInfo(info);
    }

    if (err = common::utils::WriteFileAtomic(path, data); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    Info info {desc.mDigest, data.size(), now, now, {}};

    MergeLabels(info.mLabels, labels);

    return WriteInfo(info);
}

Error LocalStore::Delete(const std::string& digest)
{
    LOG_DBG() << "Delete blob" << Log::Field("digest", digest.c_str());

    auto [path, err] = BlobPath(digest);
    if (!err.IsNone()) {
        return err;
    }

    std::string metadataPath;

    Tie(metadataPath, err) = MetadataPath(digest);
    if (!err.IsNone()) {
        return err;
    }

    std::lock_guard lock {mMutex};

    try {
        if (!fs::remove(path)) {
            return Error(ErrorEnum::eNotFound, ("content " + digest + " not found").c_str());
        }

        fs::remove(metadataPath);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToError(e));
    }

    return ErrorEnum::eNone;
}

Error LocalStore::Walk(const WalkFunc& walkFunc)
{
    std::vector<Info> infos;

    {
        std::lock_guard lock {mMutex};

        try {
            for (const auto& algorithmDir : fs::directory_iterator(common::utils::JoinPath(mRoot, cBlobsDir))) {
                if (!algorithmDir.is_directory()) {
                    continue;
                }

                for (const auto& entry : fs::directory_iterator(algorithmDir.path())) {
                    auto name = entry.path().filename().string();

                    if (!entry.is_regular_file() || name.find(cTmpMarker) != std::string::npos) {
                        continue;
                    }

                    auto [info, err] = ReadInfo(algorithmDir.path().filename().string() + ":" + name);
                    if (!err.IsNone()) {
                        LOG_WRN() << "Skip blob with broken metadata" << Log::Field("blob", name.c_str())
                                  << Log::Field(err);
                        continue;
                    }

                    infos.push_back(std::move(info));
                }
            }
        } catch (const std::exception& e) {
            return AOS_ERROR_WRAP(common::utils::ToError(e));
        }
    }

    for (const auto& info : infos) {
        if (auto err = walkFunc(info); !err.IsNone()) {
            return err;
        }
    }

    return ErrorEnum::eNone;
}

RetWithError<Info> LocalStore::UpdateLabels(const std::string& digest, const Labels& labels)
{
    std::lock_guard lock {mMutex};

    auto [info, err] = ReadInfo(digest);
    if (!err.IsNone()) {
        return {Info(), err};
    }

    MergeLabels(info.mLabels, labels);
    info.mUpdatedAt = common::utils::Now();

    if (err = WriteInfo(info); !err.IsNone()) {
        return {Info(), err};
    }

    return info;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<std::string> LocalStore::BlobPath(const std::string& digest) const
{
    if (auto err = common::utils::ValidateDigest(digest); !err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    auto [algorithm, hex] = common::utils::ParseDigest(digest);

    return common::utils::JoinPath(mRoot, cBlobsDir, algorithm, hex);
}

RetWithError<std::string> LocalStore::MetadataPath(const std::string& digest) const
{
    if (auto err = common::utils::ValidateDigest(digest); !err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    auto [algorithm, hex] = common::utils::ParseDigest(digest);

    return common::utils::JoinPath(mRoot, cMetadataDir, algorithm, hex + cMetadataExt);
}

RetWithError<Info> LocalStore::ReadInfo(const std::string& digest) const
{
    auto [path, err] = BlobPath(digest);
    if (!err.IsNone()) {
        return {Info(), err};
    }

    std::string metadataPath;

    Tie(metadataPath, err) = MetadataPath(digest);
    if (!err.IsNone()) {
        return {Info(), err};
    }

    try {
        if (!fs::exists(path)) {
            return {Info(), Error(ErrorEnum::eNotFound, ("content " + digest + " not found").c_str())};
        }

        if (!fs::exists(metadataPath)) {
            auto modified = common::utils::Now();

            return Info {digest, static_cast<uint64_t>(fs::file_size(path)), modified, modified, {}};
        }

        Bytes data;

        Tie(data, err) = common::utils::ReadFile(metadataPath);
        if (!err.IsNone()) {
            return {Info(), AOS_ERROR_WRAP(err)};
        }

        Poco::Dynamic::Var json;

        Tie(json, err) = common::utils::ParseJson(common::utils::ToString(data));
        if (!err.IsNone()) {
            return {Info(), AOS_ERROR_WRAP(err)};
        }

        return InfoFromJSON(common::utils::CaseInsensitiveObjectWrapper(json));
    } catch (const std::exception& e) {
        return {Info(), AOS_ERROR_WRAP(common::utils::ToError(e))};
    }
}

Error LocalStore::WriteInfo(const Info& info) const
{
    auto [metadataPath, err] = MetadataPath(info.mDigest);
    if (!err.IsNone()) {
        return err;
    }

    if (err = common::utils::WriteFileAtomic(
            metadataPath, common::utils::ToBytes(common::utils::Stringify(InfoToJSON(info))));
        !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::content
