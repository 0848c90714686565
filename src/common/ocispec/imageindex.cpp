/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

#include "common.hpp"
#include "ocispec.hpp"

namespace imgenc::common::oci {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::vector<std::string> cIndexFields = {"schemaVersion", "mediaType", "manifests", "annotations"};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error OCISpec::DecodeImageIndex(const Bytes& data, imgenc::oci::ImageIndex& index) const
{
    try {
        auto                                object = ParseDocument(data);
        utils::CaseInsensitiveObjectWrapper wrapper(object);

        if (wrapper.Has("layers") || wrapper.Has("config")) {
            IMGENC_ERROR_THROW(cMalformedError, "image manifest can't be used as index");
        }

        CheckDocumentMediaType(wrapper, imgenc::oci::IsIndexType);

        index.mSchemaVersion = wrapper.GetValue<int>("schemaVersion", 2);
        index.mMediaType     = wrapper.GetValue<std::string>("mediaType");
        index.mManifests     = DescriptorsFromJSONObject(wrapper, "manifests");

        if (wrapper.Has("annotations")) {
            index.mAnnotations = AnnotationsFromJSONObject(wrapper.GetObject("annotations"));
        }

        index.mRaw = object;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(ToMalformedError(e));
    }

    return ErrorEnum::eNone;
}

Error OCISpec::EncodeImageIndex(const imgenc::oci::ImageIndex& index, Bytes& data) const
{
    try {
        auto object = CreateDocument(index.mRaw, cIndexFields);

        object->set("schemaVersion", index.mSchemaVersion);

        if (!index.mMediaType.empty()) {
            object->set("mediaType", index.mMediaType);
        }

        Poco::JSON::Array manifests;

        for (const auto& manifest : index.mManifests) {
            manifests.add(DescriptorToJSONObject(manifest));
        }

        object->set("manifests", manifests);

        if (!index.mAnnotations.empty()) {
            object->set("annotations", AnnotationsToJSONObject(index.mAnnotations));
        }

        data = SerializeDocument(object);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(utils::ToError(e));
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::oci
