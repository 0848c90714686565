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

const std::vector<std::string> cManifestFields = {"schemaVersion", "mediaType", "config", "layers", "annotations"};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error OCISpec::DecodeImageManifest(const Bytes& data, imgenc::oci::ImageManifest& manifest) const
{
    try {
        auto                                object = ParseDocument(data);
        utils::CaseInsensitiveObjectWrapper wrapper(object);

        if (wrapper.Has("manifests")) {
            IMGENC_ERROR_THROW(cMalformedError, "image index can't be used as manifest");
        }

        CheckDocumentMediaType(wrapper, imgenc::oci::IsManifestType);

        manifest.mSchemaVersion = wrapper.GetValue<int>("schemaVersion", 2);
        manifest.mMediaType     = wrapper.GetValue<std::string>("mediaType");

        if (!wrapper.Has("config")) {
            IMGENC_ERROR_THROW(cMalformedError, "missing config");
        }

        DescriptorFromJSONObject(wrapper.GetObject("config"), manifest.mConfig);

        manifest.mLayers = DescriptorsFromJSONObject(wrapper, "layers");

        if (wrapper.Has("annotations")) {
            manifest.mAnnotations = AnnotationsFromJSONObject(wrapper.GetObject("annotations"));
        }

        manifest.mRaw = object;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(ToMalformedError(e));
    }

    return ErrorEnum::eNone;
}

Error OCISpec::EncodeImageManifest(const imgenc::oci::ImageManifest& manifest, Bytes& data) const
{
    try {
        auto object = CreateDocument(manifest.mRaw, cManifestFields);

        object->set("schemaVersion", manifest.mSchemaVersion);

        if (!manifest.mMediaType.empty()) {
            object->set("mediaType", manifest.mMediaType);
        }

        object->set("config", DescriptorToJSONObject(manifest.mConfig));

        Poco::JSON::Array layers;

        for (const auto& layer : manifest.mLayers) {
            layers.add(DescriptorToJSONObject(layer));
        }

        object->set("layers", layers);

        if (!manifest.mAnnotations.empty()) {
            object->set("annotations", AnnotationsToJSONObject(manifest.mAnnotations));
        }

        data = SerializeDocument(object);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(utils::ToError(e));
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::oci
