/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>

#include <Poco/JSON/ParseHandler.h>
#include <Poco/JSON/Parser.h>
#include <Poco/JSON/Stringifier.h>

#include <common/utils/digest.hpp>
#include <common/utils/exception.hpp>

#include "common.hpp"

namespace imgenc::common::oci {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string GetRequiredString(const utils::CaseInsensitiveObjectWrapper& object, const std::string& key)
{
    auto value = object.Get(key);

    if (value.isEmpty() || !value.isString()) {
        IMGENC_ERROR_THROW(cMalformedError, "missing or invalid " + key);
    }

    return value.convert<std::string>();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Poco::JSON::Object::Ptr ParseDocument(const Bytes& data)
{
    try {
        Poco::JSON::Parser parser(new Poco::JSON::ParseHandler(true));

        auto var = parser.parse(utils::ToString(data));

        if (var.type() != typeid(Poco::JSON::Object::Ptr)) {
            IMGENC_ERROR_THROW(cMalformedError, "document is not a JSON object");
        }

        return var.extract<Poco::JSON::Object::Ptr>();
    } catch (const utils::ImgEncException&) {
        throw;
    } catch (const std::exception& e) {
        IMGENC_ERROR_THROW(cMalformedError, std::string("can't parse document: ") + e.what());
    }
}

Error ToMalformedError(const std::exception& e)
{
    auto err = utils::ToError(e, cMalformedError);

    if (IsTransformError(err, TransformErrorEnum::eMalformedManifest)) {
        return err;
    }

    return TransformError(TransformErrorEnum::eMalformedManifest, err.Message());
}

Bytes SerializeDocument(const Poco::JSON::Object::Ptr& object)
{
    std::vector<std::string> names;

    object->getNames(names);

    // Drop reserved fields that encoder left unset.
    for (const auto& name : names) {
        if (object->get(name).isEmpty()) {
            object->remove(name);
        }
    }

    std::ostringstream oss;

    Poco::JSON::Stringifier::condense(object, oss);

    return utils::ToBytes(oss.str());
}

Poco::JSON::Object::Ptr CreateDocument(const Poco::JSON::Object::Ptr& raw, const std::vector<std::string>& ownFields)
{
    auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

    if (raw.isNull()) {
        return object;
    }

    std::vector<std::string> names;

    raw->getNames(names);

    // Keep original key positions: own fields are reserved here and overwritten by encoder.
    for (const auto& name : names) {
        if (std::find(ownFields.begin(), ownFields.end(), name) != ownFields.end()) {
            object->set(name, Poco::Dynamic::Var());
            continue;
        }

        object->set(name, raw->get(name));
    }

    return object;
}

void CheckDocumentMediaType(
    const utils::CaseInsensitiveObjectWrapper& object, bool (*isExpectedType)(const std::string&))
{
    auto mediaType = object.Get("mediaType");

    if (mediaType.isEmpty()) {
        return;
    }

    if (!mediaType.isString() || !isExpectedType(mediaType.convert<std::string>())) {
        IMGENC_ERROR_THROW(cMalformedError, "unexpected document media type");
    }
}

void DescriptorFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object, imgenc::oci::Descriptor& descriptor)
{
    descriptor.mMediaType = GetRequiredString(object, "mediaType");
    descriptor.mDigest    = GetRequiredString(object, "digest");

    if (auto err = utils::ValidateDigest(descriptor.mDigest); !err.IsNone()) {
        IMGENC_ERROR_THROW(cMalformedError, "invalid digest " + descriptor.mDigest);
    }

    auto size = object.Get("size");

    if (size.isEmpty() || !size.isInteger() || size.convert<int64_t>() < 0) {
        IMGENC_ERROR_THROW(cMalformedError, "missing or invalid size");
    }

    descriptor.mSize         = size.convert<uint64_t>();
    descriptor.mURLs         = utils::GetArrayValue<std::string>(object, "urls");
    descriptor.mArtifactType = object.GetValue<std::string>("artifactType");

    if (object.Has("annotations")) {
        descriptor.mAnnotations = AnnotationsFromJSONObject(object.GetObject("annotations"));
    }

    if (object.Has("platform")) {
        descriptor.mPlatform.emplace();
        PlatformFromJSONObject(object.GetObject("platform"), *descriptor.mPlatform);
    }
}

Poco::JSON::Object DescriptorToJSONObject(const imgenc::oci::Descriptor& descriptor)
{
    Poco::JSON::Object object {Poco::JSON_PRESERVE_KEY_ORDER};

    object.set("mediaType", descriptor.mMediaType);
    object.set("digest", descriptor.mDigest);
    object.set("size", descriptor.mSize);

    if (!descriptor.mURLs.empty()) {
        object.set("urls", utils::ToJsonArray(descriptor.mURLs, [](const std::string& url) { return url; }));
    }

    if (!descriptor.mAnnotations.empty()) {
        object.set("annotations", AnnotationsToJSONObject(descriptor.mAnnotations));
    }

    if (descriptor.mPlatform.has_value()) {
        Poco::JSON::Object platformObject {Poco::JSON_PRESERVE_KEY_ORDER};

        PlatformToJSONObject(*descriptor.mPlatform, platformObject);
        object.set("platform", platformObject);
    }

    if (!descriptor.mArtifactType.empty()) {
        object.set("artifactType", descriptor.mArtifactType);
    }

    return object;
}

std::vector<imgenc::oci::Descriptor> DescriptorsFromJSONObject(
    const utils::CaseInsensitiveObjectWrapper& object, const std::string& key)
{
    if (!object.Has(key)) {
        IMGENC_ERROR_THROW(cMalformedError, "missing " + key);
    }

    return utils::GetArrayValue<imgenc::oci::Descriptor>(object, key, [](const Poco::Dynamic::Var& value) {
        imgenc::oci::Descriptor descriptor;

        DescriptorFromJSONObject(utils::CaseInsensitiveObjectWrapper(value), descriptor);

        return descriptor;
    });
}

void PlatformFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object, imgenc::oci::Platform& platform)
{
    platform.mArchitecture = object.GetValue<std::string>("architecture");
    platform.mOS           = object.GetValue<std::string>("os");
    platform.mOSVersion    = object.GetValue<std::string>("os.version");
    platform.mVariant      = object.GetValue<std::string>("variant");
    platform.mOSFeatures   = utils::GetArrayValue<std::string>(object, "os.features");
}

void PlatformToJSONObject(const imgenc::oci::Platform& platform, Poco::JSON::Object& object)
{
    object.set("architecture", platform.mArchitecture);
    object.set("os", platform.mOS);

    if (!platform.mOSVersion.empty()) {
        object.set("os.version", platform.mOSVersion);
    }

    if (!platform.mOSFeatures.empty()) {
        auto features = utils::ToJsonArray(platform.mOSFeatures, [](const std::string& feature) { return feature; });

        object.set("os.features", features);
    }

    if (!platform.mVariant.empty()) {
        object.set("variant", platform.mVariant);
    }
}

imgenc::oci::Annotations AnnotationsFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object)
{
    imgenc::oci::Annotations annotations;

    for (const auto& name : object.GetNames()) {
        auto value = object.Get(name);

        if (!value.isString()) {
            IMGENC_ERROR_THROW(cMalformedError, "annotation value is not a string: " + name);
        }

        annotations.emplace(name, value.convert<std::string>());
    }

    return annotations;
}

Poco::JSON::Object AnnotationsToJSONObject(const imgenc::oci::Annotations& annotations)
{
    Poco::JSON::Object object {Poco::JSON_PRESERVE_KEY_ORDER};

    for (const auto& [key, value] : annotations) {
        object.set(key, value);
    }

    return object;
}

} // namespace imgenc::common::oci
