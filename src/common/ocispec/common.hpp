/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_OCISPEC_COMMON_HPP_
#define IMGENC_COMMON_OCISPEC_COMMON_HPP_

#include <common/utils/json.hpp>
#include <common/utils/utils.hpp>

#include "types.hpp"

namespace imgenc::common::oci {

/**
 * Parses JSON document keeping key order.
 *
 * @param data encoded document.
 * @return Poco::JSON::Object::Ptr. Throws eMalformedManifest on error.
 */
Poco::JSON::Object::Ptr ParseDocument(const Bytes& data);

/**
 * Serializes JSON document.
 *
 * @param object JSON object.
 * @return Bytes.
 */
Bytes SerializeDocument(const Poco::JSON::Object::Ptr& object);

/**
 * Converts decoding exception to malformed manifest error.
 *
 * @param e exception.
 * @return Error.
 */
Error ToMalformedError(const std::exception& e);

/**
 * Creates document with the fields of the source document except the ones that will be set by encoder.
 *
 * @param raw source document, may be null.
 * @param ownFields fields that belong to encoder.
 * @return Poco::JSON::Object::Ptr.
 */
Poco::JSON::Object::Ptr CreateDocument(const Poco::JSON::Object::Ptr& raw, const std::vector<std::string>& ownFields);

/**
 * Error enum of malformed documents.
 */
constexpr auto cMalformedError = ToErrorEnum(TransformErrorEnum::eMalformedManifest);

/**
 * Checks that document media type field is one of expected types.
 *
 * @param object JSON object.
 * @param isExpectedType media type predicate.
 */
void CheckDocumentMediaType(
    const utils::CaseInsensitiveObjectWrapper& object, bool (*isExpectedType)(const std::string&));

/**
 * Converts content descriptor from JSON object.
 *
 * @param object JSON object.
 * @param descriptor content descriptor.
 */
void DescriptorFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object, imgenc::oci::Descriptor& descriptor);

/**
 * Converts content descriptor to JSON object.
 *
 * @param descriptor content descriptor.
 * @return Poco::JSON::Object JSON object.
 */
Poco::JSON::Object DescriptorToJSONObject(const imgenc::oci::Descriptor& descriptor);

/**
 * Converts descriptor array from JSON object.
 *
 * @param object JSON object.
 * @param key array key.
 * @return std::vector<imgenc::oci::Descriptor>.
 */
std::vector<imgenc::oci::Descriptor> DescriptorsFromJSONObject(
    const utils::CaseInsensitiveObjectWrapper& object, const std::string& key);

/**
 * Converts platform from JSON object.
 *
 * @param object JSON object.
 * @param platform platform.
 */
void PlatformFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object, imgenc::oci::Platform& platform);

/**
 * Converts platform to JSON object.
 *
 * @param platform platform.
 * @param object JSON object.
 */
void PlatformToJSONObject(const imgenc::oci::Platform& platform, Poco::JSON::Object& object);

/**
 * Converts annotations from JSON object.
 *
 * @param object JSON object.
 * @return imgenc::oci::Annotations.
 */
imgenc::oci::Annotations AnnotationsFromJSONObject(const utils::CaseInsensitiveObjectWrapper& object);

/**
 * Converts annotations to JSON object.
 *
 * @param annotations annotations.
 * @return Poco::JSON::Object.
 */
Poco::JSON::Object AnnotationsToJSONObject(const imgenc::oci::Annotations& annotations);

} // namespace imgenc::common::oci

#endif
