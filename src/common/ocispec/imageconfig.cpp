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

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error OCISpec::DecodeImageConfig(const Bytes& data, imgenc::oci::ImageConfig& imageConfig) const
{
    try {
        auto                                object = ParseDocument(data);
        utils::CaseInsensitiveObjectWrapper wrapper(object);

        imageConfig.mArchitecture = wrapper.GetValue<std::string>("architecture");
        imageConfig.mOS           = wrapper.GetValue<std::string>("os");
        imageConfig.mOSVersion    = wrapper.GetValue<std::string>("os.version");
        imageConfig.mVariant      = wrapper.GetValue<std::string>("variant");
        imageConfig.mOSFeatures   = utils::GetArrayValue<std::string>(wrapper, "os.features");
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(ToMalformedError(e));
    }

    return ErrorEnum::eNone;
}

Error OCISpec::EncodeImageConfig(const imgenc::oci::ImageConfig& imageConfig, Bytes& data) const
{
    try {
        auto object = Poco::makeShared<Poco::JSON::Object>(Poco::JSON_PRESERVE_KEY_ORDER);

        object->set("architecture", imageConfig.mArchitecture);
        object->set("os", imageConfig.mOS);

        if (!imageConfig.mOSVersion.empty()) {
            object->set("os.version", imageConfig.mOSVersion);
        }

        if (!imageConfig.mOSFeatures.empty()) {
            object->set("os.features",
                utils::ToJsonArray(imageConfig.mOSFeatures, [](const std::string& feature) { return feature; }));
        }

        if (!imageConfig.mVariant.empty()) {
            object->set("variant", imageConfig.mVariant);
        }

        data = SerializeDocument(object);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(utils::ToError(e));
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::oci
