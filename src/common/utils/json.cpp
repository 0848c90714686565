/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/Parser.h>
#include <Poco/JSON/Stringifier.h>
#include <Poco/String.h>

#include "exception.hpp"
#include "json.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json) noexcept
{
    try {
        Poco::JSON::Parser parser;

        return parser.parse(json);
    } catch (const std::exception& e) {
        return {Poco::Dynamic::Var(), ToError(e, ErrorEnum::eInvalidArgument)};
    }
}

RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in) noexcept
{
    try {
        Poco::JSON::Parser parser;

        return parser.parse(in);
    } catch (const std::exception& e) {
        return {Poco::Dynamic::Var(), ToError(e, ErrorEnum::eInvalidArgument)};
    }
}

std::string Stringify(const Poco::JSON::Object::Ptr& json)
{
    std::ostringstream oss;

    Poco::JSON::Stringifier::condense(json, oss);

    return oss.str();
}

std::string Stringify(const Poco::JSON::Array::Ptr& json)
{
    std::ostringstream oss;

    Poco::JSON::Stringifier::condense(json, oss);

    return oss.str();
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object)
    : mObject(object)
{
    if (mObject.isNull()) {
        IMGENC_ERROR_THROW(ErrorEnum::eInvalidArgument, "null json object");
    }
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var)
{
    if (var.type() == typeid(Poco::JSON::Object::Ptr)) {
        mObject = var.extract<Poco::JSON::Object::Ptr>();
    } else if (var.type() == typeid(Poco::JSON::Object)) {
        mObject = Poco::makeShared<Poco::JSON::Object>(var.extract<Poco::JSON::Object>());
    } else {
        IMGENC_ERROR_THROW(ErrorEnum::eInvalidArgument, "json value is not an object");
    }
}

bool CaseInsensitiveObjectWrapper::Has(const std::string& key) const
{
    return FindKey(key).has_value();
}

Poco::Dynamic::Var CaseInsensitiveObjectWrapper::Get(const std::string& key) const
{
    auto name = FindKey(key);
    if (!name.has_value()) {
        return {};
    }

    return mObject->get(*name);
}

CaseInsensitiveObjectWrapper CaseInsensitiveObjectWrapper::GetObject(const std::string& key) const
{
    auto value = Get(key);

    if (value.isEmpty()) {
        IMGENC_ERROR_THROW(ErrorEnum::eNotFound, "key not found: " + key);
    }

    return CaseInsensitiveObjectWrapper(value);
}

Poco::JSON::Array::Ptr CaseInsensitiveObjectWrapper::GetArray(const std::string& key) const
{
    auto value = Get(key);

    if (value.type() == typeid(Poco::JSON::Array::Ptr)) {
        return value.extract<Poco::JSON::Array::Ptr>();
    }

    if (value.type() == typeid(Poco::JSON::Array)) {
        return Poco::makeShared<Poco::JSON::Array>(value.extract<Poco::JSON::Array>());
    }

    IMGENC_ERROR_THROW(ErrorEnum::eInvalidArgument, "value is not an array: " + key);
}

std::vector<std::string> CaseInsensitiveObjectWrapper::GetNames() const
{
    std::vector<std::string> names;

    mObject->getNames(names);

    return names;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::optional<std::string> CaseInsensitiveObjectWrapper::FindKey(const std::string& key) const
{
    if (mObject->has(key)) {
        return key;
    }

    for (const auto& [name, _] : *mObject) {
        if (Poco::icompare(name, key) == 0) {
            return name;
        }
    }

    return std::nullopt;
}

} // namespace imgenc::common::utils
