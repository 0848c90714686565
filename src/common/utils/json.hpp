/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_JSON_HPP_
#define IMGENC_COMMON_UTILS_JSON_HPP_

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include "error.hpp"

namespace imgenc::common::utils {

/**
 * Parses json string.
 *
 * @param json json string.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json) noexcept;

/**
 * Parses json from input stream.
 *
 * @param in input stream.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in) noexcept;

/**
 * Converts json object to compact string.
 *
 * @param json json object.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Object::Ptr& json);

/**
 * Converts json array to compact string.
 *
 * @param json json array.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Array::Ptr& json);

/**
 * Wrapper for Poco::JSON::Object that looks up keys case insensitively.
 */
class CaseInsensitiveObjectWrapper {
public:
    /**
     * Creates wrapper from object pointer.
     *
     * @param object object.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object);

    /**
     * Creates wrapper from dynamic var holding an object.
     *
     * @param var dynamic var.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var);

    /**
     * Checks if key is present.
     *
     * @param key key.
     * @return bool.
     */
    bool Has(const std::string& key) const;

    /**
     * Returns raw value by key.
     *
     * @param key key.
     * @return Poco::Dynamic::Var empty if key not found.
     */
    Poco::Dynamic::Var Get(const std::string& key) const;

    /**
     * Returns value converted to T, or default value if key is absent.
     *
     * @param key key.
     * @param defaultValue default value.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key, const T& defaultValue = T {}) const
    {
        auto value = Get(key);

        if (value.isEmpty()) {
            return defaultValue;
        }

        return value.convert<T>();
    }

    /**
     * Returns optional value converted to T.
     *
     * @param key key.
     * @return std::optional<T>.
     */
    template <typename T>
    std::optional<T> GetOptionalValue(const std::string& key) const
    {
        auto value = Get(key);

        if (value.isEmpty()) {
            return std::nullopt;
        }

        return value.convert<T>();
    }

    /**
     * Returns nested object. Throws if key is absent or is not an object.
     *
     * @param key key.
     * @return CaseInsensitiveObjectWrapper.
     */
    CaseInsensitiveObjectWrapper GetObject(const std::string& key) const;

    /**
     * Returns nested array. Throws if key is absent or is not an array.
     *
     * @param key key.
     * @return Poco::JSON::Array::Ptr.
     */
    Poco::JSON::Array::Ptr GetArray(const std::string& key) const;

    /**
     * Returns names of all keys.
     *
     * @return std::vector<std::string>.
     */
    std::vector<std::string> GetNames() const;

    /**
     * Returns wrapped object.
     *
     * @return Poco::JSON::Object::Ptr.
     */
    Poco::JSON::Object::Ptr Object() const { return mObject; }

private:
    std::optional<std::string> FindKey(const std::string& key) const;

    Poco::JSON::Object::Ptr mObject;
};

/**
 * Returns array value converted with the provided function.
 *
 * @param object object wrapper.
 * @param key key.
 * @param func conversion function.
 * @return std::vector<T>.
 */
template <typename T, typename F>
std::vector<T> GetArrayValue(const CaseInsensitiveObjectWrapper& object, const std::string& key, F&& func)
{
    std::vector<T> result;

    if (!object.Has(key)) {
        return result;
    }

    auto array = object.GetArray(key);

    for (const auto& value : *array) {
        result.push_back(func(value));
    }

    return result;
}

/**
 * Returns array value of plain type.
 *
 * @param object object wrapper.
 * @param key key.
 * @return std::vector<T>.
 */
template <typename T>
std::vector<T> GetArrayValue(const CaseInsensitiveObjectWrapper& object, const std::string& key)
{
    return GetArrayValue<T>(object, key, [](const Poco::Dynamic::Var& value) { return value.convert<T>(); });
}

/**
 * Converts container to json array.
 *
 * @param container container.
 * @param func conversion function.
 * @return Poco::JSON::Array.
 */
template <typename Container, typename F>
Poco::JSON::Array ToJsonArray(const Container& container, F&& func)
{
    Poco::JSON::Array array;

    for (const auto& item : container) {
        array.add(func(item));
    }

    return array;
}

} // namespace imgenc::common::utils

#endif
