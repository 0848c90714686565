/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_FILESYSTEM_HPP_
#define IMGENC_COMMON_UTILS_FILESYSTEM_HPP_

#include <filesystem>
#include <string>

#include "error.hpp"
#include "utils.hpp"

namespace imgenc::common::utils {

/**
 * Creates a temporary directory using mkdtemp.
 *
 * @param dir Directory path where the temporary directory will be created.
 *            If empty, the system's temp directory will be used.
 * @param pattern Directory name pattern. The pattern must end with ".XXXXXX",
 *                where each 'X' will be replaced by a random character.
 *                If the pattern doesn't end with ".XXXXXX", it will be appended.
 *                If empty, "tmp.XXXXXX" will be used.
 * @return RetWithError<std::string> containing the path of the created directory.
 */
RetWithError<std::string> MkTmpDir(const std::string& dir = "", const std::string& pattern = "");

/**
 * Reads whole file.
 *
 * @param path file path.
 * @return RetWithError<Bytes>.
 */
RetWithError<Bytes> ReadFile(const std::string& path);

/**
 * Writes file atomically: data goes to a temporary file in the same directory which is renamed afterwards.
 *
 * @param path file path.
 * @param data file data.
 * @return Error.
 */
Error WriteFileAtomic(const std::string& path, const Bytes& data);

/**
 * Joins base path and one or more entries into a single path.
 *
 * @param base base path.
 * @param entry first path entry.
 * @param entries additional path entries (variadic).
 * @return std::string.
 */
template <typename... Args>
std::string JoinPath(const std::string& base, const std::string& entry, Args&&... entries)
{
    auto path = std::filesystem::path(base) / entry;

    if constexpr (sizeof...(entries) > 0) {
        ((path /= std::forward<Args>(entries)), ...);
    }

    return path.string();
}

} // namespace imgenc::common::utils

#endif
