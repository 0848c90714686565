/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>

#include "exception.hpp"
#include "filesystem.hpp"

namespace fs = std::filesystem;

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<std::string> MkTmpDir(const std::string& dir, const std::string& pattern)
{
    std::string directory   = dir.empty() ? fs::temp_directory_path().string() : dir;
    std::string tempPattern = pattern.empty() ? "tmp.XXXXXX" : pattern;

    if (tempPattern.length() < 7 || tempPattern.substr(tempPattern.length() - 7) != ".XXXXXX") {
        tempPattern += ".XXXXXX";
    }

    std::string fullPath = (fs::path(directory) / tempPattern).string();

    std::vector<char> mutablePath(fullPath.begin(), fullPath.end());
    mutablePath.push_back('\0');

    char* result = mkdtemp(mutablePath.data());

    if (result == nullptr) {
        return {"", Error(errno, strerror(errno))};
    }

    return {std::string(result), ErrorEnum::eNone};
}

RetWithError<Bytes> ReadFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (!fs::exists(path)) {
            return {Bytes(), Error(ErrorEnum::eNotFound, ("file not found: " + path).c_str())};
        }

        return {Bytes(), Error(errno, ("can't open file: " + path).c_str())};
    }

    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (file.bad()) {
        return {Bytes(), Error(ErrorEnum::eRuntime, ("can't read file: " + path).c_str())};
    }

    return data;
}

Error WriteFileAtomic(const std::string& path, const Bytes& data)
{
    try {
        auto tmpPath = path + ".tmp-" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString();

        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                IMGENC_ERROR_THROW(errno != 0 ? errno : EIO, "can't create file");
            }

            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            file.flush();

            if (!file) {
                std::error_code ec;

                fs::remove(tmpPath, ec);

                IMGENC_ERROR_THROW(errno != 0 ? errno : EIO, "can't write file");
            }
        }

        fs::rename(tmpPath, path);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(ToError(e));
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::utils
