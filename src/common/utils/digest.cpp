/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <regex>
#include <unordered_map>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include "digest.hpp"
#include "exception.hpp"

namespace {

const std::unordered_map<std::string, std::regex> cAnchoredEncodedRegexps
    = {{"sha256", std::regex(R"(^[a-f0-9]{64}$)")}, {"sha384", std::regex(R"(^[a-f0-9]{96}$)")},
        {"sha512", std::regex(R"(^[a-f0-9]{128}$)")}};

} // namespace

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static Poco::SHA2Engine::ALGORITHM ToSHA2Algorithm(const std::string& algorithm)
{
    if (algorithm == "sha384") {
        return Poco::SHA2Engine::SHA_384;
    }

    if (algorithm == "sha512") {
        return Poco::SHA2Engine::SHA_512;
    }

    return Poco::SHA2Engine::SHA_256;
}

static std::string HashHex(const std::string& algorithm, const Bytes& data)
{
    Poco::SHA2Engine engine(ToSHA2Algorithm(algorithm));

    engine.update(data.data(), static_cast<unsigned>(data.size()));

    return Poco::DigestEngine::digestToHex(engine.digest());
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::pair<std::string, std::string> ParseDigest(const Digest& digest)
{
    auto pos = digest.find(':');
    if (pos == std::string::npos) {
        return {digest, ""};
    }

    return {digest.substr(0, pos), digest.substr(pos + 1)};
}

Error ValidateDigest(const Digest& digest)
{
    auto [algorithm, hex] = ParseDigest(digest);

    std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(), ::tolower);

    auto it = cAnchoredEncodedRegexps.find(algorithm);
    if (it == cAnchoredEncodedRegexps.end()) {
        return Error(ErrorEnum::eInvalidArgument, "unsupported digest algorithm");
    }

    if (!std::regex_match(hex, it->second)) {
        return Error(ErrorEnum::eInvalidArgument, "invalid digest encoding");
    }

    return ErrorEnum::eNone;
}

Digest CalculateDigest(const Bytes& data)
{
    return std::string(cDigestAlgorithm) + ":" + HashHex(cDigestAlgorithm, data);
}

Error VerifyDigest(const Digest& digest, const Bytes& data)
{
    if (auto err = ValidateDigest(digest); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    auto [algorithm, hex] = ParseDigest(digest);

    if (HashHex(algorithm, data) != hex) {
        return Error(ErrorEnum::eInvalidArgument, "digest mismatch");
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::utils
