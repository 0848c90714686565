/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/tests/utils/crypto.hpp>
#include <common/utils/context.hpp>
#include <common/utils/cryptohelper.hpp>
#include <common/utils/digest.hpp>
#include <common/utils/time.hpp>
#include <common/utils/utils.hpp>

using namespace testing;

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class UtilsTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(UtilsTest, Base64)
{
    EXPECT_EQ(Base64Encode(ToBytes("hello world")), "aGVsbG8gd29ybGQ=");

    auto [data, err] = Base64Decode("aGVsbG8gd29ybGQ=");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(ToString(data), "hello world");

    Bytes large(1024, 0xAB);

    auto encoded = Base64Encode(large);

    EXPECT_EQ(encoded.find('\n'), std::string::npos);
    EXPECT_EQ(Base64Decode(encoded).mValue, large);
}

TEST_F(UtilsTest, Split)
{
    EXPECT_EQ(Split("linux/arm64/v8", "/"), std::vector<std::string>({"linux", "arm64", "v8"}));
    EXPECT_EQ(Split("a, b,,c", ","), std::vector<std::string>({"a", "b", "c"}));
    EXPECT_TRUE(Split("", ",").empty());
}

TEST_F(UtilsTest, Digest)
{
    auto digest = CalculateDigest(ToBytes("hello world"));

    EXPECT_EQ(digest, "sha256:b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");

    EXPECT_TRUE(ValidateDigest(digest).IsNone());
    EXPECT_TRUE(VerifyDigest(digest, ToBytes("hello world")).IsNone());

    EXPECT_TRUE(VerifyDigest(digest, ToBytes("hello")).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(ValidateDigest("sha256:1234").Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(ValidateDigest("md5:b94d27b9934d3e08a52e52d7da7dabfa").Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(ValidateDigest("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9")
                    .Is(ErrorEnum::eInvalidArgument));

    auto [algorithm, hex] = ParseDigest(digest);

    EXPECT_EQ(algorithm, "sha256");
    EXPECT_EQ(hex.size(), 64U);
}

TEST_F(UtilsTest, ParseDuration)
{
    struct TestCase {
        std::string mDuration;
        Duration    mExpected;
    };

    std::vector<TestCase> testCases = {
        {"0", Duration {}},
        {"5m", std::chrono::minutes(5)},
        {"1h1m5s", std::chrono::hours(1) + std::chrono::minutes(1) + std::chrono::seconds(5)},
        {"100ms", std::chrono::milliseconds(100)},
        {"PT10M", std::chrono::minutes(10)},
    };

    for (const auto& testCase : testCases) {
        auto [duration, err] = ParseDuration(testCase.mDuration);
        ASSERT_TRUE(err.IsNone()) << testCase.mDuration << ": " << aos::tests::utils::ErrorToStr(err);

        EXPECT_EQ(duration, testCase.mExpected) << testCase.mDuration;
    }

    EXPECT_TRUE(ParseDuration("five minutes").mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(UtilsTest, UTCTime)
{
    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());

    auto [str, err] = ToUTCString(now);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    Time parsed;

    Tie(parsed, err) = FromUTCString(str);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_LE(std::chrono::abs(parsed - now), std::chrono::milliseconds(1));

    Tie(parsed, err) = FromUTCString("2024-12-31T23:59:59Z");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(parsed.time_since_epoch()).count(), 1735689599);

    EXPECT_TRUE(FromUTCString("yesterday").mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(UtilsTest, NowMatchesPersistedPrecision)
{
    auto now = Now();

    EXPECT_EQ(now.time_since_epoch() % std::chrono::microseconds(1), Duration::zero());

    auto [str, err] = ToUTCString(now);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [parsed, parseErr] = FromUTCString(str);
    ASSERT_TRUE(parseErr.IsNone()) << aos::tests::utils::ErrorToStr(parseErr);

    EXPECT_EQ(parsed, now);
}

TEST_F(UtilsTest, Context)
{
    Context ctx;

    EXPECT_TRUE(ctx.Err().IsNone());
    EXPECT_FALSE(ctx.IsDone());

    ctx.Cancel();

    EXPECT_TRUE(IsTransformError(ctx.Err(), TransformErrorEnum::eCancelled));
    EXPECT_TRUE(ctx.IsDone());

    Context timeoutCtx(std::chrono::milliseconds(10));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_TRUE(IsTransformError(timeoutCtx.Err(), TransformErrorEnum::eCancelled));
}

TEST_F(UtilsTest, LoadKeys)
{
    auto [keyPair, err] = tests::utils::GenerateRSAKeyPair();
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [publicKey, pubErr] = LoadPublicKey(keyPair.mPublicKey);
    ASSERT_TRUE(pubErr.IsNone()) << aos::tests::utils::ErrorToStr(pubErr);

    auto [privateKey, privErr] = LoadPrivateKey(keyPair.mPrivateKey);
    ASSERT_TRUE(privErr.IsNone()) << aos::tests::utils::ErrorToStr(privErr);

    EXPECT_TRUE(IsSameKey(publicKey, privateKey));

    Bytes cert;

    Tie(cert, err) = tests::utils::GenerateCertificate(keyPair.mPrivateKey);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    PKeyPtr certKey;

    Tie(certKey, pubErr) = LoadPublicKey(cert);
    ASSERT_TRUE(pubErr.IsNone()) << aos::tests::utils::ErrorToStr(pubErr);

    EXPECT_TRUE(IsSameKey(certKey, publicKey));

    auto other = tests::utils::GenerateRSAKeyPair();
    ASSERT_TRUE(other.mError.IsNone());

    EXPECT_FALSE(IsSameKey(LoadPublicKey(other.mValue.mPublicKey).mValue, publicKey));

    EXPECT_TRUE(LoadPublicKey(ToBytes("not a key")).mError.Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(LoadPublicKey({}).mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(UtilsTest, LoadEncryptedPrivateKey)
{
    auto password = ToBytes("secret");

    auto [keyPair, err] = tests::utils::GenerateRSAKeyPair(2048, password);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_TRUE(LoadPrivateKey(keyPair.mPrivateKey, password).mError.IsNone());
    EXPECT_TRUE(LoadPrivateKey(keyPair.mPrivateKey).mError.Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(LoadPrivateKey(keyPair.mPrivateKey, ToBytes("wrong")).mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(UtilsTest, GenerateRandom)
{
    auto [first, err] = GenerateRandom(32);
    ASSERT_TRUE(err.IsNone());

    auto second = GenerateRandom(32);
    ASSERT_TRUE(second.mError.IsNone());

    EXPECT_EQ(first.size(), 32U);
    EXPECT_NE(first, second.mValue);
}

} // namespace imgenc::common::utils
