/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <platforms/platforms.hpp>

using namespace testing;

namespace imgenc::platforms {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

oci::Platform CreatePlatform(const std::string& os, const std::string& arch, const std::string& variant = "")
{
    oci::Platform platform;

    platform.mOS           = os;
    platform.mArchitecture = arch;
    platform.mVariant      = variant;

    return platform;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class PlatformsTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(PlatformsTest, Parse)
{
    struct TestCase {
        std::string   mSpecifier;
        oci::Platform mExpected;
    };

    std::vector<TestCase> testCases = {
        {"linux/amd64", CreatePlatform("linux", "amd64")},
        {"Linux/x86_64", CreatePlatform("linux", "amd64")},
        {"linux/arm64", CreatePlatform("linux", "arm64")},
        {"linux/aarch64/v8", CreatePlatform("linux", "arm64")},
        {"linux/arm", CreatePlatform("linux", "arm", "v7")},
        {"linux/arm/6", CreatePlatform("linux", "arm", "v6")},
        {"linux/armhf", CreatePlatform("linux", "arm", "v7")},
        {"linux/i386", CreatePlatform("linux", "386")},
        {"macos/arm64", CreatePlatform("darwin", "arm64")},
        {"windows/amd64", CreatePlatform("windows", "amd64")},
    };

    for (const auto& testCase : testCases) {
        auto [platform, err] = Parse(testCase.mSpecifier);
        ASSERT_TRUE(err.IsNone()) << testCase.mSpecifier << ": " << aos::tests::utils::ErrorToStr(err);

        EXPECT_EQ(platform, testCase.mExpected) << testCase.mSpecifier;
    }
}

TEST_F(PlatformsTest, ParseOSOnlyUsesHostArchitecture)
{
    auto [platform, err] = Parse("linux");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(platform.mOS, "linux");
    EXPECT_EQ(platform.mArchitecture, Default().mArchitecture);
}

TEST_F(PlatformsTest, ParseInvalid)
{
    EXPECT_TRUE(Parse("linux/arm/v7/extra").mError.Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(Parse("linux//amd64").mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(PlatformsTest, Format)
{
    EXPECT_EQ(Format(CreatePlatform("linux", "amd64")), "linux/amd64");
    EXPECT_EQ(Format(CreatePlatform("linux", "arm", "v7")), "linux/arm/v7");
    EXPECT_EQ(Format(CreatePlatform("", "amd64")), "unknown/amd64");
}

TEST_F(PlatformsTest, Match)
{
    Matcher matcher(CreatePlatform("linux", "amd64"));

    EXPECT_TRUE(matcher.Match(CreatePlatform("linux", "amd64")));
    EXPECT_TRUE(matcher.Match(CreatePlatform("Linux", "x86_64")));
    EXPECT_FALSE(matcher.Match(CreatePlatform("linux", "arm64")));
    EXPECT_FALSE(matcher.Match(CreatePlatform("windows", "amd64")));
}

TEST_F(PlatformsTest, MatchVariant)
{
    Matcher armV7(CreatePlatform("linux", "arm", "v7"));

    EXPECT_TRUE(armV7.Match(CreatePlatform("linux", "arm")));
    EXPECT_TRUE(armV7.Match(CreatePlatform("linux", "arm", "7")));
    EXPECT_FALSE(armV7.Match(CreatePlatform("linux", "arm", "v6")));

    Matcher amd64(CreatePlatform("linux", "amd64"));

    EXPECT_TRUE(amd64.Match(CreatePlatform("linux", "amd64", "v3")));
}

TEST_F(PlatformsTest, MatchAny)
{
    Matcher matcher(std::vector<oci::Platform> {CreatePlatform("linux", "amd64"), CreatePlatform("linux", "arm64")});

    EXPECT_TRUE(matcher.Match(CreatePlatform("linux", "amd64")));
    EXPECT_TRUE(matcher.Match(CreatePlatform("linux", "aarch64")));
    EXPECT_FALSE(matcher.Match(CreatePlatform("linux", "arm", "v7")));
}

} // namespace imgenc::platforms
