/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <config/config.hpp>

using namespace testing;

namespace imgenc::config {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cNotExistsFileName     = "not_exists.json";
constexpr auto cInvalidConfigFileName = "invalid.json";
constexpr auto cConfigFileName        = "imgenc.json";
constexpr auto cDefaultValuesFileName = "default_values.json";
constexpr auto cWrongValuesFileName   = "wrong_values.json";
constexpr auto cTestConfigJSON        = R"({
    "workingDir": "workingDir",
    "contentDir": "/var/imgenc/content",
    "LeaseExpiration": "10m",
    "maxConcurrentTransforms": 8,
    "gc": {
        "enabled": false,
        "collectPeriod": "1h1m5s"
    },
    "logging": {
        "level": "debug",
        "backend": "syslog"
    }
})";
constexpr auto cDefaultValuesJSON     = R"({
    "workingDir": "test"
})";
constexpr auto cWrongValuesJSON       = R"({
    "maxConcurrentTransforms": 0
})";
constexpr auto cInvalidJSON           = R"({"invalid json" : {,})";

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ConfigTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        if (std::ofstream file(cConfigFileName); file.good()) {
            file << cTestConfigJSON;
        }

        if (std::ofstream file(cDefaultValuesFileName); file.good()) {
            file << cDefaultValuesJSON;
        }

        if (std::ofstream file(cWrongValuesFileName); file.good()) {
            file << cWrongValuesJSON;
        }

        if (std::ofstream file(cInvalidConfigFileName); file.good()) {
            file << cInvalidJSON;
        }

        std::remove(cNotExistsFileName);
    }

    void TearDown() override
    {
        std::remove(cConfigFileName);
        std::remove(cDefaultValuesFileName);
        std::remove(cWrongValuesFileName);
        std::remove(cInvalidConfigFileName);
    }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ConfigTest, ParseConfig)
{
    Config config;

    auto err = ParseConfig(cConfigFileName, config);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(config.mWorkingDir, "workingDir");
    EXPECT_EQ(config.mContentDir, "/var/imgenc/content");
    EXPECT_EQ(config.mLeaseExpiration, std::chrono::minutes(10));
    EXPECT_EQ(config.mMaxConcurrentTransforms, 8U);

    EXPECT_FALSE(config.mGC.mEnabled);
    EXPECT_EQ(config.mGC.mCollectPeriod, std::chrono::hours(1) + std::chrono::minutes(1) + std::chrono::seconds(5));

    EXPECT_EQ(config.mLogging.mLevel.GetValue(), aos::LogLevelEnum::eDebug);
    EXPECT_EQ(config.mLogging.mBackend, common::logger::Logger::Backend::eSyslog);
}

TEST_F(ConfigTest, DefaultValues)
{
    Config config;

    auto err = ParseConfig(cDefaultValuesFileName, config);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(config.mWorkingDir, "test");
    EXPECT_EQ(config.mContentDir, "test/content");
    EXPECT_EQ(config.mLeaseExpiration, std::chrono::minutes(5));
    EXPECT_EQ(config.mMaxConcurrentTransforms, 4U);

    EXPECT_TRUE(config.mGC.mEnabled);
    EXPECT_EQ(config.mGC.mCollectPeriod, std::chrono::minutes(1));

    EXPECT_EQ(config.mLogging.mLevel.GetValue(), aos::LogLevelEnum::eInfo);
    EXPECT_EQ(config.mLogging.mBackend, common::logger::Logger::Backend::eStdIO);
}

TEST_F(ConfigTest, WrongValues)
{
    Config config;

    EXPECT_TRUE(ParseConfig(cWrongValuesFileName, config).Is(ErrorEnum::eInvalidArgument));
}

TEST_F(ConfigTest, ErrorReturnedOnFileMissing)
{
    Config config;

    EXPECT_TRUE(ParseConfig(cNotExistsFileName, config).Is(ErrorEnum::eNotFound));
}

TEST_F(ConfigTest, ErrorReturnedOnInvalidJSONData)
{
    Config config;

    EXPECT_TRUE(ParseConfig(cInvalidConfigFileName, config).Is(ErrorEnum::eFailed));
}

} // namespace imgenc::config
