/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <set>
#include <thread>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/utils/digest.hpp>
#include <common/utils/filesystem.hpp>
#include <content/localstore.hpp>

using namespace testing;

namespace imgenc::content {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cTestDir = "content_test_dir";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

oci::Descriptor CreateDescriptor(const Bytes& data)
{
    oci::Descriptor desc;

    desc.mMediaType = oci::cMediaTypeImageLayer;
    desc.mDigest    = common::utils::CalculateDigest(data);
    desc.mSize      = data.size();

    return desc;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class LocalStoreTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        std::filesystem::remove_all(cTestDir);

        ASSERT_TRUE(mStore.Init(cTestDir).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cTestDir); }

    LocalStore mStore;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(LocalStoreTest, WriteAndReadBlob)
{
    auto data = common::utils::ToBytes("layer content");
    auto desc = CreateDescriptor(data);

    auto err = mStore.WriteBlob(desc, data, {{"key", "value"}});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [readData, readErr] = mStore.ReadBlob(desc.mDigest);
    ASSERT_TRUE(readErr.IsNone()) << aos::tests::utils::ErrorToStr(readErr);
    EXPECT_EQ(readData, data);

    auto [info, infoErr] = mStore.GetInfo(desc.mDigest);
    ASSERT_TRUE(infoErr.IsNone()) << aos::tests::utils::ErrorToStr(infoErr);

    EXPECT_EQ(info.mDigest, desc.mDigest);
    EXPECT_EQ(info.mSize, data.size());
    EXPECT_EQ(info.mLabels, (Labels {{"key", "value"}}));

    EXPECT_TRUE(std::filesystem::exists(
        common::utils::JoinPath(cTestDir, "blobs", "sha256", common::utils::ParseDigest(desc.mDigest).second)));
}

TEST_F(LocalStoreTest, WriteBlobVerifiesContent)
{
    auto data = common::utils::ToBytes("layer content");
    auto desc = CreateDescriptor(data);

    auto wrongSize = desc;

    wrongSize.mSize++;

    EXPECT_TRUE(mStore.WriteBlob(wrongSize, data).Is(ErrorEnum::eInvalidArgument));

    auto wrongDigest = desc;

    wrongDigest.mDigest = common::utils::CalculateDigest(common::utils::ToBytes("other content"));

    EXPECT_FALSE(mStore.WriteBlob(wrongDigest, data).IsNone());
    EXPECT_TRUE(mStore.ReadBlob(wrongDigest.mDigest).mError.Is(ErrorEnum::eNotFound));
}

TEST_F(LocalStoreTest, MissingBlobIsNotFound)
{
    auto digest = common::utils::CalculateDigest(common::utils::ToBytes("missing"));

    EXPECT_TRUE(mStore.ReadBlob(digest).mError.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(mStore.GetInfo(digest).mError.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(mStore.Delete(digest).Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(mStore.UpdateLabels(digest, {{"key", "value"}}).mError.Is(ErrorEnum::eNotFound));
}

TEST_F(LocalStoreTest, InvalidDigestIsRejected)
{
    EXPECT_TRUE(mStore.ReadBlob("sha256:invalid").mError.Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(mStore.GetInfo("md5:1234").mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(LocalStoreTest, DuplicateWriteMergesLabelsAndRefreshesUpdateTime)
{
    auto data = common::utils::ToBytes("layer content");
    auto desc = CreateDescriptor(data);

    ASSERT_TRUE(mStore.WriteBlob(desc, data, {{"first", "1"}, {"second", "2"}}).IsNone());

    auto [before, err] = mStore.GetInfo(desc.mDigest);
    ASSERT_TRUE(err.IsNone());

    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    ASSERT_TRUE(mStore.WriteBlob(desc, data, {{"second", ""}, {"third", "3"}}).IsNone());

    auto [after, afterErr] = mStore.GetInfo(desc.mDigest);
    ASSERT_TRUE(afterErr.IsNone());

    EXPECT_EQ(after.mLabels, (Labels {{"first", "1"}, {"third", "3"}}));
    EXPECT_EQ(after.mCreatedAt, before.mCreatedAt);
    EXPECT_GT(after.mUpdatedAt, before.mUpdatedAt);
}

TEST_F(LocalStoreTest, UpdateLabels)
{
    auto data = common::utils::ToBytes("layer content");
    auto desc = CreateDescriptor(data);

    ASSERT_TRUE(mStore.WriteBlob(desc, data, {{"first", "1"}}).IsNone());

    auto [info, err] = mStore.UpdateLabels(desc.mDigest, {{"first", ""}, {"second", "2"}});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(info.mLabels, (Labels {{"second", "2"}}));

    Tie(info, err) = mStore.GetInfo(desc.mDigest);
    ASSERT_TRUE(err.IsNone());

    EXPECT_EQ(info.mLabels, (Labels {{"second", "2"}}));
}

TEST_F(LocalStoreTest, WalkAndDelete)
{
    std::set<std::string> digests;

    for (const auto& content : {"first", "second", "third"}) {
        auto data = common::utils::ToBytes(content);
        auto desc = CreateDescriptor(data);

        ASSERT_TRUE(mStore.WriteBlob(desc, data).IsNone());

        digests.insert(desc.mDigest);
    }

    std::set<std::string> walked;

    auto err = mStore.Walk([&walked](const Info& info) {
        walked.insert(info.mDigest);

        return ErrorEnum::eNone;
    });
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(walked, digests);

    auto deleted = *digests.begin();

    ASSERT_TRUE(mStore.Delete(deleted).IsNone());
    EXPECT_TRUE(mStore.ReadBlob(deleted).mError.Is(ErrorEnum::eNotFound));

    walked.clear();

    ASSERT_TRUE(mStore
                    .Walk([&walked](const Info& info) {
                        walked.insert(info.mDigest);

                        return ErrorEnum::eNone;
                    })
                    .IsNone());

    EXPECT_EQ(walked.size(), digests.size() - 1);
    EXPECT_EQ(walked.count(deleted), 0U);
}

TEST_F(LocalStoreTest, WalkStopsOnError)
{
    for (const auto& content : {"first", "second"}) {
        auto data = common::utils::ToBytes(content);

        ASSERT_TRUE(mStore.WriteBlob(CreateDescriptor(data), data).IsNone());
    }

    size_t count = 0;

    auto err = mStore.Walk([&count](const Info&) {
        count++;

        return Error(ErrorEnum::eFailed, "stop");
    });

    EXPECT_TRUE(err.Is(ErrorEnum::eFailed));
    EXPECT_EQ(count, 1U);
}

TEST_F(LocalStoreTest, MetadataSurvivesReopen)
{
    auto data = common::utils::ToBytes("layer content");
    auto desc = CreateDescriptor(data);

    ASSERT_TRUE(mStore.WriteBlob(desc, data, {{"key", "value"}}).IsNone());

    LocalStore store;

    ASSERT_TRUE(store.Init(cTestDir).IsNone());

    auto [info, err] = store.GetInfo(desc.mDigest);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(info.mLabels, (Labels {{"key", "value"}}));
    EXPECT_EQ(info.mSize, data.size());
}

} // namespace imgenc::content
