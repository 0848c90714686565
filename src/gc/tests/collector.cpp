/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/tests/mocks/contentstoremock.hpp>
#include <common/tests/utils/imagebuilder.hpp>
#include <content/localstore.hpp>
#include <gc/collector.hpp>
#include <gc/labels.hpp>
#include <images/imagestore.hpp>
#include <leases/leasemanager.hpp>

using namespace testing;

namespace imgenc::gc {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cTestDir = "gc_test_dir";

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class CollectorTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        std::filesystem::remove_all(cTestDir);

        ASSERT_TRUE(mContentStore.Init(cTestDir).IsNone());
        ASSERT_TRUE(mLeaseManager.Init(mCollector).IsNone());
        ASSERT_TRUE(mImageStore.Init(mCollector).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cTestDir); }

    void InitCollector(bool enabled = true, Duration period = {})
    {
        config::GC config;

        config.mEnabled       = enabled;
        config.mCollectPeriod = period;

        ASSERT_TRUE(mCollector.Init(config, mContentStore, mLeaseManager, mImageStore).IsNone());
    }

    bool Exists(const std::string& digest) { return mContentStore.GetInfo(digest).mError.IsNone(); }

    void RegisterImage(const std::string& name, const oci::Descriptor& target)
    {
        images::Image image;

        image.mName   = name;
        image.mTarget = target;

        ASSERT_TRUE(mImageStore.Create(image).mError.IsNone());
    }

    content::LocalStore        mContentStore;
    leases::Manager            mLeaseManager;
    images::ImageStore         mImageStore;
    Collector                  mCollector;
    tests::utils::ImageBuilder mBuilder {mContentStore};
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(CollectorTest, UnreferencedBlobsAreRemoved)
{
    InitCollector();

    auto [root, err] = mBuilder.WriteMultiPlatformImage(
        {tests::utils::CreatePlatform("linux", "amd64"), tests::utils::CreatePlatform("linux", "arm64")}, 2);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto orphan = mBuilder.WriteLayer();
    ASSERT_TRUE(orphan.mError.IsNone());

    RegisterImage("app:1.0", root);

    auto [stats, collectErr] = mCollector.Collect();
    ASSERT_TRUE(collectErr.IsNone()) << aos::tests::utils::ErrorToStr(collectErr);

    // index, two manifests, two configs and four layers
    EXPECT_EQ(stats.mMarked, 9U);
    EXPECT_EQ(stats.mRemoved, 1U);

    EXPECT_FALSE(Exists(orphan.mValue.mDigest));

    EXPECT_TRUE(Exists(root.mDigest));
}

TEST_F(CollectorTest, LeaseProtectsContent)
{
    InitCollector();

    auto [lease, err] = mLeaseManager.Create({leases::WithID("lease0")});
    ASSERT_TRUE(err.IsNone());

    auto [layer, layerErr] = mBuilder.WriteLayer();
    ASSERT_TRUE(layerErr.IsNone());

    ASSERT_TRUE(mLeaseManager.AddResource(lease, {layer.mDigest, cResourceContent}).IsNone());

    auto [stats, collectErr] = mCollector.Collect();
    ASSERT_TRUE(collectErr.IsNone());

    EXPECT_EQ(stats.mRemoved, 0U);
    EXPECT_TRUE(Exists(layer.mDigest));

    ASSERT_TRUE(mLeaseManager.Delete(lease, {leases::SynchronousDelete()}).IsNone());

    EXPECT_FALSE(Exists(layer.mDigest));
}

TEST_F(CollectorTest, ReferenceLabelsAreFollowed)
{
    InitCollector();

    auto [manifest, err] = mBuilder.WriteImage(tests::utils::CreatePlatform("linux", "amd64"), 3);
    ASSERT_TRUE(err.IsNone());

    auto [lease, leaseErr] = mLeaseManager.Create({leases::WithRandomID()});
    ASSERT_TRUE(leaseErr.IsNone());

    ASSERT_TRUE(mLeaseManager.AddResource(lease, {manifest.mDigest, cResourceContent}).IsNone());

    auto [stats, collectErr] = mCollector.Collect();
    ASSERT_TRUE(collectErr.IsNone());

    EXPECT_EQ(stats.mMarked, 5U);
    EXPECT_EQ(stats.mRemoved, 0U);
}

TEST_F(CollectorTest, SynchronousImageDeleteRemovesContent)
{
    InitCollector();

    auto [root, err] = mBuilder.WriteImage(tests::utils::CreatePlatform("linux", "amd64"), 2);
    ASSERT_TRUE(err.IsNone());

    RegisterImage("app:1.0", root);

    ASSERT_TRUE(mImageStore.Delete("app:1.0", true).IsNone());

    EXPECT_FALSE(Exists(root.mDigest));
}

TEST_F(CollectorTest, DisabledCollectorKeepsContent)
{
    InitCollector(false);

    auto [layer, err] = mBuilder.WriteLayer();
    ASSERT_TRUE(err.IsNone());

    ASSERT_TRUE(mCollector.Start().IsNone());
    ASSERT_TRUE(mCollector.ScheduleAndWait().IsNone());

    EXPECT_TRUE(Exists(layer.mDigest));

    EXPECT_TRUE(mCollector.Stop().Is(ErrorEnum::eWrongState));
}

TEST_F(CollectorTest, BackgroundCollection)
{
    InitCollector(true, std::chrono::minutes(1));

    ASSERT_TRUE(mCollector.Start().IsNone());
    EXPECT_TRUE(mCollector.Start().Is(ErrorEnum::eWrongState));

    auto [layer, err] = mBuilder.WriteLayer();
    ASSERT_TRUE(err.IsNone());

    ASSERT_TRUE(mCollector.ScheduleAndWait().IsNone());

    EXPECT_FALSE(Exists(layer.mDigest));

    ASSERT_TRUE(mCollector.Stop().IsNone());
}

TEST_F(CollectorTest, BlobUpdatedDuringCollectionIsKept)
{
    NiceMock<content::MockStore> contentStore;

    EXPECT_CALL(contentStore, Walk).WillOnce(Invoke([](const content::StoreItf::WalkFunc& walkFunc) {
        content::Info info;

        info.mDigest    = "sha256:updated";
        info.mCreatedAt = common::utils::Now();
        info.mUpdatedAt = info.mCreatedAt;

        return walkFunc(info);
    }));
    EXPECT_CALL(contentStore, Delete).Times(0);

    ASSERT_TRUE(mCollector.Init(config::GC(), contentStore, mLeaseManager, mImageStore).IsNone());

    auto [stats, err] = mCollector.Collect();
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(stats.mRemoved, 0U);
}

TEST_F(CollectorTest, CollectRequiresInit)
{
    EXPECT_TRUE(mCollector.Collect().mError.Is(ErrorEnum::eWrongState));
}

} // namespace imgenc::gc
