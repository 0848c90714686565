/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/tests/utils/imagebuilder.hpp>
#include <content/localstore.hpp>
#include <images/walker.hpp>

using namespace testing;

namespace imgenc::images {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cTestDir = "walker_test_dir";

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ImageWalkerTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override
    {
        std::filesystem::remove_all(cTestDir);

        ASSERT_TRUE(mStore.Init(cTestDir).IsNone());
        ASSERT_TRUE(mWalker.Init(mStore).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(cTestDir); }

    content::LocalStore       mStore;
    ImageWalker               mWalker;
    tests::utils::ImageBuilder mBuilder {mStore};
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ImageWalkerTest, ManifestChildren)
{
    auto platform = tests::utils::CreatePlatform("linux", "amd64");

    auto [config, err] = mBuilder.WriteConfig(platform);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto layer0 = mBuilder.WriteLayer();
    auto layer1 = mBuilder.WriteLayer();

    ASSERT_TRUE(layer0.mError.IsNone());
    ASSERT_TRUE(layer1.mError.IsNone());

    oci::Descriptor manifest;

    Tie(manifest, err) = mBuilder.WriteManifest(config, {layer0.mValue, layer1.mValue});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [children, childrenErr] = mWalker.Children(manifest);
    ASSERT_TRUE(childrenErr.IsNone()) << aos::tests::utils::ErrorToStr(childrenErr);

    ASSERT_EQ(children.size(), 3U);
    EXPECT_EQ(children[0], config);
    EXPECT_EQ(children[1], layer0.mValue);
    EXPECT_EQ(children[2], layer1.mValue);

    Tie(children, childrenErr) = mWalker.Children(layer0.mValue);
    ASSERT_TRUE(childrenErr.IsNone());

    EXPECT_TRUE(children.empty());
}

TEST_F(ImageWalkerTest, WalkVisitsTreeDepthFirst)
{
    auto [root, err] = mBuilder.WriteMultiPlatformImage(
        {tests::utils::CreatePlatform("linux", "amd64"), tests::utils::CreatePlatform("linux", "arm64")}, 2);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    std::vector<std::string> visited;

    err = mWalker.Walk(root, [&visited](const oci::Descriptor& desc) -> RetWithError<WalkAction> {
        visited.push_back(desc.mMediaType);

        return WalkAction::eContinue;
    });
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    std::vector<std::string> expected = {oci::cMediaTypeImageIndex, oci::cMediaTypeImageManifest,
        oci::cMediaTypeImageConfig, oci::cMediaTypeImageLayerGzip, oci::cMediaTypeImageLayerGzip,
        oci::cMediaTypeImageManifest, oci::cMediaTypeImageConfig, oci::cMediaTypeImageLayerGzip,
        oci::cMediaTypeImageLayerGzip};

    EXPECT_EQ(visited, expected);
}

TEST_F(ImageWalkerTest, WalkSkipChildrenAndStop)
{
    auto [root, err] = mBuilder.WriteMultiPlatformImage(
        {tests::utils::CreatePlatform("linux", "amd64"), tests::utils::CreatePlatform("linux", "arm64")}, 2);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    size_t count = 0;

    err = mWalker.Walk(root, [&count](const oci::Descriptor& desc) -> RetWithError<WalkAction> {
        count++;

        return oci::IsManifestType(desc.mMediaType) ? WalkAction::eSkipChildren : WalkAction::eContinue;
    });
    ASSERT_TRUE(err.IsNone());

    EXPECT_EQ(count, 3U);

    count = 0;

    err = mWalker.Walk(root, [&count](const oci::Descriptor& desc) -> RetWithError<WalkAction> {
        count++;

        return oci::IsConfigType(desc.mMediaType) ? WalkAction::eStop : WalkAction::eContinue;
    });
    ASSERT_TRUE(err.IsNone());

    EXPECT_EQ(count, 3U);
}

TEST_F(ImageWalkerTest, WalkReturnsHandlerError)
{
    auto [root, err] = mBuilder.WriteImage(tests::utils::CreatePlatform("linux", "amd64"), 1);
    ASSERT_TRUE(err.IsNone());

    err = mWalker.Walk(root, [](const oci::Descriptor&) -> RetWithError<WalkAction> {
        return {WalkAction::eStop, TransformError(TransformErrorEnum::eCancelled, "cancelled")};
    });

    EXPECT_TRUE(IsTransformError(err, TransformErrorEnum::eCancelled));
}

TEST_F(ImageWalkerTest, MissingBlobIsNotFound)
{
    oci::Descriptor root;

    root.mMediaType = oci::cMediaTypeImageManifest;
    root.mDigest    = "sha256:0000000000000000000000000000000000000000000000000000000000000000";

    auto err = mWalker.Walk(root, [](const oci::Descriptor&) -> RetWithError<WalkAction> {
        return WalkAction::eContinue;
    });

    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound)) << aos::tests::utils::ErrorToStr(err);
}

TEST_F(ImageWalkerTest, MalformedManifest)
{
    auto [root, err] = mBuilder.WriteBlob(oci::cMediaTypeImageManifest, common::utils::ToBytes("{\"layers\": 1"));
    ASSERT_TRUE(err.IsNone());

    EXPECT_TRUE(IsTransformError(mWalker.ReadManifest(root).mError, TransformErrorEnum::eMalformedManifest));
}

TEST_F(ImageWalkerTest, ImageLayerDescriptorsCarryPlatform)
{
    auto amd64 = tests::utils::CreatePlatform("linux", "amd64");
    auto arm64 = tests::utils::CreatePlatform("linux", "arm64", "v8");

    auto [root, err] = mBuilder.WriteMultiPlatformImage({amd64, arm64}, 2);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [layers, layersErr] = mWalker.GetImageLayerDescriptors(root);
    ASSERT_TRUE(layersErr.IsNone()) << aos::tests::utils::ErrorToStr(layersErr);

    ASSERT_EQ(layers.size(), 4U);

    for (size_t i = 0; i < layers.size(); i++) {
        ASSERT_TRUE(layers[i].mPlatform.has_value());
        EXPECT_EQ(*layers[i].mPlatform, i < 2 ? amd64 : arm64);
    }
}

TEST_F(ImageWalkerTest, SingleManifestPlatformFromConfig)
{
    auto platform = tests::utils::CreatePlatform("linux", "arm", "v7");

    auto [root, err] = mBuilder.WriteImage(platform, 3);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    auto [layers, layersErr] = mWalker.GetImageLayerDescriptors(root);
    ASSERT_TRUE(layersErr.IsNone()) << aos::tests::utils::ErrorToStr(layersErr);

    ASSERT_EQ(layers.size(), 3U);

    for (const auto& layer : layers) {
        ASSERT_TRUE(layer.mPlatform.has_value());
        EXPECT_EQ(*layer.mPlatform, platform);
    }
}

TEST_F(ImageWalkerTest, HasEncryptedLayers)
{
    auto platform = tests::utils::CreatePlatform("linux", "amd64");

    auto [plain, err] = mBuilder.WriteImage(platform, 2);
    ASSERT_TRUE(err.IsNone());

    auto [hasEncrypted, checkErr] = mWalker.HasEncryptedLayers(plain);
    ASSERT_TRUE(checkErr.IsNone());

    EXPECT_FALSE(hasEncrypted);

    auto config    = mBuilder.WriteConfig(platform);
    auto encrypted = mBuilder.WriteLayer(512, oci::cMediaTypeImageLayerGzipEnc);

    ASSERT_TRUE(config.mError.IsNone());
    ASSERT_TRUE(encrypted.mError.IsNone());

    oci::Descriptor manifest;

    Tie(manifest, err) = mBuilder.WriteManifest(config.mValue, {encrypted.mValue});
    ASSERT_TRUE(err.IsNone());

    Tie(hasEncrypted, checkErr) = mWalker.HasEncryptedLayers(manifest);
    ASSERT_TRUE(checkErr.IsNone());

    EXPECT_TRUE(hasEncrypted);
}

} // namespace imgenc::images
