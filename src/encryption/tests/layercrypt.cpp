/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/tests/utils/crypto.hpp>
#include <common/utils/cryptohelper.hpp>
#include <common/utils/digest.hpp>
#include <common/utils/utils.hpp>
#include <encryption/keywrap/pkcs1.hpp>
#include <encryption/layercrypt.hpp>

using namespace testing;

namespace imgenc::encryption {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class LayerCryptorTest : public Test {
protected:
    static void SetUpTestSuite()
    {
        aos::tests::utils::InitLog();

        for (auto* keyPair : {&sFirstKey, &sSecondKey}) {
            auto [generated, err] = tests::utils::GenerateRSAKeyPair();
            ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

            *keyPair = generated;
        }
    }

    void SetUp() override
    {
        ASSERT_TRUE(mCryptor.Init().IsNone());

        auto [plain, err] = common::utils::GenerateRandom(2048);
        ASSERT_TRUE(err.IsNone());

        mPlain = plain;

        mDesc.mMediaType                                       = oci::cMediaTypeImageLayerGzip;
        mDesc.mDigest                                          = common::utils::CalculateDigest(mPlain);
        mDesc.mSize                                            = mPlain.size();
        mDesc.mAnnotations["org.opencontainers.image.title"] = "rootfs";
    }

    EncryptConfig CreateEncryptConfig(const std::vector<Bytes>& pubKeys, const std::vector<Bytes>& privKeys = {})
    {
        EncryptConfig ec;

        ec.mParameters[cParamPubKeys]                  = pubKeys;
        ec.mDecryptConfig.mParameters[cParamPrivKeys] = privKeys;

        return ec;
    }

    DecryptConfig CreateDecryptConfig(const std::vector<Bytes>& privKeys)
    {
        DecryptConfig dc;

        dc.mParameters[cParamPrivKeys] = privKeys;

        return dc;
    }

    static tests::utils::KeyPair sFirstKey;
    static tests::utils::KeyPair sSecondKey;

    LayerCryptor    mCryptor;
    Bytes           mPlain;
    oci::Descriptor mDesc;
};

tests::utils::KeyPair LayerCryptorTest::sFirstKey;
tests::utils::KeyPair LayerCryptorTest::sSecondKey;

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(LayerCryptorTest, EncryptDecryptLayer)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    const auto& encDesc = encrypted.mDescriptor;

    EXPECT_EQ(encDesc.mMediaType, oci::cMediaTypeImageLayerGzipEnc);
    EXPECT_EQ(encDesc.mDigest, common::utils::CalculateDigest(encrypted.mData));
    EXPECT_EQ(encDesc.mSize, encrypted.mData.size());
    EXPECT_NE(encDesc.mDigest, mDesc.mDigest);

    EXPECT_EQ(encDesc.mAnnotations.count(keywrap::PKCS1KeyWrapper::cAnnotationID), 1U);
    EXPECT_EQ(encDesc.mAnnotations.count(cAnnotationPubOpts), 1U);
    EXPECT_EQ(encDesc.mAnnotations.at("org.opencontainers.image.title"), "rootfs");

    EXPECT_EQ(mCryptor.GetLayerSchemes(encDesc), std::vector<std::string> {"pkcs1"});

    auto [decrypted, decryptErr]
        = mCryptor.DecryptLayer(CreateDecryptConfig({sFirstKey.mPrivateKey}), encrypted.mData, encDesc);
    ASSERT_TRUE(decryptErr.IsNone()) << aos::tests::utils::ErrorToStr(decryptErr);

    EXPECT_EQ(decrypted.mData, mPlain);
    EXPECT_EQ(decrypted.mDescriptor, mDesc);
}

TEST_F(LayerCryptorTest, MediaTypes)
{
    struct TestCase {
        std::string mPlain;
        std::string mEncrypted;
    };

    std::vector<TestCase> testCases = {
        {oci::cMediaTypeImageLayer, oci::cMediaTypeImageLayerEnc},
        {oci::cMediaTypeImageLayerGzip, oci::cMediaTypeImageLayerGzipEnc},
        {oci::cMediaTypeImageLayerZstd, oci::cMediaTypeImageLayerZstdEnc},
        {oci::cMediaTypeDockerSchema2Layer, oci::cMediaTypeDockerSchema2LayerEnc},
        {oci::cMediaTypeDockerSchema2LayerGzip, oci::cMediaTypeDockerSchema2LayerGzipEnc},
    };

    for (const auto& testCase : testCases) {
        EXPECT_EQ(GetEncryptedMediaType(testCase.mPlain).mValue, testCase.mEncrypted);
        EXPECT_EQ(GetDecryptedMediaType(testCase.mEncrypted).mValue, testCase.mPlain);
    }

    EXPECT_TRUE(GetEncryptedMediaType(oci::cMediaTypeImageLayerNonDistributable).mError.Is(ErrorEnum::eNotSupported));
    EXPECT_TRUE(GetEncryptedMediaType(oci::cMediaTypeImageConfig).mError.Is(ErrorEnum::eNotSupported));
    EXPECT_TRUE(GetDecryptedMediaType(oci::cMediaTypeImageLayerGzip).mError.Is(ErrorEnum::eNotSupported));
}

TEST_F(LayerCryptorTest, EncryptUnsupportedMediaType)
{
    mDesc.mMediaType = oci::cMediaTypeDockerSchema2LayerForeign;

    auto result = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);

    EXPECT_TRUE(result.mError.Is(ErrorEnum::eNotSupported));
}

TEST_F(LayerCryptorTest, EncryptWithoutRecipients)
{
    auto result = mCryptor.EncryptLayer(CreateEncryptConfig({}), mPlain, mDesc);

    EXPECT_TRUE(result.mError.Is(ErrorEnum::eInvalidArgument));
}

TEST_F(LayerCryptorTest, DecryptWithWrongKey)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone());

    auto dc = CreateDecryptConfig({sSecondKey.mPrivateKey});

    auto decryptErr = mCryptor.DecryptLayer(dc, encrypted.mData, encrypted.mDescriptor).mError;
    EXPECT_TRUE(IsTransformError(decryptErr, TransformErrorEnum::eDecryptionKeyRequired));

    auto authErr = mCryptor.CheckLayerAuthorization(dc, encrypted.mDescriptor);
    EXPECT_TRUE(IsTransformError(authErr, TransformErrorEnum::eDecryptionKeyRequired));

    authErr = mCryptor.CheckLayerAuthorization(DecryptConfig(), encrypted.mDescriptor);
    EXPECT_TRUE(IsTransformError(authErr, TransformErrorEnum::eDecryptionKeyRequired));
}

TEST_F(LayerCryptorTest, DecryptMissingAnnotations)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone());

    auto dc = CreateDecryptConfig({sFirstKey.mPrivateKey});

    auto noPubOpts = encrypted.mDescriptor;
    noPubOpts.mAnnotations.erase(cAnnotationPubOpts);

    auto decryptErr = mCryptor.DecryptLayer(dc, encrypted.mData, noPubOpts).mError;
    EXPECT_TRUE(IsTransformError(decryptErr, TransformErrorEnum::eCryptoFailure));

    auto noKeys = encrypted.mDescriptor;
    noKeys.mAnnotations.erase(keywrap::PKCS1KeyWrapper::cAnnotationID);

    decryptErr = mCryptor.DecryptLayer(dc, encrypted.mData, noKeys).mError;
    EXPECT_TRUE(IsTransformError(decryptErr, TransformErrorEnum::eCryptoFailure));
}

TEST_F(LayerCryptorTest, DecryptTamperedLayer)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone());

    encrypted.mData.back() ^= 0x01;

    auto result
        = mCryptor.DecryptLayer(CreateDecryptConfig({sFirstKey.mPrivateKey}), encrypted.mData, encrypted.mDescriptor);

    EXPECT_TRUE(IsTransformError(result.mError, TransformErrorEnum::eCryptoFailure));
}

TEST_F(LayerCryptorTest, AddRecipients)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone());

    auto ec = CreateEncryptConfig({sFirstKey.mPublicKey, sSecondKey.mPublicKey}, {sFirstKey.mPrivateKey});

    auto [updated, addErr] = mCryptor.AddRecipients(ec, encrypted.mDescriptor);
    ASSERT_TRUE(addErr.IsNone()) << aos::tests::utils::ErrorToStr(addErr);

    EXPECT_EQ(updated.mDigest, encrypted.mDescriptor.mDigest);
    EXPECT_EQ(updated.mMediaType, encrypted.mDescriptor.mMediaType);

    const auto& keys = updated.mAnnotations.at(keywrap::PKCS1KeyWrapper::cAnnotationID);

    EXPECT_EQ(common::utils::Split(keys, ",").size(), 2U);

    auto [decrypted, decryptErr]
        = mCryptor.DecryptLayer(CreateDecryptConfig({sSecondKey.mPrivateKey}), encrypted.mData, updated);
    ASSERT_TRUE(decryptErr.IsNone()) << aos::tests::utils::ErrorToStr(decryptErr);

    EXPECT_EQ(decrypted.mData, mPlain);

    // Recipients that can unwrap the layer are not added twice.
    auto knownConfig = CreateEncryptConfig(
        {sFirstKey.mPublicKey, sSecondKey.mPublicKey}, {sFirstKey.mPrivateKey, sSecondKey.mPrivateKey});

    auto [again, againErr] = mCryptor.AddRecipients(knownConfig, updated);
    ASSERT_TRUE(againErr.IsNone());

    EXPECT_EQ(again, updated);
}

TEST_F(LayerCryptorTest, AddRecipientsWithoutKeyKeepsLayer)
{
    auto [encrypted, err] = mCryptor.EncryptLayer(CreateEncryptConfig({sFirstKey.mPublicKey}), mPlain, mDesc);
    ASSERT_TRUE(err.IsNone());

    auto ec = CreateEncryptConfig({sSecondKey.mPublicKey}, {sSecondKey.mPrivateKey});

    auto [updated, addErr] = mCryptor.AddRecipients(ec, encrypted.mDescriptor);
    ASSERT_TRUE(addErr.IsNone()) << aos::tests::utils::ErrorToStr(addErr);

    EXPECT_EQ(updated, encrypted.mDescriptor);
}

TEST_F(LayerCryptorTest, RegisterKeyWrapper)
{
    EXPECT_TRUE(mCryptor.RegisterKeyWrapper(std::make_unique<keywrap::PKCS1KeyWrapper>()).Is(ErrorEnum::eAlreadyExist));
}

} // namespace imgenc::encryption
