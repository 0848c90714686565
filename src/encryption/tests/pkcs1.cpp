/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <common/tests/utils/crypto.hpp>
#include <common/utils/json.hpp>
#include <encryption/keywrap/pkcs1.hpp>

using namespace testing;

namespace imgenc::encryption::keywrap {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string JoinEntries(const std::vector<std::string>& entries)
{
    std::string result;

    for (const auto& entry : entries) {
        if (!result.empty()) {
            result += ",";
        }

        result += entry;
    }

    return result;
}

bool IsCryptoFailure(const Error& err)
{
    return IsTransformError(err, TransformErrorEnum::eCryptoFailure);
}

bool IsKeyRequired(const Error& err)
{
    return IsTransformError(err, TransformErrorEnum::eDecryptionKeyRequired);
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class PKCS1KeyWrapperTest : public Test {
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

    EncryptConfig CreateEncryptConfig(const std::vector<Bytes>& pubKeys, const std::vector<Bytes>& privKeys = {})
    {
        EncryptConfig ec;

        ec.mParameters[cParamPubKeys]                  = pubKeys;
        ec.mDecryptConfig.mParameters[cParamPrivKeys] = privKeys;

        return ec;
    }

    DecryptConfig CreateDecryptConfig(const std::vector<Bytes>& privKeys, const std::vector<Bytes>& passwords = {})
    {
        DecryptConfig dc;

        dc.mParameters[cParamPrivKeys]          = privKeys;
        dc.mParameters[cParamPrivKeysPasswords] = passwords;

        return dc;
    }

    static tests::utils::KeyPair sFirstKey;
    static tests::utils::KeyPair sSecondKey;

    PKCS1KeyWrapper mWrapper;
    Bytes           mOptsData = common::utils::ToBytes(R"({"symkey":"c2VjcmV0","cipheroptions":{}})");
};

tests::utils::KeyPair PKCS1KeyWrapperTest::sFirstKey;
tests::utils::KeyPair PKCS1KeyWrapperTest::sSecondKey;

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(PKCS1KeyWrapperTest, Recipients)
{
    EXPECT_EQ(mWrapper.GetAnnotationID(), "org.opencontainers.image.enc.keys.pkcs1");

    EXPECT_TRUE(mWrapper.HasRecipients(CreateEncryptConfig({sFirstKey.mPublicKey})));
    EXPECT_FALSE(mWrapper.HasRecipients(CreateEncryptConfig({})));
    EXPECT_FALSE(mWrapper.HasRecipients(EncryptConfig()));

    EXPECT_FALSE(mWrapper.NoPossibleKeys(CreateDecryptConfig({sFirstKey.mPrivateKey})));
    EXPECT_TRUE(mWrapper.NoPossibleKeys(DecryptConfig()));
}

TEST_F(PKCS1KeyWrapperTest, WrapUnwrap)
{
    auto [entries, err] = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    ASSERT_EQ(entries.size(), 1U);

    auto [entryData, decodeErr] = common::utils::Base64Decode(entries[0]);
    ASSERT_TRUE(decodeErr.IsNone());

    auto [json, parseErr] = common::utils::ParseJson(common::utils::ToString(entryData));
    ASSERT_TRUE(parseErr.IsNone());

    common::utils::CaseInsensitiveObjectWrapper entry(json);

    EXPECT_EQ(entry.GetValue<std::string>("hash"), "sha256");
    EXPECT_FALSE(entry.GetValue<std::string>("wrappedkey").empty());

    auto [optsData, unwrapErr] = mWrapper.UnwrapKey(CreateDecryptConfig({sFirstKey.mPrivateKey}), entries[0]);
    ASSERT_TRUE(unwrapErr.IsNone()) << aos::tests::utils::ErrorToStr(unwrapErr);

    EXPECT_EQ(optsData, mOptsData);
}

TEST_F(PKCS1KeyWrapperTest, MultipleRecipients)
{
    auto [entries, err]
        = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey, sSecondKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    ASSERT_EQ(entries.size(), 2U);

    auto annotation = JoinEntries(entries);

    for (const auto* keyPair : {&sFirstKey, &sSecondKey}) {
        auto [optsData, unwrapErr] = mWrapper.UnwrapKey(CreateDecryptConfig({keyPair->mPrivateKey}), annotation);
        ASSERT_TRUE(unwrapErr.IsNone()) << aos::tests::utils::ErrorToStr(unwrapErr);

        EXPECT_EQ(optsData, mOptsData);
    }
}

TEST_F(PKCS1KeyWrapperTest, WrongKeyRequiresDecryptionKey)
{
    auto [entries, err] = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone());

    auto result = mWrapper.UnwrapKey(CreateDecryptConfig({sSecondKey.mPrivateKey}), entries[0]);

    EXPECT_TRUE(IsKeyRequired(result.mError)) << aos::tests::utils::ErrorToStr(result.mError);
}

TEST_F(PKCS1KeyWrapperTest, EncryptedPrivateKey)
{
    auto password = common::utils::ToBytes("secret");

    auto [keyPair, err] = tests::utils::GenerateRSAKeyPair(2048, password);
    ASSERT_TRUE(err.IsNone());

    std::vector<std::string> entries;

    Tie(entries, err) = mWrapper.WrapKeys(CreateEncryptConfig({keyPair.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone());

    auto result = mWrapper.UnwrapKey(
        CreateDecryptConfig({sFirstKey.mPrivateKey, keyPair.mPrivateKey}, {Bytes(), password}), entries[0]);
    ASSERT_TRUE(result.mError.IsNone()) << aos::tests::utils::ErrorToStr(result.mError);

    EXPECT_EQ(result.mValue, mOptsData);

    result = mWrapper.UnwrapKey(CreateDecryptConfig({keyPair.mPrivateKey}), entries[0]);

    EXPECT_TRUE(IsCryptoFailure(result.mError)) << aos::tests::utils::ErrorToStr(result.mError);
}

TEST_F(PKCS1KeyWrapperTest, NonRSAKeysAreSkipped)
{
    auto [ecKey, err] = tests::utils::GenerateECKeyPair();
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    std::vector<std::string> entries;

    Tie(entries, err) = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone());

    auto result = mWrapper.UnwrapKey(CreateDecryptConfig({ecKey.mPrivateKey, sFirstKey.mPrivateKey}), entries[0]);
    ASSERT_TRUE(result.mError.IsNone()) << aos::tests::utils::ErrorToStr(result.mError);

    EXPECT_TRUE(IsCryptoFailure(mWrapper.WrapKeys(CreateEncryptConfig({ecKey.mPublicKey}), mOptsData).mError));
}

TEST_F(PKCS1KeyWrapperTest, MalformedAnnotation)
{
    auto dc = CreateDecryptConfig({sFirstKey.mPrivateKey});

    EXPECT_TRUE(IsCryptoFailure(mWrapper.UnwrapKey(dc, "").mError));
    EXPECT_TRUE(IsCryptoFailure(mWrapper.UnwrapKey(dc, "!!!not base64!!!").mError));
    auto malformed = mWrapper.UnwrapKey(dc, common::utils::Base64Encode(common::utils::ToBytes("{")));

    EXPECT_TRUE(IsCryptoFailure(malformed.mError));

    auto noWrappedKey = common::utils::Base64Encode(common::utils::ToBytes(R"({"hash":"sha256"})"));

    EXPECT_TRUE(IsCryptoFailure(mWrapper.UnwrapKey(dc, noWrappedKey).mError));
}

TEST_F(PKCS1KeyWrapperTest, UnsupportedHash)
{
    auto sha1Entry = common::utils::Base64Encode(
        common::utils::ToBytes(R"({"hash":"sha1","wrappedkey":")" + common::utils::Base64Encode(mOptsData) + "\"}"));

    auto result = mWrapper.UnwrapKey(CreateDecryptConfig({sFirstKey.mPrivateKey}), sha1Entry);

    EXPECT_TRUE(IsCryptoFailure(result.mError)) << aos::tests::utils::ErrorToStr(result.mError);
}

TEST_F(PKCS1KeyWrapperTest, UnsupportedHashEntryIsSkipped)
{
    auto [entries, err] = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    ASSERT_EQ(entries.size(), 1U);

    auto sha1Entry = common::utils::Base64Encode(
        common::utils::ToBytes(R"({"hash":"sha1","wrappedkey":")" + common::utils::Base64Encode(mOptsData) + "\"}"));

    auto [optsData, unwrapErr]
        = mWrapper.UnwrapKey(CreateDecryptConfig({sFirstKey.mPrivateKey}), JoinEntries({sha1Entry, entries[0]}));
    ASSERT_TRUE(unwrapErr.IsNone()) << aos::tests::utils::ErrorToStr(unwrapErr);

    EXPECT_EQ(optsData, mOptsData);
}

TEST_F(PKCS1KeyWrapperTest, FilterNewRecipients)
{
    auto [entries, err] = mWrapper.WrapKeys(CreateEncryptConfig({sFirstKey.mPublicKey}), mOptsData);
    ASSERT_TRUE(err.IsNone());

    auto ec = CreateEncryptConfig({sFirstKey.mPublicKey, sSecondKey.mPublicKey}, {sFirstKey.mPrivateKey});

    auto [filtered, filterErr] = mWrapper.FilterNewRecipients(ec, entries[0]);
    ASSERT_TRUE(filterErr.IsNone()) << aos::tests::utils::ErrorToStr(filterErr);

    EXPECT_EQ(GetParameter(filtered.mParameters, cParamPubKeys), std::vector<Bytes> {sSecondKey.mPublicKey});

    Tie(filtered, filterErr) = mWrapper.FilterNewRecipients(
        CreateEncryptConfig({sFirstKey.mPublicKey}, {sSecondKey.mPrivateKey}), entries[0]);
    ASSERT_TRUE(filterErr.IsNone()) << aos::tests::utils::ErrorToStr(filterErr);

    EXPECT_EQ(GetParameter(filtered.mParameters, cParamPubKeys), std::vector<Bytes> {sFirstKey.mPublicKey});
}

} // namespace imgenc::encryption::keywrap
