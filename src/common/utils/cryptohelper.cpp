/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <sstream>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include "cryptohelper.hpp"
#include "exception.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Statics
 **********************************************************************************************************************/

namespace {

using BIOPtr  = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

BIOPtr CreateMemBIO(const Bytes& data)
{
    return BIOPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
}

PKeyPtr MakePKeyPtr(EVP_PKEY* pkey)
{
    return PKeyPtr(pkey, EVP_PKEY_free);
}

bool IsPEM(const Bytes& data)
{
    static constexpr auto cPEMPrefix = "-----BEGIN";

    auto str = std::string(data.begin(), data.end());

    return str.find(cPEMPrefix) != std::string::npos;
}

int PasswordCallback(char* buf, int size, int, void* userData)
{
    const auto* password = static_cast<const Bytes*>(userData);

    if (!password || password->empty() || static_cast<int>(password->size()) > size) {
        return -1;
    }

    std::memcpy(buf, password->data(), password->size());

    return static_cast<int>(password->size());
}

EVP_PKEY* ReadPublicKeyPEM(const Bytes& data)
{
    auto bio = CreateMemBIO(data);
    if (!bio) {
        return nullptr;
    }

    if (auto pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr); pkey) {
        return pkey;
    }

    ERR_clear_error();

    bio = CreateMemBIO(data);
    if (!bio) {
        return nullptr;
    }

    auto cert = X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free);
    if (!cert) {
        return nullptr;
    }

    return X509_get_pubkey(cert.get());
}

EVP_PKEY* ReadPublicKeyDER(const Bytes& data)
{
    const unsigned char* ptr = data.data();

    if (auto pkey = d2i_PUBKEY(nullptr, &ptr, static_cast<long>(data.size())); pkey) {
        return pkey;
    }

    ERR_clear_error();

    ptr = data.data();

    auto cert = X509Ptr(d2i_X509(nullptr, &ptr, static_cast<long>(data.size())), X509_free);
    if (!cert) {
        return nullptr;
    }

    return X509_get_pubkey(cert.get());
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

std::string GetOpensslErrorString()
{
    std::ostringstream oss;
    unsigned long      errCode;

    while ((errCode = ERR_get_error()) != 0) {
        char buf[256];

        ERR_error_string_n(errCode, buf, sizeof(buf));
        oss << buf << std::endl;
    }

    return oss.str();
}

RetWithError<PKeyPtr> LoadPublicKey(const Bytes& data)
{
    if (data.empty()) {
        return {nullptr, Error(ErrorEnum::eInvalidArgument, "empty public key")};
    }

    auto pkey = IsPEM(data) ? ReadPublicKeyPEM(data) : ReadPublicKeyDER(data);
    if (!pkey) {
        auto message = "can't load public key: " + GetOpensslErrorString();

        return {nullptr, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, message.c_str()))};
    }

    return MakePKeyPtr(pkey);
}

RetWithError<PKeyPtr> LoadPrivateKey(const Bytes& data, const Bytes& password)
{
    if (data.empty()) {
        return {nullptr, Error(ErrorEnum::eInvalidArgument, "empty private key")};
    }

    EVP_PKEY* pkey = nullptr;

    if (IsPEM(data)) {
        auto bio = CreateMemBIO(data);
        if (!bio) {
            return {nullptr, AOS_ERROR_WRAP(Error(ErrorEnum::eRuntime, GetOpensslErrorString().c_str()))};
        }

        pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, PasswordCallback, const_cast<Bytes*>(&password));
    } else {
        const unsigned char* ptr = data.data();

        pkey = d2i_AutoPrivateKey(nullptr, &ptr, static_cast<long>(data.size()));
    }

    if (!pkey) {
        auto message = "can't load private key: " + GetOpensslErrorString();

        return {nullptr, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, message.c_str()))};
    }

    return MakePKeyPtr(pkey);
}

bool IsSameKey(const PKeyPtr& lhs, const PKeyPtr& rhs)
{
    if (!lhs || !rhs) {
        return false;
    }

    return EVP_PKEY_eq(lhs.get(), rhs.get()) == 1;
}

RetWithError<Bytes> GenerateRandom(size_t size)
{
    Bytes data(size);

    if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
        return {Bytes(), AOS_ERROR_WRAP(TransformError(TransformErrorEnum::eCryptoFailure, GetOpensslErrorString()))};
    }

    return data;
}

} // namespace imgenc::common::utils
