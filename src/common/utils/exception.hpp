/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_EXCEPTION_HPP_
#define IMGENC_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <core/common/tools/error.hpp>
#include <core/common/tools/string.hpp>

#include "error.hpp"

/**
 * Helper macros for argument counting
 */
#define _GET_NTH_ARG(_1, _2, NAME, ...) NAME
#define GET_MACRO(NAME)                 NAME

/**
 * Error throw with and without message
 */
#define IMGENC_ERROR_THROW_1(err) throw imgenc::common::utils::ImgEncException(AOS_ERROR_WRAP(aos::Error(err)))
#define IMGENC_ERROR_THROW_2(err, message)                                                                             \
    throw imgenc::common::utils::ImgEncException(AOS_ERROR_WRAP(aos::Error(err)), message)
#define IMGENC_ERROR_THROW(...)                                                                                        \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, IMGENC_ERROR_THROW_2, IMGENC_ERROR_THROW_1))(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define IMGENC_ERROR_CHECK_AND_THROW_1(err)                                                                            \
    if (!aos::Error(err).IsNone()) {                                                                                \
        IMGENC_ERROR_THROW_1(err);                                                                                     \
    }
#define IMGENC_ERROR_CHECK_AND_THROW_2(err, message)                                                                   \
    if (!aos::Error(err).IsNone()) {                                                                                \
        IMGENC_ERROR_THROW_2(err, message);                                                                            \
    }
#define IMGENC_ERROR_CHECK_AND_THROW(...)                                                                              \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, IMGENC_ERROR_CHECK_AND_THROW_2, IMGENC_ERROR_CHECK_AND_THROW_1))(__VA_ARGS__)

namespace imgenc::common::utils {

/**
 * Image encryption exception.
 */
class ImgEncException : public Poco::Exception {
public:
    /**
     * Creates exception instance.
     *
     * @param err error.
     * @param message message.
     */
    explicit ImgEncException(const Error& err, const std::string& message = "");

    /**
     * Returns error.
     *
     * @return Error.
     */
    Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "ImgEnc exception"; }

private:
    Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error to use for exceptions not carrying one.
 *
 * @return Error.
 */
Error ToError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed);

} // namespace imgenc::common::utils

#endif
