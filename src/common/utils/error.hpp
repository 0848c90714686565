/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_ERROR_HPP_
#define IMGENC_COMMON_UTILS_ERROR_HPP_

#include <string>

#include <core/common/tools/error.hpp>

namespace imgenc {

using aos::Error;
using aos::ErrorEnum;
using aos::RetWithError;
using aos::Tie;

/**
 * Transform error kinds reported to callers.
 *
 * Each kind is carried by aos::Error with a dedicated error enum value:
 *  - eNotFound              -> ErrorEnum::eNotFound;
 *  - eMalformedManifest     -> ErrorEnum::eInvalidArgument;
 *  - eCryptoFailure         -> ErrorEnum::eInvalidChecksum;
 *  - eDecryptionKeyRequired -> ErrorEnum::eWrongState;
 *  - eWriteFailure          -> ErrorEnum::eNoMemory;
 *  - eCancelled             -> ErrorEnum::eTimeout.
 *
 * Any other non none error is reported as eFailed.
 */
enum class TransformErrorEnum {
    eNone,
    eNotFound,
    eMalformedManifest,
    eCryptoFailure,
    eDecryptionKeyRequired,
    eWriteFailure,
    eCancelled,
    eFailed,
};

/**
 * Returns error enum value carrying transform error kind.
 *
 * @param kind transform error kind.
 * @return ErrorEnum.
 */
constexpr ErrorEnum ToErrorEnum(TransformErrorEnum kind)
{
    switch (kind) {
    case TransformErrorEnum::eNone:
        return ErrorEnum::eNone;
    case TransformErrorEnum::eNotFound:
        return ErrorEnum::eNotFound;
    case TransformErrorEnum::eMalformedManifest:
        return ErrorEnum::eInvalidArgument;
    case TransformErrorEnum::eCryptoFailure:
        return ErrorEnum::eInvalidChecksum;
    case TransformErrorEnum::eDecryptionKeyRequired:
        return ErrorEnum::eWrongState;
    case TransformErrorEnum::eWriteFailure:
        return ErrorEnum::eNoMemory;
    case TransformErrorEnum::eCancelled:
        return ErrorEnum::eTimeout;
    default:
        return ErrorEnum::eFailed;
    }
}

/**
 * Returns transform error kind string representation.
 *
 * @param kind transform error kind.
 * @return const char*.
 */
const char* TransformErrorToStr(TransformErrorEnum kind);

/**
 * Creates error of transform error kind.
 *
 * @param kind transform error kind.
 * @param message error message, kind name is used if not set.
 * @return Error.
 */
Error TransformError(TransformErrorEnum kind, const char* message = nullptr);

/**
 * Creates error of transform error kind.
 *
 * @param kind transform error kind.
 * @param message error message.
 * @return Error.
 */
inline Error TransformError(TransformErrorEnum kind, const std::string& message)
{
    return TransformError(kind, message.c_str());
}

/**
 * Returns transform error kind of error.
 *
 * @param err error.
 * @return TransformErrorEnum.
 */
TransformErrorEnum GetTransformError(const Error& err);

/**
 * Checks if error has transform error kind.
 *
 * @param err error.
 * @param kind transform error kind.
 * @return bool.
 */
inline bool IsTransformError(const Error& err, TransformErrorEnum kind)
{
    return GetTransformError(err) == kind;
}

} // namespace imgenc

#endif
