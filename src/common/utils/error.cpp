/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "error.hpp"

namespace imgenc {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

const char* TransformErrorToStr(TransformErrorEnum kind)
{
    switch (kind) {
    case TransformErrorEnum::eNone:
        return "none";
    case TransformErrorEnum::eNotFound:
        return "not found";
    case TransformErrorEnum::eMalformedManifest:
        return "malformed manifest";
    case TransformErrorEnum::eCryptoFailure:
        return "crypto failure";
    case TransformErrorEnum::eDecryptionKeyRequired:
        return "decryption key required";
    case TransformErrorEnum::eWriteFailure:
        return "write failure";
    case TransformErrorEnum::eCancelled:
        return "cancelled";
    case TransformErrorEnum::eFailed:
        return "failed";
    }

    return "unknown";
}

Error TransformError(TransformErrorEnum kind, const char* message)
{
    if (kind == TransformErrorEnum::eNone) {
        return ErrorEnum::eNone;
    }

    return Error(ToErrorEnum(kind), message ? message : TransformErrorToStr(kind));
}

TransformErrorEnum GetTransformError(const Error& err)
{
    switch (err.Value()) {
    case ErrorEnum::eNone:
        return TransformErrorEnum::eNone;
    case ErrorEnum::eNotFound:
        return TransformErrorEnum::eNotFound;
    case ErrorEnum::eInvalidArgument:
        return TransformErrorEnum::eMalformedManifest;
    case ErrorEnum::eInvalidChecksum:
        return TransformErrorEnum::eCryptoFailure;
    case ErrorEnum::eWrongState:
        return TransformErrorEnum::eDecryptionKeyRequired;
    case ErrorEnum::eNoMemory:
        return TransformErrorEnum::eWriteFailure;
    case ErrorEnum::eTimeout:
        return TransformErrorEnum::eCancelled;
    default:
        return TransformErrorEnum::eFailed;
    }
}

} // namespace imgenc
