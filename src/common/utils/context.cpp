/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "context.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Context::Context(std::chrono::steady_clock::duration timeout)
    : mDeadline(std::chrono::steady_clock::now() + timeout)
{
}

void Context::Cancel()
{
    mCancelled = true;
}

Error Context::Err() const
{
    if (mCancelled) {
        return TransformError(TransformErrorEnum::eCancelled, "context cancelled");
    }

    if (mDeadline.has_value() && std::chrono::steady_clock::now() >= *mDeadline) {
        return TransformError(TransformErrorEnum::eCancelled, "context deadline exceeded");
    }

    return ErrorEnum::eNone;
}

} // namespace imgenc::common::utils
