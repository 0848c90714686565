/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_CONTEXT_HPP_
#define IMGENC_COMMON_UTILS_CONTEXT_HPP_

#include <atomic>
#include <chrono>
#include <optional>

#include "error.hpp"

namespace imgenc::common::utils {

/**
 * Cancellation context shared between caller and long running operation.
 */
class Context {
public:
    /**
     * Creates context without deadline.
     */
    Context() = default;

    /**
     * Creates context that expires after timeout.
     *
     * @param timeout timeout.
     */
    explicit Context(std::chrono::steady_clock::duration timeout);

    /**
     * Cancels context.
     */
    void Cancel();

    /**
     * Returns error if context is cancelled or its deadline is exceeded.
     *
     * @return Error.
     */
    Error Err() const;

    /**
     * Checks whether context is done.
     *
     * @return bool.
     */
    bool IsDone() const { return !Err().IsNone(); }

private:
    std::atomic_bool                                     mCancelled {false};
    std::optional<std::chrono::steady_clock::time_point> mDeadline;
};

} // namespace imgenc::common::utils

#endif
