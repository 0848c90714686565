/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_UTILS_CLEANUPMANAGER_HPP_
#define IMGENC_COMMON_UTILS_CLEANUPMANAGER_HPP_

#include <functional>
#include <vector>

namespace imgenc::common::utils {

/**
 * Collects cleanup actions and executes them in reverse order.
 */
class CleanupManager {
public:
    /**
     * Adds cleanup.
     *
     * @param cleanup cleanup action.
     */
    void AddCleanup(std::function<void()>&& cleanup);

    /**
     * Executes cleanups and forgets them.
     */
    void ExecuteCleanups();

    /**
     * Forgets cleanups without executing them.
     */
    void Release();

    /**
     * Returns number of pending cleanups.
     *
     * @return size_t.
     */
    size_t Size() const { return mCleanups.size(); }

private:
    std::vector<std::function<void()>> mCleanups;
};

} // namespace imgenc::common::utils

#endif
