/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cleanupmanager.hpp"

namespace imgenc::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void CleanupManager::AddCleanup(std::function<void()>&& cleanup)
{
    mCleanups.push_back(std::move(cleanup));
}

void CleanupManager::ExecuteCleanups()
{
    auto cleanups = std::move(mCleanups);

    mCleanups.clear();

    for (auto it = cleanups.rbegin(); it != cleanups.rend(); ++it) {
        (*it)();
    }
}

void CleanupManager::Release()
{
    mCleanups.clear();
}

} // namespace imgenc::common::utils
