/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_COMMON_LOGGER_LOGMODULE_HPP_
#define IMGENC_COMMON_LOGGER_LOGMODULE_HPP_

#ifndef LOG_MODULE
#define LOG_MODULE "imgenc"
#endif

#include <core/common/tools/logger.hpp>

namespace imgenc {

using aos::Log;

} // namespace imgenc

#endif
