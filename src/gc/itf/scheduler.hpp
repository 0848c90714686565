/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef IMGENC_GC_ITF_SCHEDULER_HPP_
#define IMGENC_GC_ITF_SCHEDULER_HPP_

#include <common/utils/error.hpp>

namespace imgenc::gc {

/**
 * Garbage collection scheduler interface.
 */
class SchedulerItf {
public:
    /**
     * Destructor.
     */
    virtual ~SchedulerItf() = default;

    /**
     * Requests collection without waiting for it.
     */
    virtual void Schedule() = 0;

    /**
     * Requests collection and waits until a collection started after this call has finished.
     *
     * @return Error.
     */
    virtual Error ScheduleAndWait() = 0;
};

} // namespace imgenc::gc

#endif
