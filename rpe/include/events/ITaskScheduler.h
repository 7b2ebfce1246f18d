// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/Constants.h"
#include <chrono>
#include <cstdint>
#include <functional>

namespace RPE {

using Task = std::function<void()>;
using TaskId = uint64_t;

/**
 * @brief Scheduler time source
 *
 * AUTOMATIC follows the steady clock. MANUAL uses a logical clock that only
 * moves through advanceTime(), so delayed tasks fire deterministically in tests.
 */
enum class SchedulerMode { AUTOMATIC, MANUAL };

/**
 * @brief Single-threaded cooperative task scheduler
 *
 * Many processes interleave on one scheduler. A turn runs the tasks that
 * were ready when the turn started; tasks posted during a turn run on the
 * next one. Tasks with equal due time run in posting order.
 *
 * post/postDelayed/cancel/stop are thread-safe. The run methods must be
 * driven from a single thread, the loop thread.
 */
class ITaskScheduler {
public:
    virtual ~ITaskScheduler() = default;

    /**
     * @brief Queue a task for the next turn
     */
    virtual TaskId post(Task task) = 0;

    /**
     * @brief Queue a task once the delay has elapsed
     * @return Id usable with cancel()
     */
    virtual TaskId postDelayed(Task task, std::chrono::milliseconds delay) = 0;

    /**
     * @brief Cancel a task that has not run yet
     * @return true if the task was pending
     */
    virtual bool cancel(TaskId taskId) = 0;

    /**
     * @brief Run one turn
     * @return Number of tasks executed
     */
    virtual size_t runOnce() = 0;

    /**
     * @brief Run turns until no task is ready
     *
     * Delayed tasks that are not due yet stay queued.
     * @return Total number of tasks executed
     */
    virtual size_t runUntilIdle(int maxTurns = Constants::DEFAULT_MAX_TURNS) = 0;

    /**
     * @brief Run turns until the predicate holds or the wall-clock timeout expires
     *
     * In MANUAL mode the logical clock jumps to the next delayed task whenever
     * nothing is ready.
     */
    virtual bool runUntil(const std::function<bool()> &predicate, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Run the loop on the calling thread until stop()
     */
    virtual void run() = 0;

    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    virtual void setMode(SchedulerMode mode) = 0;

    virtual SchedulerMode getMode() const = 0;

    /**
     * @brief Move the logical clock forward (MANUAL mode only)
     */
    virtual void advanceTime(std::chrono::milliseconds delta) = 0;

    /**
     * @brief Time since scheduler creation (logical time in MANUAL mode)
     */
    virtual std::chrono::milliseconds now() const = 0;

    virtual size_t pendingTaskCount() const = 0;
};

}  // namespace RPE
