// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "events/ITaskScheduler.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

namespace RPE {

/**
 * @brief Priority-queue based ITaskScheduler
 *
 * Tasks are ordered by due time, then by sequence number (FIFO). The loop
 * thread sleeps on a condition variable until the next due time or until
 * a task is posted.
 */
class TaskSchedulerImpl : public ITaskScheduler {
public:
    explicit TaskSchedulerImpl(SchedulerMode mode = SchedulerMode::AUTOMATIC);

    ~TaskSchedulerImpl() override;

    TaskId post(Task task) override;
    TaskId postDelayed(Task task, std::chrono::milliseconds delay) override;
    bool cancel(TaskId taskId) override;
    size_t runOnce() override;
    size_t runUntilIdle(int maxTurns = Constants::DEFAULT_MAX_TURNS) override;
    bool runUntil(const std::function<bool()> &predicate, std::chrono::milliseconds timeout) override;
    void run() override;
    void stop() override;
    bool isRunning() const override;
    void setMode(SchedulerMode mode) override;
    SchedulerMode getMode() const override;
    void advanceTime(std::chrono::milliseconds delta) override;
    std::chrono::milliseconds now() const override;
    size_t pendingTaskCount() const override;

private:
    struct ScheduledTask {
        TaskId id;
        std::chrono::milliseconds dueTime;
        uint64_t sequenceNumber;
        Task task;
    };

    /**
     * @brief Earlier due time first, FIFO for equal due times
     */
    struct ExecutionTimeComparator {
        bool operator()(const std::shared_ptr<ScheduledTask> &a, const std::shared_ptr<ScheduledTask> &b) const {
            if (a->dueTime != b->dueTime) {
                return a->dueTime > b->dueTime;
            }
            return a->sequenceNumber > b->sequenceNumber;
        }
    };

    // Assumes mutex_ is held
    std::chrono::milliseconds nowUnlocked() const;
    bool hasReadyTaskUnlocked() const;
    void dropCancelledUnlocked();

    mutable std::mutex mutex_;
    std::condition_variable condition_;

    std::priority_queue<std::shared_ptr<ScheduledTask>, std::vector<std::shared_ptr<ScheduledTask>>,
                        ExecutionTimeComparator>
        queue_;
    std::unordered_set<TaskId> cancelled_;
    // Popped for the running turn but not executed yet
    std::unordered_set<TaskId> turnTaskIds_;

    uint64_t nextSequence_ = 0;
    TaskId nextTaskId_ = 1;

    SchedulerMode mode_;
    std::chrono::steady_clock::time_point epoch_;
    std::chrono::milliseconds logicalTime_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
};

}  // namespace RPE
