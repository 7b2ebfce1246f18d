// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "events/TaskSchedulerImpl.h"
#include "common/Logger.h"

namespace RPE {

TaskSchedulerImpl::TaskSchedulerImpl(SchedulerMode mode) : mode_(mode), epoch_(std::chrono::steady_clock::now()) {
    LOG_DEBUG("TaskSchedulerImpl: Created in {} mode", mode == SchedulerMode::MANUAL ? "MANUAL" : "AUTOMATIC");
}

TaskSchedulerImpl::~TaskSchedulerImpl() {
    stop();
}

TaskId TaskSchedulerImpl::post(Task task) {
    return postDelayed(std::move(task), std::chrono::milliseconds(0));
}

TaskId TaskSchedulerImpl::postDelayed(Task task, std::chrono::milliseconds delay) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextTaskId_++;
        auto delayClamped = delay.count() < 0 ? std::chrono::milliseconds(0) : delay;
        queue_.push(std::make_shared<ScheduledTask>(
            ScheduledTask{id, nowUnlocked() + delayClamped, nextSequence_++, std::move(task)}));
    }
    condition_.notify_all();
    return id;
}

bool TaskSchedulerImpl::cancel(TaskId taskId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (turnTaskIds_.count(taskId) > 0) {
        return cancelled_.insert(taskId).second;
    }

    // priority_queue has no search; scan a copy of the underlying heap
    auto copy = queue_;
    while (!copy.empty()) {
        if (copy.top()->id == taskId) {
            bool inserted = cancelled_.insert(taskId).second;
            if (inserted) {
                LOG_DEBUG("TaskSchedulerImpl: Cancelled task {}", taskId);
            }
            return inserted;
        }
        copy.pop();
    }
    return false;
}

size_t TaskSchedulerImpl::runOnce() {
    std::vector<std::shared_ptr<ScheduledTask>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = nowUnlocked();
        while (!queue_.empty() && queue_.top()->dueTime <= current) {
            auto task = queue_.top();
            queue_.pop();
            if (cancelled_.erase(task->id) > 0) {
                continue;
            }
            turnTaskIds_.insert(task->id);
            ready.push_back(std::move(task));
        }
    }

    size_t executed = 0;
    for (auto &scheduled : ready) {
        // A task earlier in this turn may have cancelled a later one
        {
            std::lock_guard<std::mutex> lock(mutex_);
            turnTaskIds_.erase(scheduled->id);
            if (cancelled_.erase(scheduled->id) > 0) {
                continue;
            }
        }
        try {
            scheduled->task();
        } catch (const std::exception &e) {
            LOG_ERROR("TaskSchedulerImpl: Task {} threw: {}", scheduled->id, e.what());
        }
        executed++;
    }
    return executed;
}

size_t TaskSchedulerImpl::runUntilIdle(int maxTurns) {
    size_t total = 0;
    for (int turn = 0; turn < maxTurns; ++turn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropCancelledUnlocked();
            if (!hasReadyTaskUnlocked()) {
                return total;
            }
        }
        total += runOnce();
    }
    LOG_WARN("TaskSchedulerImpl: Still busy after {} turns", maxTurns);
    return total;
}

bool TaskSchedulerImpl::runUntil(const std::function<bool()> &predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return predicate();
        }

        if (runOnce() > 0) {
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        dropCancelledUnlocked();
        if (hasReadyTaskUnlocked()) {
            continue;
        }

        if (mode_ == SchedulerMode::MANUAL) {
            if (queue_.empty()) {
                lock.unlock();
                return predicate();
            }
            // Jump the logical clock to the next delayed task
            logicalTime_ = queue_.top()->dueTime;
            continue;
        }

        // Woken by post() from another thread or by the next due time
        auto wakeAt = deadline;
        if (!queue_.empty()) {
            auto due = epoch_ + queue_.top()->dueTime;
            if (due < wakeAt) {
                wakeAt = due;
            }
        }
        condition_.wait_until(lock, wakeAt);
    }
    return true;
}

void TaskSchedulerImpl::run() {
    running_ = true;
    LOG_DEBUG("TaskSchedulerImpl: Loop started");

    while (!stopRequested_) {
        if (runOnce() > 0) {
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        dropCancelledUnlocked();
        if (stopRequested_ || hasReadyTaskUnlocked()) {
            continue;
        }

        if (queue_.empty() || mode_ == SchedulerMode::MANUAL) {
            condition_.wait(lock);
        } else {
            condition_.wait_until(lock, epoch_ + queue_.top()->dueTime);
        }
    }

    stopRequested_ = false;
    running_ = false;
    LOG_DEBUG("TaskSchedulerImpl: Loop stopped");
}

void TaskSchedulerImpl::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    condition_.notify_all();
}

bool TaskSchedulerImpl::isRunning() const {
    return running_;
}

void TaskSchedulerImpl::setMode(SchedulerMode mode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_ == mode) {
            return;
        }
        // Keep due times continuous across the switch
        if (mode == SchedulerMode::MANUAL) {
            logicalTime_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                                 epoch_);
        } else {
            epoch_ = std::chrono::steady_clock::now() - logicalTime_;
        }
        mode_ = mode;
    }
    condition_.notify_all();
}

SchedulerMode TaskSchedulerImpl::getMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

void TaskSchedulerImpl::advanceTime(std::chrono::milliseconds delta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_ != SchedulerMode::MANUAL) {
            LOG_WARN("TaskSchedulerImpl: advanceTime ignored in AUTOMATIC mode");
            return;
        }
        logicalTime_ += delta;
    }
    condition_.notify_all();
}

std::chrono::milliseconds TaskSchedulerImpl::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nowUnlocked();
}

size_t TaskSchedulerImpl::pendingTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cancelledInQueue = cancelled_.size() > queue_.size() ? queue_.size() : cancelled_.size();
    return queue_.size() - cancelledInQueue;
}

std::chrono::milliseconds TaskSchedulerImpl::nowUnlocked() const {
    if (mode_ == SchedulerMode::MANUAL) {
        return logicalTime_;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - epoch_);
}

bool TaskSchedulerImpl::hasReadyTaskUnlocked() const {
    return !queue_.empty() && queue_.top()->dueTime <= nowUnlocked();
}

void TaskSchedulerImpl::dropCancelledUnlocked() {
    while (!queue_.empty() && cancelled_.count(queue_.top()->id) > 0) {
        cancelled_.erase(queue_.top()->id);
        queue_.pop();
    }
}

}  // namespace RPE
