// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/WaitConditions.h"
#include "common/Logger.h"
#include "runtime/IProcessListener.h"
#include "runtime/Process.h"

namespace RPE {

void DelayCondition::arm(const std::shared_ptr<Process> &waiter) {
    scheduler_ = waiter->context().scheduler;
    std::weak_ptr<Process> weak = waiter;
    taskId_ = scheduler_->postDelayed(
        [weak]() {
            if (auto process = weak.lock()) {
                process->resume();
            }
        },
        delay_);
}

void DelayCondition::disarm() {
    if (scheduler_ && taskId_) {
        scheduler_->cancel(*taskId_);
    }
    taskId_.reset();
}

std::string DelayCondition::describe() const {
    return "delay of " + std::to_string(delay_.count()) + " ms";
}

struct ProcessTerminatedCondition::Progress {
    std::weak_ptr<Process> waiter;
    size_t remaining = 0;
    bool active = true;

    void targetTerminated() {
        if (!active || remaining == 0) {
            return;
        }
        if (--remaining == 0) {
            active = false;
            if (auto process = waiter.lock()) {
                process->resume();
            }
        }
    }
};

namespace {

class TerminationListener : public IProcessListener {
public:
    explicit TerminationListener(std::function<void()> onTerminated) : onTerminated_(std::move(onTerminated)) {}

    void onProcessFinished(Process &, const json &) override {
        onTerminated_();
    }

    void onProcessExcepted(Process &, const std::string &) override {
        onTerminated_();
    }

    void onProcessKilled(Process &, const std::string &) override {
        onTerminated_();
    }

private:
    std::function<void()> onTerminated_;
};

}  // namespace

ProcessTerminatedCondition::ProcessTerminatedCondition(std::vector<std::shared_ptr<Process>> targets)
    : targets_(std::move(targets)) {}

void ProcessTerminatedCondition::arm(const std::shared_ptr<Process> &waiter) {
    progress_ = std::make_shared<Progress>();
    progress_->waiter = waiter;

    for (const auto &target : targets_) {
        if (target && !target->hasTerminated()) {
            progress_->remaining++;
        }
    }

    if (progress_->remaining == 0) {
        LOG_DEBUG("ProcessTerminatedCondition: All targets of {} already terminated", waiter->pid());
        progress_->active = false;
        waiter->resume();
        return;
    }

    std::shared_ptr<Progress> progress = progress_;
    for (const auto &target : targets_) {
        if (!target || target->hasTerminated()) {
            continue;
        }
        auto listener = std::make_shared<TerminationListener>([progress]() { progress->targetTerminated(); });
        target->addListener(listener);
        listeners_.emplace_back(target, listener);
    }
}

void ProcessTerminatedCondition::disarm() {
    if (progress_) {
        progress_->active = false;
    }
    for (auto &[weakTarget, listener] : listeners_) {
        if (auto target = weakTarget.lock()) {
            target->removeListener(listener);
        }
    }
    listeners_.clear();
}

std::string ProcessTerminatedCondition::describe() const {
    std::string pids;
    for (const auto &target : targets_) {
        if (!target) {
            continue;
        }
        pids += pids.empty() ? target->pid() : ", " + target->pid();
    }
    return "termination of [" + pids + "]";
}

}  // namespace RPE
