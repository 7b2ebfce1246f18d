// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "events/ITaskScheduler.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RPE {

class Process;
class IProcessListener;

/**
 * @brief Arms the resumption trigger of a WAITING process
 *
 * arm() is called once the waiter has entered WAITING; the condition then
 * calls waiter->resume() when it holds. Conditions keep only a weak
 * reference to the waiter.
 */
class WaitCondition {
public:
    virtual ~WaitCondition() = default;

    virtual void arm(const std::shared_ptr<Process> &waiter) = 0;

    /**
     * @brief Stop watching, called when the waiter leaves WAITING
     */
    virtual void disarm() {}

    virtual std::string describe() const = 0;
};

/**
 * @brief Resume after a delay on the waiter's scheduler
 */
class DelayCondition : public WaitCondition {
public:
    explicit DelayCondition(std::chrono::milliseconds delay) : delay_(delay) {}

    void arm(const std::shared_ptr<Process> &waiter) override;
    void disarm() override;
    std::string describe() const override;

private:
    std::chrono::milliseconds delay_;
    std::shared_ptr<ITaskScheduler> scheduler_;
    std::optional<TaskId> taskId_;
};

/**
 * @brief Resume once every target process has terminated
 *
 * Targets that already terminated count as done when armed.
 */
class ProcessTerminatedCondition : public WaitCondition {
public:
    explicit ProcessTerminatedCondition(std::vector<std::shared_ptr<Process>> targets);

    void arm(const std::shared_ptr<Process> &waiter) override;
    void disarm() override;
    std::string describe() const override;

    const std::vector<std::shared_ptr<Process>> &targets() const {
        return targets_;
    }

private:
    struct Progress;

    std::vector<std::shared_ptr<Process>> targets_;
    std::shared_ptr<Progress> progress_;
    std::vector<std::pair<std::weak_ptr<Process>, std::shared_ptr<IProcessListener>>> listeners_;
};

}  // namespace RPE
