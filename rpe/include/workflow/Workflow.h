// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "runtime/Process.h"
#include "workflow/Outline.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace RPE {

/**
 * @brief Process whose step function is an Outline
 *
 * Every outline step is one RUNNING -> RUNNING turn. The outline cursor,
 * the context and the awaited children form the continuation, so a
 * workflow restored from a checkpoint continues at the same node.
 *
 * @code
 * class Counter : public RPE::Workflow {
 * public:
 *     Counter(const RPE::ProcessContext &context, const RPE::json &inputs, const std::string &pid)
 *         : Workflow(context, inputs, pid, makeOutline()) {}
 *
 *     static std::shared_ptr<const RPE::Outline> makeOutline() {
 *         using namespace RPE;
 *         return std::make_shared<const Outline>(Block{
 *             step("init", [](Workflow &w) { w.ctx()["n"] = 0; }),
 *             while_("below_three", [](Workflow &w) { return w.ctx()["n"].get<int>() < 3; })({
 *                 step("increment", [](Workflow &w) { w.ctx()["n"] = w.ctx()["n"].get<int>() + 1; }),
 *             }),
 *         });
 *     }
 * };
 * @endcode
 */
class Workflow : public Process {
public:
    Workflow(const ProcessContext &context, const json &inputs, const std::string &pid,
             std::shared_ptr<const Outline> outline);

    /**
     * @brief Mutable workflow context shared by steps and predicates
     */
    json &ctx() {
        return ctx_;
    }

    const json &ctx() const {
        return ctx_;
    }

    /**
     * @brief Wait for child before the next step, then store its outputs in ctx()[key]
     *
     * The child is started if it is still in CREATED. A child that ends
     * unsuccessfully fails the workflow.
     */
    void toContext(const std::string &key, std::shared_ptr<Process> child);

    /**
     * @brief Keys of children not yet collected
     */
    std::vector<std::string> awaitedKeys() const;

    const Outline &outline() const {
        return *outline_;
    }

    json describe() const {
        return outline_->describe();
    }

    json saveContinuation() const override;
    void loadContinuation(const json &continuation) override;

protected:
    StepCommand run() override;

    std::shared_ptr<WaitCondition> restoreWaitCondition() override;

private:
    struct Awaited {
        std::string pid;
        std::shared_ptr<Process> process;
    };

    void collectAwaited();
    json checkpointedOutputs(const std::string &key, const std::string &childPid) const;
    StepCommand waitForChildren();
    StepCommand complete();

    std::shared_ptr<const Outline> outline_;
    std::unique_ptr<Stepper> stepper_;
    json ctx_ = json::object();
    std::map<std::string, Awaited> awaiting_;
    std::optional<int64_t> exitCode_;
};

}  // namespace RPE
