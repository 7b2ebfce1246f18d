// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "workflow/Workflow.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "persistence/Persister.h"
#include "runtime/ProcessRegistry.h"
#include "runtime/WaitConditions.h"

namespace RPE {

Workflow::Workflow(const ProcessContext &context, const json &inputs, const std::string &pid,
                   std::shared_ptr<const Outline> outline)
    : Process(context, inputs, pid), outline_(std::move(outline)) {
    if (!outline_) {
        throw ValidationError("Workflow<" + this->pid() + "> requires an outline");
    }
    stepper_ = outline_->createStepper();
}

void Workflow::toContext(const std::string &key, std::shared_ptr<Process> child) {
    if (!child) {
        throw StepError("Workflow<" + pid() + "> cannot await a null process for '" + key + "'");
    }
    if (!child->isInitialized()) {
        throw StepError("Workflow<" + pid() + "> cannot await uninitialized process " + child->pid());
    }
    if (child->state() == ProcessState::CREATED) {
        child->start();
    }

    LOG_DEBUG("Workflow<{}>: Awaiting {} as '{}'", pid(), child->pid(), key);
    awaiting_[key] = Awaited{child->pid(), std::move(child)};
}

std::vector<std::string> Workflow::awaitedKeys() const {
    std::vector<std::string> keys;
    for (const auto &[key, awaited] : awaiting_) {
        keys.push_back(key);
    }
    return keys;
}

StepCommand Workflow::run() {
    collectAwaited();
    if (!awaiting_.empty()) {
        return waitForChildren();
    }
    if (stepper_->finished()) {
        return complete();
    }

    StepResult result = stepper_->step(*this);
    if (result.returned) {
        exitCode_ = result.exitCode;
    }

    if (!awaiting_.empty()) {
        return waitForChildren();
    }
    if (result.finished || result.returned) {
        return complete();
    }
    return Continue{RUN_STEP};
}

void Workflow::collectAwaited() {
    for (auto it = awaiting_.begin(); it != awaiting_.end();) {
        auto &[key, awaited] = *it;
        if (!awaited.process) {
            awaited.process = ProcessRegistry::getInstance().find(awaited.pid);
            if (!awaited.process) {
                // Terminated children leave the registry; their last checkpoint holds the outputs
                ctx_[key] = checkpointedOutputs(key, awaited.pid);
                it = awaiting_.erase(it);
                continue;
            }
        }
        if (!awaited.process->hasTerminated()) {
            ++it;
            continue;
        }

        if (awaited.process->state() != ProcessState::FINISHED || !awaited.process->isSuccessful()) {
            throw StepError("Awaited process " + awaited.pid + " for '" + key + "' ended in " +
                            awaited.process->currentLabel() +
                            (awaited.process->statusMessage().empty() ? "" : ": " + awaited.process->statusMessage()));
        }

        ctx_[key] = awaited.process->outputs();
        it = awaiting_.erase(it);
    }
}

json Workflow::checkpointedOutputs(const std::string &key, const std::string &childPid) const {
    std::optional<Bundle> bundle;
    if (context().persister) {
        bundle = context().persister->store()->loadCheckpoint(childPid);
    }
    if (!bundle) {
        throw StepError("Awaited process " + childPid + " for '" + key + "' is no longer available");
    }

    const std::string label = bundle->label();
    const auto state = parseProcessState(label);
    if (!state || !createProcessTransitionTable().isTerminal(label)) {
        throw StepError("Awaited process " + childPid + " for '" + key + "' was checkpointed in " + label +
                        " but is not running");
    }

    const json data = bundle->state();
    if (*state != ProcessState::FINISHED || !JsonUtils::getBool(data, "successful", true)) {
        std::string message = JsonUtils::getString(data, "message", JsonUtils::getString(data, "exception"));
        throw StepError("Awaited process " + childPid + " for '" + key + "' ended in " + label +
                        (message.empty() ? "" : ": " + message));
    }

    LOG_DEBUG("Workflow<{}>: Collected '{}' from the final checkpoint of {}", pid(), key, childPid);
    return bundle->outputs();
}

StepCommand Workflow::waitForChildren() {
    std::vector<std::shared_ptr<Process>> children;
    std::string names;
    for (const auto &[key, awaited] : awaiting_) {
        children.push_back(awaited.process);
        names += (names.empty() ? "" : ", ") + awaited.pid;
    }
    return Wait{RUN_STEP, "Waiting on: " + names, std::make_shared<ProcessTerminatedCondition>(std::move(children))};
}

StepCommand Workflow::complete() {
    if (!exitCode_) {
        return Finish{};
    }
    out("exit_code", *exitCode_);
    return Finish{json::object(), *exitCode_ == 0};
}

std::shared_ptr<WaitCondition> Workflow::restoreWaitCondition() {
    std::vector<std::shared_ptr<Process>> children;
    for (auto &[key, awaited] : awaiting_) {
        if (!awaited.process) {
            awaited.process = ProcessRegistry::getInstance().find(awaited.pid);
        }
        if (!awaited.process) {
            // Counted as terminated; the next step collects it from its checkpoint or fails
            LOG_DEBUG("Workflow<{}>: Awaited process {} for '{}' is not live", pid(), awaited.pid, key);
            continue;
        }
        children.push_back(awaited.process);
    }
    if (awaiting_.empty()) {
        return nullptr;
    }
    return std::make_shared<ProcessTerminatedCondition>(std::move(children));
}

json Workflow::saveContinuation() const {
    json continuation = Process::saveContinuation();
    continuation["stepper_state"] = stepper_->saveState();
    continuation["context"] = ctx_;

    json awaiting = json::object();
    for (const auto &[key, awaited] : awaiting_) {
        awaiting[key] = awaited.pid;
    }
    continuation["awaiting"] = awaiting;

    if (exitCode_) {
        continuation["exit_code"] = *exitCode_;
    }
    return continuation;
}

void Workflow::loadContinuation(const json &continuation) {
    Process::loadContinuation(continuation);

    if (!continuation.contains("stepper_state")) {
        throw ReconstructionError("Workflow<" + pid() + "> continuation has no stepper state");
    }
    stepper_ = outline_->createStepper();
    stepper_->loadState(continuation["stepper_state"]);

    const json context = continuation.value("context", json::object());
    if (!context.is_object()) {
        throw ReconstructionError("Workflow<" + pid() + "> context must be an object");
    }
    ctx_ = context;

    awaiting_.clear();
    const json awaiting = continuation.value("awaiting", json::object());
    if (!awaiting.is_object()) {
        throw ReconstructionError("Workflow<" + pid() + "> awaited children must be an object");
    }
    for (auto it = awaiting.begin(); it != awaiting.end(); ++it) {
        if (!it.value().is_string()) {
            throw ReconstructionError("Workflow<" + pid() + "> awaited child '" + it.key() + "' has no pid");
        }
        awaiting_[it.key()] = Awaited{it.value().get<std::string>(), nullptr};
    }

    exitCode_.reset();
    if (continuation.contains("exit_code")) {
        if (!continuation["exit_code"].is_number_integer()) {
            throw ReconstructionError("Workflow<" + pid() + "> exit code must be an integer");
        }
        exitCode_ = continuation["exit_code"].get<int64_t>();
    }
}

}  // namespace RPE
