// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "runtime/IProcessListener.h"
#include "runtime/ProcessContext.h"
#include "runtime/ProcessStates.h"
#include "runtime/StatusReport.h"
#include "runtime/StepCommand.h"
#include "statemachine/StateMachine.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace RPE {

class Bundle;
class ProcessMessageRouter;
class WaitCondition;

/**
 * @brief Resumable, checkpointable unit of computation driven by step functions
 *
 * A process runs on a cooperative scheduler. Each scheduler turn runs at
 * most one step function; the StepCommand it returns decides the next
 * transition:
 * - Continue: RUNNING -> RUNNING, next step on the next turn
 * - Wait:     RUNNING -> WAITING until resume() (optionally armed by a WaitCondition)
 * - Finish:   -> FINISHED with outputs
 * - Raise (or a thrown exception): -> EXCEPTED
 *
 * The pending step is stored as a named token (the continuation), so it
 * survives a checkpoint. The first step is run(); further steps are
 * registered with registerStep().
 *
 * Every transition is checkpointed through the context's Persister and
 * broadcast as STATE_CHANGED through its broker, both best-effort.
 *
 * Threading: all methods must be called on the scheduler's loop thread.
 * Remote callers go through the control plane, which posts onto that thread.
 *
 * @code
 * class Doubler : public RPE::Process {
 * public:
 *     using Process::Process;
 * protected:
 *     RPE::StepCommand run() override {
 *         return RPE::Finish{{{"y", inputs()["x"].get<int>() * 2}}};
 *     }
 * };
 *
 * auto process = RPE::Process::create<Doubler>(context, {{"x", 5}});
 * process->start();
 * @endcode
 */
class Process : public StateMachine, public std::enable_shared_from_this<Process> {
public:
    static constexpr const char *RUN_STEP = "run";

    /**
     * @param context Scheduler (mandatory), broker and persister
     * @param inputs Validated inputs, must be a JSON object (null means empty)
     * @param pid Process id, generated when empty
     * @throws InvalidStateError without scheduler, ValidationError for non-object inputs
     */
    Process(const ProcessContext &context, const json &inputs = json::object(), const std::string &pid = "");

    ~Process() override;

    /**
     * @brief Construct and initialize a process in CREATED
     */
    template <typename T>
    static std::shared_ptr<T> create(const ProcessContext &context, const json &inputs = json::object(),
                                     const std::string &pid = "") {
        auto process = std::make_shared<T>(context, inputs, pid);
        process->initialize();
        return process;
    }

    /**
     * @brief Register in the ProcessRegistry, bind the control plane and enter CREATED
     */
    void initialize() override;

    /**
     * @brief Rebuild state from a checkpoint instead of initialize()
     *
     * The saved label is installed without running entry hooks, so no
     * checkpoint or broadcast is produced.
     * @throws ReconstructionError if the bundle does not fit this process
     */
    void restore(const Bundle &bundle);

    /**
     * @brief Schedule execution
     *
     * CREATED and RUNNING processes get their next step scheduled. A WAITING
     * process restored from a checkpoint re-arms its wait condition.
     * @throws InvalidStateError if neither initialized nor restored
     */
    void start();

    /**
     * @brief Set the paused flag, the label is unchanged
     * @return false if the process has terminated
     */
    bool pause(const std::string &message = "");

    /**
     * @brief Clear the paused flag
     *
     * A deferred step is scheduled and a resumption trigger that fired while
     * paused runs on the next scheduler turn.
     * @return false if the process has terminated
     */
    bool play();

    /**
     * @brief Move to KILLED from any non-terminal state
     *
     * Immediate, unless called from inside a step or a transition: then the
     * kill is applied as soon as that returns, pre-empting its directive.
     * @return true if killed (or already KILLED), false for another terminal state
     */
    bool kill(const std::string &message = "");

    /**
     * @brief Resumption trigger of a WAITING process
     *
     * The WAITING -> RUNNING transition happens on a later scheduler turn,
     * and only once the process is not paused.
     * @return false if the process is not WAITING
     */
    bool resume();

    /**
     * @brief Record an output value
     * @throws InvalidStateError after termination
     */
    void out(const std::string &port, const json &value);

    const std::string &pid() const {
        return pid_;
    }

    const std::string &typeId() const {
        return typeId_;
    }

    /**
     * @brief Assigned by TypeRegistry based creation paths
     */
    void setTypeId(const std::string &typeId) {
        typeId_ = typeId;
    }

    const json &inputs() const {
        return inputs_;
    }

    const json &outputs() const {
        return outputs_;
    }

    ProcessState state() const;

    bool isPaused() const {
        return paused_;
    }

    const std::string &pausedMessage() const {
        return pausedMessage_;
    }

    bool hasTerminated() const {
        return isTerminal();
    }

    /**
     * @brief True once FINISHED with a successful result
     */
    bool isSuccessful() const;

    /**
     * @brief Waiting message, exception text or kill message of the current state
     */
    std::string statusMessage() const;

    /**
     * @brief Error recorded by EXCEPTED, nullptr otherwise
     */
    std::exception_ptr exception() const;

    int64_t creationTime() const {
        return creationTime_;
    }

    /**
     * @brief Name of the step run when the process next executes
     */
    const std::string &nextStep() const {
        return nextStep_;
    }

    StatusReport status() const;

    const ProcessContext &context() const {
        return context_;
    }

    /**
     * @brief Number of STATE_CHANGED broadcasts that could not be delivered
     */
    size_t broadcastFailureCount() const {
        return broadcastFailures_;
    }

    const std::optional<std::string> &lastCheckpointError() const {
        return lastCheckpointError_;
    }

    void addListener(std::shared_ptr<IProcessListener> listener);

    bool removeListener(const std::shared_ptr<IProcessListener> &listener);

    size_t listenerCount() const {
        return listeners_.size();
    }

    /**
     * @brief Continuation written into checkpoints
     *
     * The base holds {"next": <step name>}; subclasses extend it with their
     * own resumable state.
     */
    virtual json saveContinuation() const;

    /**
     * @throws ReconstructionError if the continuation is malformed
     */
    virtual void loadContinuation(const json &continuation);

protected:
    /**
     * @brief First step of the process
     */
    virtual StepCommand run() = 0;

    /**
     * @brief Make a step function reachable through Continue/Wait names
     */
    void registerStep(const std::string &name, std::function<StepCommand()> step);

    /**
     * @brief Invoke the step function registered under name
     * @throws StepError for unknown names
     */
    virtual StepCommand dispatchStep(const std::string &name);

    /**
     * @brief Wait condition to re-arm when a restored WAITING process starts
     *
     * The default returns nullptr: the process then waits for resume().
     */
    virtual std::shared_ptr<WaitCondition> restoreWaitCondition() {
        return nullptr;
    }

    std::unique_ptr<State> createState(const std::string &label) override;
    void onEntered(const std::string &from) override;
    void transitionFailed(const std::string &from, const std::string &to, std::exception_ptr error) override;

private:
    void attach();
    void scheduleStep();
    void runTurn();
    void executeStep();
    void handleCommand(StepCommand command);
    void doResume();
    void scheduleResume();
    void applyPendingKill();
    void performKill(const std::string &message);
    void armWaitCondition(std::shared_ptr<WaitCondition> condition);
    void disarmWaitCondition();

    void checkpoint();
    void broadcastStateChanged(const std::string &from, const std::string &to);
    void notifyStateListeners();
    void forEachListener(const std::function<void(IProcessListener &)> &callback);

    ProcessContext context_;
    std::string pid_;
    std::string typeId_;
    json inputs_;
    json outputs_ = json::object();
    int64_t creationTime_;

    std::string nextStep_ = RUN_STEP;
    std::unordered_map<std::string, std::function<StepCommand()>> steps_;

    bool paused_ = false;
    std::string pausedMessage_;

    bool stepScheduled_ = false;
    bool stepDeferred_ = false;
    bool stepping_ = false;
    bool resumeScheduled_ = false;
    bool resumePending_ = false;
    std::optional<std::string> pendingKill_;

    std::shared_ptr<WaitCondition> waitCondition_;
    std::vector<std::shared_ptr<IProcessListener>> listeners_;
    std::unique_ptr<ProcessMessageRouter> router_;

    size_t broadcastFailures_ = 0;
    std::optional<std::string> lastCheckpointError_;
};

}  // namespace RPE
