// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/Process.h"
#include "comms/ControlMessage.h"
#include "comms/IBroker.h"
#include "comms/ProcessMessageRouter.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/TypeRegistry.h"
#include "common/UniqueIdGenerator.h"
#include "events/ITaskScheduler.h"
#include "persistence/Bundle.h"
#include "persistence/Persister.h"
#include "runtime/ProcessRegistry.h"
#include "runtime/WaitConditions.h"
#include <algorithm>
#include <typeindex>

namespace RPE {

Process::Process(const ProcessContext &context, const json &inputs, const std::string &pid)
    : StateMachine(createProcessTransitionTable(), toString(ProcessState::CREATED)), context_(context),
      pid_(pid.empty() ? UniqueIdGenerator::generateProcessId() : pid),
      inputs_(inputs.is_null() ? json::object() : inputs), creationTime_(JsonUtils::nowMillis()) {
    if (!context_.scheduler) {
        throw InvalidStateError("Process<" + pid_ + "> requires a scheduler");
    }
    if (!inputs_.is_object()) {
        throw ValidationError("Process<" + pid_ + "> inputs must be an object, got " + inputs_.type_name());
    }
}

Process::~Process() {
    if (waitCondition_) {
        waitCondition_->disarm();
    }
    router_.reset();
    ProcessRegistry::getInstance().unregisterProcess(pid_, this);
}

void Process::initialize() {
    attach();
    StateMachine::initialize();
}

void Process::restore(const Bundle &bundle) {
    if (isInitialized()) {
        throw ReconstructionError("Process<" + pid_ + "> is already initialized");
    }
    if (bundle.pid() != pid_) {
        throw ReconstructionError("Bundle pid '" + bundle.pid() + "' does not match process '" + pid_ + "'");
    }

    auto state = parseProcessState(bundle.label());
    if (!state) {
        throw ReconstructionError("Bundle of '" + pid_ + "' has unknown label '" + bundle.label() + "'");
    }

    typeId_ = bundle.typeId();
    outputs_ = bundle.outputs();
    paused_ = bundle.paused();
    pausedMessage_ = bundle.pausedMessage();
    creationTime_ = bundle.creationTime();
    loadContinuation(bundle.continuation());

    restoreState(createProcessState(*state, bundle.state()));

    if (!isTerminal()) {
        try {
            attach();
        } catch (const InvalidStateError &e) {
            throw ReconstructionError(e.what());
        }
    }

    LOG_INFO("Process<{}>: Restored in {}{}", pid_, bundle.label(), paused_ ? " (paused)" : "");
}

void Process::attach() {
    if (typeId_.empty()) {
        typeId_ = TypeRegistry::getInstance().findTypeId(std::type_index(typeid(*this)));
    }

    if (!ProcessRegistry::getInstance().registerProcess(shared_from_this())) {
        throw InvalidStateError("Process<" + pid_ + "> is already live");
    }

    if (context_.broker && !router_) {
        router_ = std::make_unique<ProcessMessageRouter>(weak_from_this(), pid_, context_.broker, context_.scheduler);
        try {
            router_->start();
        } catch (const BrokerError &e) {
            // Still runs locally, only remote control is unavailable
            LOG_WARN("Process<{}>: Control plane unavailable: {}", pid_, e.what());
        }
    }
}

void Process::start() {
    if (!isInitialized()) {
        throw InvalidStateError("Process<" + pid_ + "> must be initialized or restored before start");
    }
    if (isTerminal()) {
        LOG_DEBUG("Process<{}>: Already terminated in {}, nothing to start", pid_, currentLabel());
        return;
    }

    switch (state()) {
    case ProcessState::CREATED:
    case ProcessState::RUNNING:
        scheduleStep();
        break;
    case ProcessState::WAITING:
        if (!waitCondition_) {
            armWaitCondition(restoreWaitCondition());
        }
        break;
    default:
        break;
    }
}

bool Process::pause(const std::string &message) {
    if (!isInitialized() || isTerminal()) {
        return false;
    }
    if (paused_) {
        return true;
    }

    paused_ = true;
    pausedMessage_ = message;
    LOG_INFO("Process<{}>: Paused in {}{}", pid_, currentLabel(), message.empty() ? "" : ": " + message);
    forEachListener([this](IProcessListener &listener) { listener.onProcessPaused(*this); });
    return true;
}

bool Process::play() {
    if (!isInitialized() || isTerminal()) {
        return false;
    }
    if (!paused_) {
        return true;
    }

    paused_ = false;
    pausedMessage_.clear();
    LOG_INFO("Process<{}>: Played in {}", pid_, currentLabel());
    forEachListener([this](IProcessListener &listener) { listener.onProcessPlayed(*this); });

    if (resumePending_) {
        scheduleResume();
    }
    if (stepDeferred_) {
        stepDeferred_ = false;
        scheduleStep();
    }
    return true;
}

bool Process::kill(const std::string &message) {
    if (!isInitialized()) {
        return false;
    }
    if (state() == ProcessState::KILLED) {
        return true;
    }
    if (isTerminal()) {
        return false;
    }

    if (stepping_ || isTransitioning()) {
        if (!pendingKill_) {
            pendingKill_ = message;
            std::weak_ptr<Process> weak = weak_from_this();
            context_.scheduler->post([weak]() {
                if (auto self = weak.lock()) {
                    self->applyPendingKill();
                }
            });
        }
        return true;
    }

    performKill(message);
    return true;
}

bool Process::resume() {
    if (!isInitialized() || state() != ProcessState::WAITING) {
        LOG_DEBUG("Process<{}>: Ignoring resume in {}", pid_, currentLabel());
        return false;
    }

    if (paused_) {
        LOG_DEBUG("Process<{}>: Resumption queued until played", pid_);
        resumePending_ = true;
        return true;
    }

    scheduleResume();
    return true;
}

void Process::out(const std::string &port, const json &value) {
    if (isTerminal()) {
        throw InvalidStateError("Process<" + pid_ + "> cannot emit output '" + port + "' after termination");
    }

    outputs_[port] = value;
    LOG_DEBUG("Process<{}>: Output '{}' emitted", pid_, port);
    forEachListener([this, &port, &value](IProcessListener &listener) { listener.onOutputEmitted(*this, port, value); });
}

ProcessState Process::state() const {
    return parseProcessState(currentLabel()).value_or(ProcessState::CREATED);
}

bool Process::isSuccessful() const {
    const auto *finished = dynamic_cast<const FinishedState *>(currentState());
    return finished != nullptr && finished->successful();
}

std::string Process::statusMessage() const {
    const auto *state = dynamic_cast<const ProcessStateBase *>(currentState());
    return state ? state->message() : "";
}

std::exception_ptr Process::exception() const {
    const auto *excepted = dynamic_cast<const ExceptedState *>(currentState());
    return excepted ? excepted->error() : nullptr;
}

StatusReport Process::status() const {
    StatusReport report;
    report.pid = pid_;
    report.label = currentLabel();
    report.isTerminal = isTerminal();
    report.paused = paused_;
    report.pausedMessage = pausedMessage_;
    report.processType = typeId_;
    report.creationTime = creationTime_;
    report.statusMessage = statusMessage();
    if (state() == ProcessState::FINISHED) {
        report.successful = isSuccessful();
    }
    return report;
}

void Process::addListener(std::shared_ptr<IProcessListener> listener) {
    if (!listener) {
        LOG_ERROR("Process<{}>: Cannot add null listener", pid_);
        return;
    }
    if (isTerminal()) {
        LOG_WARN("Process<{}>: Listener added after termination is ignored", pid_);
        return;
    }
    listeners_.push_back(std::move(listener));
}

bool Process::removeListener(const std::shared_ptr<IProcessListener> &listener) {
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

json Process::saveContinuation() const {
    return json{{"next", nextStep_}};
}

void Process::loadContinuation(const json &continuation) {
    if (!continuation.is_object() || !continuation.contains("next") || !continuation["next"].is_string()) {
        throw ReconstructionError("Process<" + pid_ + "> continuation has no step name: " + continuation.dump());
    }
    nextStep_ = continuation["next"].get<std::string>();
}

void Process::registerStep(const std::string &name, std::function<StepCommand()> step) {
    steps_[name] = std::move(step);
}

StepCommand Process::dispatchStep(const std::string &name) {
    if (name == RUN_STEP) {
        return run();
    }

    auto it = steps_.find(name);
    if (it == steps_.end()) {
        throw StepError("Process<" + pid_ + "> has no step named '" + name + "'");
    }
    return it->second();
}

std::unique_ptr<State> Process::createState(const std::string &label) {
    auto state = parseProcessState(label);
    if (!state) {
        throw TransitionError(currentLabel(), label, "unknown process state");
    }
    return createProcessState(*state);
}

void Process::onEntered(const std::string &from) {
    const std::string to = currentLabel();
    LOG_DEBUG("Process<{}>: {} -> {}", pid_, from.empty() ? "<none>" : from, to);

    if (isTerminal()) {
        paused_ = false;
        disarmWaitCondition();
    }

    checkpoint();
    broadcastStateChanged(from, to);
    notifyStateListeners();

    if (isTerminal()) {
        LOG_INFO("Process<{}>: Terminated in {}", pid_, to);
        listeners_.clear();
        ProcessRegistry::getInstance().unregisterProcess(pid_, this);
    }
}

void Process::transitionFailed(const std::string &from, const std::string &to, std::exception_ptr error) {
    if (isTerminal() || to == toString(ProcessState::EXCEPTED)) {
        LOG_ERROR("Process<{}>: Transition {} -> {} failed with no way to recover", pid_, from, to);
        return;
    }

    std::string message = describeError(error);
    LOG_ERROR("Process<{}>: Transition {} -> {} failed, moving to EXCEPTED: {}", pid_, from, to, message);
    transitionTo(std::make_unique<ExceptedState>(message, error));
}

void Process::scheduleStep() {
    if (stepScheduled_) {
        return;
    }
    stepScheduled_ = true;

    std::weak_ptr<Process> weak = weak_from_this();
    context_.scheduler->post([weak]() {
        if (auto self = weak.lock()) {
            self->runTurn();
        }
    });
}

void Process::runTurn() {
    stepScheduled_ = false;

    if (pendingKill_) {
        applyPendingKill();
        return;
    }
    if (isTerminal()) {
        return;
    }
    if (paused_) {
        LOG_DEBUG("Process<{}>: Step deferred while paused", pid_);
        stepDeferred_ = true;
        return;
    }

    ProcessState current = state();
    if (current == ProcessState::WAITING) {
        return;
    }
    if (current == ProcessState::CREATED) {
        transitionTo(std::make_unique<RunningState>());
        if (pendingKill_) {
            applyPendingKill();
            return;
        }
        if (state() != ProcessState::RUNNING) {
            return;
        }
        if (paused_) {
            stepDeferred_ = true;
            return;
        }
    }

    executeStep();
}

void Process::executeStep() {
    StepCommand command;
    stepping_ = true;
    try {
        LOG_TRACE("Process<{}>: Running step '{}'", pid_, nextStep_);
        command = dispatchStep(nextStep_);
    } catch (const std::exception &e) {
        command = Raise{e.what(), std::current_exception()};
    } catch (...) {
        command = Raise{"unknown error", std::current_exception()};
    }
    stepping_ = false;

    // A kill requested during the step wins over its directive
    if (pendingKill_) {
        applyPendingKill();
        return;
    }
    if (isTerminal()) {
        return;
    }

    handleCommand(std::move(command));
    applyPendingKill();
}

void Process::handleCommand(StepCommand command) {
    LOG_DEBUG("Process<{}>: Step '{}' returned {}", pid_, nextStep_, describeCommand(command));

    std::visit(Overloaded{
                   [this](Continue &c) {
                       if (!c.next.empty()) {
                           nextStep_ = c.next;
                       }
                       transitionTo(std::make_unique<RunningState>());
                       if (state() == ProcessState::RUNNING) {
                           scheduleStep();
                       }
                   },
                   [this](Wait &w) {
                       if (!w.resume.empty()) {
                           nextStep_ = w.resume;
                       }
                       transitionTo(std::make_unique<WaitingState>(w.message));
                       if (state() == ProcessState::WAITING) {
                           armWaitCondition(std::move(w.condition));
                       }
                   },
                   [this](Finish &f) {
                       if (!f.outputs.is_object() && !f.outputs.is_null()) {
                           transitionTo(std::make_unique<ExceptedState>(
                               "Outputs must be an object, got " + std::string(f.outputs.type_name()),
                               std::make_exception_ptr(StepError("Outputs must be an object"))));
                           return;
                       }
                       if (f.outputs.is_object()) {
                           for (auto it = f.outputs.begin(); it != f.outputs.end(); ++it) {
                               out(it.key(), it.value());
                           }
                       }
                       transitionTo(std::make_unique<FinishedState>(f.successful));
                   },
                   [this](Raise &r) {
                       std::exception_ptr error = r.error ? r.error : std::make_exception_ptr(StepError(r.message));
                       std::string message = r.message.empty() ? describeError(error) : r.message;
                       LOG_WARN("Process<{}>: Step '{}' failed: {}", pid_, nextStep_, message);
                       transitionTo(std::make_unique<ExceptedState>(message, error));
                   },
               },
               command);
}

void Process::scheduleResume() {
    if (resumeScheduled_) {
        return;
    }
    resumeScheduled_ = true;

    std::weak_ptr<Process> weak = weak_from_this();
    context_.scheduler->post([weak]() {
        if (auto self = weak.lock()) {
            self->resumeScheduled_ = false;
            self->doResume();
        }
    });
}

void Process::doResume() {
    if (pendingKill_) {
        applyPendingKill();
        return;
    }
    if (state() != ProcessState::WAITING) {
        resumePending_ = false;
        return;
    }
    if (paused_) {
        resumePending_ = true;
        return;
    }

    resumePending_ = false;
    disarmWaitCondition();
    transitionTo(std::make_unique<RunningState>());

    if (pendingKill_) {
        applyPendingKill();
        return;
    }
    if (state() != ProcessState::RUNNING) {
        return;
    }
    if (paused_) {
        stepDeferred_ = true;
        return;
    }
    executeStep();
}

void Process::applyPendingKill() {
    if (!pendingKill_ || stepping_ || isTransitioning()) {
        return;
    }

    std::string message = *pendingKill_;
    pendingKill_.reset();
    if (!isTerminal()) {
        performKill(message);
    }
}

void Process::performKill(const std::string &message) {
    LOG_INFO("Process<{}>: Killed in {}{}", pid_, currentLabel(), message.empty() ? "" : ": " + message);
    disarmWaitCondition();
    transitionTo(std::make_unique<KilledState>(message));
}

void Process::armWaitCondition(std::shared_ptr<WaitCondition> condition) {
    waitCondition_ = std::move(condition);
    if (!waitCondition_) {
        return;
    }

    LOG_DEBUG("Process<{}>: Waiting on {}", pid_, waitCondition_->describe());
    try {
        waitCondition_->arm(shared_from_this());
    } catch (const std::exception &e) {
        LOG_ERROR("Process<{}>: Cannot arm wait condition: {}", pid_, e.what());
        waitCondition_.reset();
        transitionTo(std::make_unique<ExceptedState>(std::string("Cannot arm wait condition: ") + e.what(),
                                                     std::current_exception()));
    }
}

void Process::disarmWaitCondition() {
    if (!waitCondition_) {
        return;
    }
    auto condition = std::move(waitCondition_);
    waitCondition_.reset();
    condition->disarm();
}

void Process::checkpoint() {
    if (!context_.persister) {
        return;
    }

    try {
        context_.persister->saveCheckpoint(*this);
        lastCheckpointError_.reset();
    } catch (const std::exception &e) {
        lastCheckpointError_ = e.what();
        if (state() == ProcessState::WAITING) {
            // Resuming after a restart depends on this checkpoint
            LOG_ERROR("Process<{}>: Checkpoint on entering WAITING failed, resumption after restart is at risk: {}",
                      pid_, e.what());
            const std::string error = e.what();
            forEachListener([this, &error](IProcessListener &listener) { listener.onCheckpointFailed(*this, error); });
        } else {
            LOG_ERROR("Process<{}>: Checkpoint in {} failed: {}", pid_, currentLabel(), e.what());
        }
    }
}

void Process::broadcastStateChanged(const std::string &from, const std::string &to) {
    if (!context_.broker) {
        return;
    }

    json envelope = ControlMessage::broadcast(MessageKind::STATE_CHANGED, pid_, json{{"from", from}, {"to", to}}).toJson();
    try {
        auto delivery = context_.broker->publish(Constants::BROADCAST_TOPIC, envelope);
        if (delivery.wait_for(context_.config.broadcastTimeout) != std::future_status::ready) {
            broadcastFailures_++;
            LOG_WARN("Process<{}>: STATE_CHANGED {} -> {} not delivered within {} ms, dropped", pid_, from, to,
                     context_.config.broadcastTimeout.count());
            return;
        }
        delivery.get();
    } catch (const std::exception &e) {
        broadcastFailures_++;
        LOG_WARN("Process<{}>: STATE_CHANGED {} -> {} dropped: {}", pid_, from, to, e.what());
    }
}

void Process::notifyStateListeners() {
    switch (state()) {
    case ProcessState::CREATED:
        forEachListener([this](IProcessListener &listener) { listener.onProcessCreated(*this); });
        break;
    case ProcessState::RUNNING:
        forEachListener([this](IProcessListener &listener) { listener.onProcessRunning(*this); });
        break;
    case ProcessState::WAITING:
        forEachListener([this](IProcessListener &listener) { listener.onProcessWaiting(*this); });
        break;
    case ProcessState::FINISHED:
        forEachListener([this](IProcessListener &listener) { listener.onProcessFinished(*this, outputs_); });
        break;
    case ProcessState::EXCEPTED: {
        const std::string reason = statusMessage();
        forEachListener([this, &reason](IProcessListener &listener) { listener.onProcessExcepted(*this, reason); });
        break;
    }
    case ProcessState::KILLED: {
        const std::string message = statusMessage();
        forEachListener([this, &message](IProcessListener &listener) { listener.onProcessKilled(*this, message); });
        break;
    }
    }
}

void Process::forEachListener(const std::function<void(IProcessListener &)> &callback) {
    // Copy, listeners may add or remove listeners while notified
    auto listeners = listeners_;
    for (const auto &listener : listeners) {
        try {
            callback(*listener);
        } catch (const std::exception &e) {
            LOG_ERROR("Process<{}>: Listener threw: {}", pid_, e.what());
        }
    }
}

}  // namespace RPE
