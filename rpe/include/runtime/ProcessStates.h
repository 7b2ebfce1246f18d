// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "statemachine/State.h"
#include "statemachine/TransitionTable.h"
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace RPE {

enum class ProcessState { CREATED, RUNNING, WAITING, FINISHED, EXCEPTED, KILLED };

std::string toString(ProcessState state);

std::optional<ProcessState> parseProcessState(const std::string &label);

/**
 * @brief Transition table of the process lifecycle
 *
 * CREATED  -> RUNNING | KILLED | EXCEPTED
 * RUNNING  -> RUNNING | WAITING | FINISHED | KILLED | EXCEPTED
 * WAITING  -> RUNNING | WAITING | FINISHED | KILLED | EXCEPTED
 * FINISHED, EXCEPTED, KILLED are terminal.
 */
TransitionTable createProcessTransitionTable();

/**
 * @brief Base of the process lifecycle states
 *
 * data() is the label-specific part written into checkpoint bundles.
 */
class ProcessStateBase : public State {
public:
    explicit ProcessStateBase(ProcessState state) : State(toString(state)), state_(state) {}

    ProcessState state() const {
        return state_;
    }

    virtual json data() const {
        return json::object();
    }

    /**
     * @brief Human-readable cause reported in status (empty when none)
     */
    virtual std::string message() const {
        return "";
    }

private:
    ProcessState state_;
};

class CreatedState : public ProcessStateBase {
public:
    CreatedState() : ProcessStateBase(ProcessState::CREATED) {}
};

class RunningState : public ProcessStateBase {
public:
    RunningState() : ProcessStateBase(ProcessState::RUNNING) {}
};

class WaitingState : public ProcessStateBase {
public:
    explicit WaitingState(std::string message = "") : ProcessStateBase(ProcessState::WAITING), message_(std::move(message)) {}

    json data() const override {
        return json{{"message", message_}};
    }

    std::string message() const override {
        return message_;
    }

private:
    std::string message_;
};

class FinishedState : public ProcessStateBase {
public:
    explicit FinishedState(bool successful = true) : ProcessStateBase(ProcessState::FINISHED), successful_(successful) {}

    bool successful() const {
        return successful_;
    }

    json data() const override {
        return json{{"successful", successful_}};
    }

private:
    bool successful_;
};

class ExceptedState : public ProcessStateBase {
public:
    ExceptedState(std::string message, std::exception_ptr error)
        : ProcessStateBase(ProcessState::EXCEPTED), message_(std::move(message)), error_(std::move(error)) {}

    std::exception_ptr error() const {
        return error_;
    }

    json data() const override {
        return json{{"exception", message_}};
    }

    std::string message() const override {
        return message_;
    }

private:
    std::string message_;
    std::exception_ptr error_;
};

class KilledState : public ProcessStateBase {
public:
    explicit KilledState(std::string message = "") : ProcessStateBase(ProcessState::KILLED), message_(std::move(message)) {}

    json data() const override {
        return json{{"message", message_}};
    }

    std::string message() const override {
        return message_;
    }

private:
    std::string message_;
};

/**
 * @brief Rebuild a state object from its label and persisted data()
 *
 * A restored EXCEPTED state carries a StepError holding the saved text.
 */
std::unique_ptr<ProcessStateBase> createProcessState(ProcessState state, const json &data = json::object());

}  // namespace RPE
