// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ProcessStates.h"
#include "common/Exceptions.h"

namespace RPE {

std::string toString(ProcessState state) {
    switch (state) {
    case ProcessState::CREATED:
        return "CREATED";
    case ProcessState::RUNNING:
        return "RUNNING";
    case ProcessState::WAITING:
        return "WAITING";
    case ProcessState::FINISHED:
        return "FINISHED";
    case ProcessState::EXCEPTED:
        return "EXCEPTED";
    case ProcessState::KILLED:
        return "KILLED";
    }
    return "UNKNOWN";
}

std::optional<ProcessState> parseProcessState(const std::string &label) {
    for (auto state : {ProcessState::CREATED, ProcessState::RUNNING, ProcessState::WAITING, ProcessState::FINISHED,
                       ProcessState::EXCEPTED, ProcessState::KILLED}) {
        if (toString(state) == label) {
            return state;
        }
    }
    return std::nullopt;
}

TransitionTable createProcessTransitionTable() {
    const std::string created = toString(ProcessState::CREATED);
    const std::string running = toString(ProcessState::RUNNING);
    const std::string waiting = toString(ProcessState::WAITING);
    const std::string finished = toString(ProcessState::FINISHED);
    const std::string excepted = toString(ProcessState::EXCEPTED);
    const std::string killed = toString(ProcessState::KILLED);

    TransitionTable table;
    table.allow(created, {running, killed, excepted})
        .allow(running, {running, waiting, finished, killed, excepted})
        .allow(waiting, {running, waiting, finished, killed, excepted})
        .terminal(finished)
        .terminal(excepted)
        .terminal(killed);
    return table;
}

std::unique_ptr<ProcessStateBase> createProcessState(ProcessState state, const json &data) {
    switch (state) {
    case ProcessState::CREATED:
        return std::make_unique<CreatedState>();
    case ProcessState::RUNNING:
        return std::make_unique<RunningState>();
    case ProcessState::WAITING:
        return std::make_unique<WaitingState>(JsonUtils::getString(data, "message"));
    case ProcessState::FINISHED:
        return std::make_unique<FinishedState>(JsonUtils::getBool(data, "successful", true));
    case ProcessState::EXCEPTED: {
        std::string message = JsonUtils::getString(data, "exception");
        return std::make_unique<ExceptedState>(message, std::make_exception_ptr(StepError(message)));
    }
    case ProcessState::KILLED:
        return std::make_unique<KilledState>(JsonUtils::getString(data, "message"));
    }
    throw ReconstructionError("Unknown process state");
}

}  // namespace RPE
