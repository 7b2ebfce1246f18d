// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "statemachine/StateMachine.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include <algorithm>

namespace RPE {

namespace {

// Marks the machine as transitioning for the lifetime of a transition
class TransitionGuard {
public:
    explicit TransitionGuard(bool &flag) : flag_(flag) {
        flag_ = true;
    }

    ~TransitionGuard() {
        flag_ = false;
    }

    TransitionGuard(const TransitionGuard &) = delete;
    TransitionGuard &operator=(const TransitionGuard &) = delete;

private:
    bool &flag_;
};

}  // namespace

bool State::isTerminal() const {
    return owner_ != nullptr && owner_->table().isTerminal(label_);
}

StateMachine::StateMachine(TransitionTable table, std::string initialLabel)
    : table_(std::move(table)), initialLabel_(std::move(initialLabel)) {
    table_.terminal(initialLabel_);
}

void StateMachine::initialize() {
    if (state_) {
        throw TransitionError(currentLabel(), initialLabel_, "machine already initialized");
    }

    auto initial = createState(initialLabel_);
    try {
        TransitionGuard guard(transitioning_);
        initial->owner_ = this;
        onEntering(*initial);
        fireCallbacks(TransitionEvent::ENTERING, "", initialLabel_);
        initial->enter();

        state_ = std::move(initial);
        history_.push_back(initialLabel_);

        onEntered("");
        fireCallbacks(TransitionEvent::ENTERED, "", initialLabel_);
    } catch (const std::exception &e) {
        failure_ = std::current_exception();
        failureMessage_ = e.what();
        LOG_ERROR("StateMachine: Failed to enter initial state '{}': {}", initialLabel_, e.what());
        throw;
    }

    LOG_DEBUG("StateMachine: Initialized in state '{}'", initialLabel_);
}

void StateMachine::transitionTo(const std::string &label) {
    transitionTo(createState(label));
}

void StateMachine::transitionTo(std::unique_ptr<State> next) {
    const std::string from = currentLabel();
    const std::string to = next ? next->label() : "";

    if (!next) {
        throw TransitionError(from, to, "null target state");
    }
    if (transitioning_) {
        throw TransitionError(from, to, "another transition is in progress");
    }
    if (!state_) {
        throw TransitionError(from, to, "machine not initialized");
    }
    if (table_.isTerminal(from)) {
        LOG_ERROR("StateMachine: Transition attempted from terminal state '{}' to '{}'", from, to);
        throw TransitionError(from, to, "terminal state accepts no transitions");
    }

    std::exception_ptr error;
    if (!table_.isAllowed(from, to)) {
        error = std::make_exception_ptr(TransitionError(from, to, "not an allowed transition"));
    } else {
        bool swapped = false;
        try {
            performTransition(std::move(next), swapped);
        } catch (const std::exception &) {
            error = std::current_exception();
            if (!swapped) {
                transitionFailing_ = true;
            }
        }
    }

    if (error) {
        failure_ = error;
        failureMessage_ = describeError(error);
        LOG_ERROR("StateMachine: Transition '{}' -> '{}' failed: {}", from, to, failureMessage_);
        transitionFailed(from, to, error);
    }
}

void StateMachine::performTransition(std::unique_ptr<State> next, bool &swapped) {
    TransitionGuard guard(transitioning_);

    const std::string from = state_->label();
    const std::string to = next->label();

    // The previous failed attempt already exited the current state
    if (!transitionFailing_) {
        fireCallbacks(TransitionEvent::EXITING, from, to);
        onExiting(*state_);
        state_->exit();
    }

    next->owner_ = this;
    onEntering(*next);
    fireCallbacks(TransitionEvent::ENTERING, from, to);
    next->enter();

    state_ = std::move(next);
    history_.push_back(to);
    transitionFailing_ = false;
    swapped = true;

    LOG_DEBUG("StateMachine: '{}' -> '{}'", from, to);

    onEntered(from);
    fireCallbacks(TransitionEvent::ENTERED, from, to);
}

std::string StateMachine::currentLabel() const {
    return state_ ? state_->label() : "";
}

bool StateMachine::isTerminal() const {
    return state_ && table_.isTerminal(state_->label());
}

int StateMachine::addTransitionCallback(TransitionCallback callback) {
    int id = nextCallbackId_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

bool StateMachine::removeTransitionCallback(int callbackId) {
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [callbackId](const auto &entry) { return entry.first == callbackId; });
    if (it == callbacks_.end()) {
        return false;
    }
    callbacks_.erase(it);
    return true;
}

std::unique_ptr<State> StateMachine::createState(const std::string &label) {
    return std::make_unique<State>(label);
}

void StateMachine::transitionFailed(const std::string &from, const std::string &to, std::exception_ptr error) {
    (void)from;
    (void)to;
    std::rethrow_exception(error);
}

void StateMachine::restoreState(std::unique_ptr<State> state) {
    if (!state) {
        throw TransitionError(currentLabel(), "", "cannot restore a null state");
    }
    state->owner_ = this;
    history_.push_back(state->label());
    state_ = std::move(state);
}

std::string StateMachine::describeError(std::exception_ptr error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

void StateMachine::fireCallbacks(TransitionEvent event, const std::string &from, const std::string &to) {
    // Copy, a callback may remove itself
    auto callbacks = callbacks_;
    for (const auto &[id, callback] : callbacks) {
        callback(event, from, to);
    }
}

}  // namespace RPE
