// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "statemachine/State.h"
#include "statemachine/TransitionTable.h"
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace RPE {

/**
 * @brief Reusable finite-state machine with guarded transitions and lifecycle hooks
 *
 * Exactly one state is current once initialize() has run. Every transition
 * is checked against the TransitionTable; transitions never nest (single
 * writer), and a terminal state accepts no further transitions.
 *
 * Transition order:
 * 1. EXITING callbacks, onExiting(), current->exit()
 * 2. onEntering(), ENTERING callbacks, next->enter()
 * 3. current state replaced, label appended to history
 * 4. onEntered(), ENTERED callbacks
 *
 * A disallowed target or a throwing hook is recorded as the machine's
 * failure and handed to transitionFailed(), which rethrows by default.
 * Subclasses override it to move into a failure state instead.
 */
class StateMachine {
public:
    enum class TransitionEvent { ENTERING, ENTERED, EXITING };

    /**
     * @brief Observer of transition events
     * @param event Phase of the transition
     * @param from Source label (empty for the initial state)
     * @param to Target label
     */
    using TransitionCallback =
        std::function<void(TransitionEvent event, const std::string &from, const std::string &to)>;

    StateMachine(TransitionTable table, std::string initialLabel);

    virtual ~StateMachine() = default;

    StateMachine(const StateMachine &) = delete;
    StateMachine &operator=(const StateMachine &) = delete;

    /**
     * @brief Enter the initial state and fire its entry hooks
     * @throws TransitionError if already initialized
     */
    virtual void initialize();

    /**
     * @brief Transition to a state created by createState(label)
     */
    void transitionTo(const std::string &label);

    /**
     * @brief Transition to a prepared state object
     *
     * @throws TransitionError if the machine is not initialized, a transition
     *         is already in progress, or the current state is terminal. The
     *         current state is left unchanged in all three cases.
     */
    void transitionTo(std::unique_ptr<State> next);

    /**
     * @brief Current label, empty before initialize()
     */
    std::string currentLabel() const;

    const State *currentState() const {
        return state_.get();
    }

    bool isInitialized() const {
        return state_ != nullptr;
    }

    /**
     * @brief True if the current state is terminal
     */
    bool isTerminal() const;

    bool isTransitioning() const {
        return transitioning_;
    }

    const TransitionTable &table() const {
        return table_;
    }

    /**
     * @brief Labels entered so far, initial state first
     */
    const std::vector<std::string> &history() const {
        return history_;
    }

    bool hasFailed() const {
        return failure_ != nullptr;
    }

    /**
     * @brief Error captured by the last failed transition, if any
     */
    std::exception_ptr failure() const {
        return failure_;
    }

    const std::string &failureMessage() const {
        return failureMessage_;
    }

    int addTransitionCallback(TransitionCallback callback);

    bool removeTransitionCallback(int callbackId);

protected:
    /**
     * @brief Build the state object for a label
     *
     * The default creates a plain State.
     */
    virtual std::unique_ptr<State> createState(const std::string &label);

    virtual void onExiting(const State &current) {
        (void)current;
    }

    virtual void onEntering(const State &next) {
        (void)next;
    }

    virtual void onEntered(const std::string &from) {
        (void)from;
    }

    /**
     * @brief Called after a transition failed and the failure was recorded
     *
     * The default rethrows the error.
     */
    virtual void transitionFailed(const std::string &from, const std::string &to, std::exception_ptr error);

    /**
     * @brief Install a state without running any hook
     *
     * Used when reconstructing a machine from a checkpoint. The label is
     * appended to history.
     */
    void restoreState(std::unique_ptr<State> state);

    static std::string describeError(std::exception_ptr error);

private:
    void performTransition(std::unique_ptr<State> next, bool &swapped);
    void fireCallbacks(TransitionEvent event, const std::string &from, const std::string &to);

    TransitionTable table_;
    std::string initialLabel_;
    std::unique_ptr<State> state_;
    std::vector<std::string> history_;

    bool transitioning_ = false;
    // Set when a transition failed after the current state was exited
    bool transitionFailing_ = false;

    std::exception_ptr failure_;
    std::string failureMessage_;

    std::vector<std::pair<int, TransitionCallback>> callbacks_;
    int nextCallbackId_ = 1;
};

}  // namespace RPE
