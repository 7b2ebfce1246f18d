// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <string>

namespace RPE {

class StateMachine;

/**
 * @brief A named mode of a StateMachine
 *
 * A State exists only while it is current. Subclasses carry label-specific
 * data (e.g. a kill message) and may override enter()/exit(); a throwing
 * enter() or exit() fails the transition.
 */
class State {
public:
    explicit State(std::string label) : label_(std::move(label)) {}

    virtual ~State() = default;

    const std::string &label() const {
        return label_;
    }

    /**
     * @brief Owning machine, null until the state has been entered
     */
    StateMachine *owner() const {
        return owner_;
    }

    /**
     * @brief True if the owner's transition table gives this label no outgoing edge
     */
    bool isTerminal() const;

    virtual void enter() {}

    virtual void exit() {}

private:
    friend class StateMachine;

    std::string label_;
    StateMachine *owner_ = nullptr;
};

}  // namespace RPE
