// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <exception>
#include <memory>
#include <string>
#include <variant>

namespace RPE {

class WaitCondition;

/**
 * @brief Stay RUNNING and run the named step on the next scheduler turn
 *
 * An empty name re-runs the current step.
 */
struct Continue {
    std::string next;
};

/**
 * @brief Suspend in WAITING until the resumption trigger fires
 *
 * Without a condition the process waits for an explicit resume().
 * An empty resume name re-enters the current step.
 */
struct Wait {
    std::string resume;
    std::string message;
    std::shared_ptr<WaitCondition> condition;
};

/**
 * @brief Finish with the given outputs (merged into already emitted ones)
 */
struct Finish {
    json outputs = json::object();
    bool successful = true;
};

/**
 * @brief Fail the process, moving it to EXCEPTED
 */
struct Raise {
    std::string message;
    std::exception_ptr error;
};

/**
 * @brief Directive returned by every step function
 */
using StepCommand = std::variant<Continue, Wait, Finish, Raise>;

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};

/**
 * @brief Short form for logs and tests, e.g. "Continue(next_step)"
 */
std::string describeCommand(const StepCommand &command);

}  // namespace RPE
