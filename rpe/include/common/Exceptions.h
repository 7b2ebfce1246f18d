// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <stdexcept>
#include <string>

namespace RPE {

/**
 * @brief Root of all engine exceptions
 *
 * Errors local to a single process end up recorded in its EXCEPTED state.
 * Control-plane errors are thrown at the controller call site.
 */
class RPEException : public std::runtime_error {
public:
    explicit RPEException(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Transition outside the allowed set, from a terminal state, or re-entrant
 */
class TransitionError : public RPEException {
public:
    TransitionError(const std::string &from, const std::string &to, const std::string &reason)
        : RPEException("Cannot transition from '" + from + "' to '" + to + "': " + reason), from_(from), to_(to) {}

    const std::string &from() const {
        return from_;
    }

    const std::string &to() const {
        return to_;
    }

private:
    std::string from_;
    std::string to_;
};

/**
 * @brief Raised by (or on behalf of) user step logic
 */
class StepError : public RPEException {
public:
    explicit StepError(const std::string &message) : RPEException(message) {}
};

/**
 * @brief Outline predicate returned a value that does not convert to bool
 */
class PredicateTypeError : public StepError {
public:
    explicit PredicateTypeError(const std::string &message) : StepError(message) {}
};

/**
 * @brief Operation not valid in the current process state
 */
class InvalidStateError : public RPEException {
public:
    explicit InvalidStateError(const std::string &message) : RPEException(message) {}
};

class SerializationError : public RPEException {
public:
    explicit SerializationError(const std::string &message) : RPEException(message) {}
};

class ReconstructionError : public RPEException {
public:
    explicit ReconstructionError(const std::string &message) : RPEException(message) {}
};

class ValidationError : public RPEException {
public:
    explicit ValidationError(const std::string &message) : RPEException(message) {}
};

/**
 * @brief Explicit error acknowledgement received from the target of a control RPC
 */
class ControlError : public RPEException {
public:
    explicit ControlError(const std::string &message) : RPEException(message) {}
};

/**
 * @brief No process or launcher is subscribed to the RPC target
 */
class UnroutableError : public ControlError {
public:
    explicit UnroutableError(const std::string &message) : ControlError(message) {}
};

/**
 * @brief No acknowledgement within the RPC timeout
 *
 * Kept apart from ControlError so callers can tell a silent target from a refusing one.
 */
class ControlTimeoutError : public RPEException {
public:
    explicit ControlTimeoutError(const std::string &message) : RPEException(message) {}
};

class MalformedMessageError : public RPEException {
public:
    explicit MalformedMessageError(const std::string &message) : RPEException(message) {}
};

/**
 * @brief Broker transport failure (disconnected, closed)
 */
class BrokerError : public RPEException {
public:
    explicit BrokerError(const std::string &message) : RPEException(message) {}
};

class BrokerTimeoutError : public BrokerError {
public:
    explicit BrokerTimeoutError(const std::string &message) : BrokerError(message) {}
};

}  // namespace RPE
