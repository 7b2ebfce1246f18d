// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <string>

namespace RPE {

class Process;

/**
 * @brief Observer of a process lifecycle
 *
 * All callbacks run on the process's scheduler thread. Listeners are
 * released by the process after the terminal notification; one that needs
 * the process later should keep a std::weak_ptr to it.
 */
class IProcessListener {
public:
    virtual ~IProcessListener() = default;

    virtual void onProcessCreated(Process &process) {
        (void)process;
    }

    virtual void onProcessRunning(Process &process) {
        (void)process;
    }

    virtual void onProcessWaiting(Process &process) {
        (void)process;
    }

    virtual void onProcessPaused(Process &process) {
        (void)process;
    }

    virtual void onProcessPlayed(Process &process) {
        (void)process;
    }

    virtual void onOutputEmitted(Process &process, const std::string &port, const json &value) {
        (void)process;
        (void)port;
        (void)value;
    }

    virtual void onProcessFinished(Process &process, const json &outputs) {
        (void)process;
        (void)outputs;
    }

    virtual void onProcessExcepted(Process &process, const std::string &reason) {
        (void)process;
        (void)reason;
    }

    virtual void onProcessKilled(Process &process, const std::string &message) {
        (void)process;
        (void)message;
    }

    /**
     * @brief A checkpoint taken on entering WAITING could not be saved
     */
    virtual void onCheckpointFailed(Process &process, const std::string &error) {
        (void)process;
        (void)error;
    }
};

}  // namespace RPE
