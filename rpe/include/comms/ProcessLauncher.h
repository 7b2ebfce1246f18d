// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "comms/IBroker.h"
#include "comms/ControlMessage.h"
#include "runtime/ProcessContext.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace RPE {

class Process;

/**
 * @brief Hosts processes launched through the control plane
 *
 * Serves LAUNCH and CONTINUE requests on Constants::LAUNCHER_TARGET. Work is
 * posted onto the context scheduler so processes are created on the loop
 * thread. The launcher keeps launched processes alive until they terminate
 * and purgeTerminated() is called.
 */
class ProcessLauncher {
public:
    explicit ProcessLauncher(const ProcessContext &context);
    ~ProcessLauncher();

    ProcessLauncher(const ProcessLauncher &) = delete;
    ProcessLauncher &operator=(const ProcessLauncher &) = delete;

    /**
     * @throws BrokerError if the launcher target is already served
     */
    void start();

    void stop();

    bool isStarted() const {
        return subscription_.has_value();
    }

    /**
     * @brief Create, initialize and start a registered process type
     * @throws ValidationError for unknown types or rejected inputs
     */
    std::shared_ptr<Process> launch(const std::string &processType, const json &inputs = json::object());

    /**
     * @brief Reload a checkpoint and resume it
     * @throws ReconstructionError if no usable checkpoint exists
     */
    std::shared_ptr<Process> continueProcess(const std::string &pid, const std::string &tag = "");

    std::shared_ptr<Process> find(const std::string &pid) const;

    std::vector<std::string> hostedProcesses() const;

    /**
     * @brief Drop references to terminated processes
     * @return Number of processes released
     */
    size_t purgeTerminated();

private:
    json handle(const ControlMessage &request);
    void host(const std::shared_ptr<Process> &process);

    ProcessContext context_;
    std::optional<SubscriptionId> subscription_;
    // Shared with queued request handlers, which may outlive the launcher
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Process>> processes_;
};

}  // namespace RPE
