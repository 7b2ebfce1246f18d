// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "comms/ControlMessage.h"
#include "comms/IBroker.h"
#include <memory>
#include <optional>
#include <string>

namespace RPE {

class Process;
class ITaskScheduler;

/**
 * @brief Server side of the control protocol, embedded in each Process
 *
 * Serves RPCs addressed to the process pid and acts on PLAY/PAUSE/KILL
 * broadcasts addressed to the pid or to every process. Handlers run on
 * the broker's thread and only post work onto the process scheduler, so
 * the process state is touched from its loop thread only.
 */
class ProcessMessageRouter {
public:
    ProcessMessageRouter(std::weak_ptr<Process> process, std::string pid, std::shared_ptr<IBroker> broker,
                         std::shared_ptr<ITaskScheduler> scheduler);

    ~ProcessMessageRouter();

    ProcessMessageRouter(const ProcessMessageRouter &) = delete;
    ProcessMessageRouter &operator=(const ProcessMessageRouter &) = delete;

    /**
     * @brief Subscribe to the pid RPC target and the broadcast topic
     * @throws BrokerError if the broker refuses a subscription
     */
    void start();

    void stop();

    bool isStarted() const {
        return rpcSubscription_.has_value();
    }

    /**
     * @brief Apply a control message to the process
     * @return Result document of the RPC response
     * @throws ControlError for kinds a process does not serve
     */
    static json apply(Process &process, const ControlMessage &message);

private:
    // Handlers capture copies, the broker may still invoke them while the router is destroyed
    static void onRpc(const std::weak_ptr<Process> &process, const std::string &pid,
                      const std::shared_ptr<ITaskScheduler> &scheduler, const json &request,
                      const RpcResponder &respond);
    static void onBroadcast(const std::weak_ptr<Process> &process, const std::string &pid,
                            const std::shared_ptr<ITaskScheduler> &scheduler, const json &document);

    std::weak_ptr<Process> process_;
    std::string pid_;
    std::shared_ptr<IBroker> broker_;
    std::shared_ptr<ITaskScheduler> scheduler_;
    std::optional<SubscriptionId> rpcSubscription_;
    std::optional<SubscriptionId> broadcastSubscription_;
};

}  // namespace RPE
