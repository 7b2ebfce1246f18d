// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "comms/ControlFuture.h"
#include "comms/IBroker.h"
#include "common/Constants.h"
#include "common/EngineConfig.h"
#include "runtime/StatusReport.h"
#include <chrono>
#include <memory>
#include <string>

namespace RPE {

/**
 * @brief Non-blocking control client
 *
 * Every call sends one RPC and returns immediately; the ControlFuture
 * resolves when the response arrives. Broadcast commands (pauseAll,
 * playAll, killAll) are fire-and-forget.
 *
 * @code
 * RPE::AsyncProcessController controller(broker);
 * auto paused = controller.pause(pid);
 * // ... other work ...
 * bool acknowledged = paused.get();
 * @endcode
 */
class AsyncProcessController {
public:
    explicit AsyncProcessController(std::shared_ptr<IBroker> broker,
                                    std::chrono::milliseconds timeout = Constants::DEFAULT_RPC_TIMEOUT);

    /**
     * @brief Use config.rpcTimeout as the response bound
     */
    AsyncProcessController(std::shared_ptr<IBroker> broker, const EngineConfig &config);

    ControlFuture<bool> pause(const std::string &pid, const std::string &message = "");

    ControlFuture<bool> play(const std::string &pid);

    ControlFuture<bool> kill(const std::string &pid, const std::string &message = "");

    ControlFuture<StatusReport> status(const std::string &pid);

    /**
     * @brief Ask the launcher to create and start a process
     * @return Future of the new pid
     */
    ControlFuture<std::string> launch(const std::string &processType, const json &inputs = json::object());

    /**
     * @brief Ask the launcher to reload a checkpoint and resume it
     */
    ControlFuture<std::string> continueProcess(const std::string &pid, const std::string &tag = "");

    /**
     * @throws BrokerError if the broadcast cannot be published
     */
    void pauseAll(const std::string &message = "");
    void playAll();
    void killAll(const std::string &message = "");

    /**
     * @brief Send a prepared request to a target
     */
    ControlFuture<json> send(const std::string &target, const ControlMessage &request);

    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

private:
    template <typename T>
    ControlFuture<T> call(const std::string &target, const ControlMessage &request,
                          typename ControlFuture<T>::Converter convert);

    void broadcastCommand(MessageKind kind, const json &payload);

    std::shared_ptr<IBroker> broker_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Blocking control client
 *
 * Same wire messages as AsyncProcessController; each call waits for the
 * response before returning.
 * @throws ControlTimeoutError, ControlError, UnroutableError, BrokerError
 */
class BlockingProcessController {
public:
    explicit BlockingProcessController(std::shared_ptr<IBroker> broker,
                                       std::chrono::milliseconds timeout = Constants::DEFAULT_RPC_TIMEOUT);

    BlockingProcessController(std::shared_ptr<IBroker> broker, const EngineConfig &config);

    std::chrono::milliseconds timeout() const {
        return async_.timeout();
    }

    bool pause(const std::string &pid, const std::string &message = "");
    bool play(const std::string &pid);
    bool kill(const std::string &pid, const std::string &message = "");
    StatusReport status(const std::string &pid);
    std::string launch(const std::string &processType, const json &inputs = json::object());
    std::string continueProcess(const std::string &pid, const std::string &tag = "");

    void pauseAll(const std::string &message = "");
    void playAll();
    void killAll(const std::string &message = "");

private:
    AsyncProcessController async_;
};

}  // namespace RPE
