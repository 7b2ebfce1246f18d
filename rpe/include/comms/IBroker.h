// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <functional>
#include <future>
#include <string>

namespace RPE {

using SubscriptionId = uint64_t;

using MessageHandler = std::function<void(const json &message)>;

/**
 * @brief Sends the single response of an RPC request
 */
using RpcResponder = std::function<void(const json &response)>;

/**
 * @brief Serves RPC requests sent to a target
 *
 * The handler may answer later, from any thread, through the responder.
 */
using RpcHandler = std::function<void(const json &request, RpcResponder respond)>;

/**
 * @brief Message broker client used by the control plane
 *
 * Must support concurrent publishing and per-target subscriptions without
 * cross-talk between targets.
 */
class IBroker {
public:
    virtual ~IBroker() = default;

    /**
     * @brief Publish a broadcast message to every subscriber of the topic
     * @return Future completed once the message has been delivered
     * @throws BrokerError if the broker is unreachable
     */
    virtual std::future<void> publish(const std::string &topic, const json &message) = 0;

    virtual SubscriptionId subscribe(const std::string &topic, MessageHandler handler) = 0;

    /**
     * @brief Serve RPC requests addressed to target
     * @throws BrokerError if the target already has a handler
     */
    virtual SubscriptionId subscribeRpc(const std::string &target, RpcHandler handler) = 0;

    virtual bool unsubscribe(SubscriptionId subscriptionId) = 0;

    /**
     * @brief Send an RPC request
     * @return Future of the response document; carries UnroutableError if nobody serves target
     * @throws BrokerError if the broker is unreachable
     */
    virtual std::future<json> rpcSend(const std::string &target, const json &message) = 0;

    virtual bool isConnected() const = 0;
};

}  // namespace RPE
