// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "comms/IBroker.h"
#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>

namespace RPE {

/**
 * @brief In-process broker
 *
 * Broadcast handlers and RPC handlers run synchronously on the publishing
 * or sending thread. setConnected(false) simulates a partition: publish
 * and rpcSend then throw BrokerError.
 */
class InMemoryBroker : public IBroker {
public:
    InMemoryBroker() = default;

    std::future<void> publish(const std::string &topic, const json &message) override;
    SubscriptionId subscribe(const std::string &topic, MessageHandler handler) override;
    SubscriptionId subscribeRpc(const std::string &target, RpcHandler handler) override;
    bool unsubscribe(SubscriptionId subscriptionId) override;
    std::future<json> rpcSend(const std::string &target, const json &message) override;
    bool isConnected() const override;

    void setConnected(bool connected);

    size_t subscriberCount(const std::string &topic) const;

    bool hasRpcTarget(const std::string &target) const;

private:
    struct Subscription {
        std::string topic;
        MessageHandler handler;
    };

    struct RpcSubscription {
        std::string target;
        RpcHandler handler;
    };

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    std::map<SubscriptionId, RpcSubscription> rpcSubscriptions_;
    std::unordered_map<std::string, SubscriptionId> rpcTargets_;
    SubscriptionId nextSubscriptionId_ = 1;
    std::atomic<bool> connected_{true};
};

}  // namespace RPE
