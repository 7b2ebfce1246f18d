// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "comms/InMemoryBroker.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include <memory>
#include <vector>

namespace RPE {

std::future<void> InMemoryBroker::publish(const std::string &topic, const json &message) {
    if (!connected_) {
        throw BrokerError("Broker disconnected, cannot publish to '" + topic + "'");
    }

    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, subscription] : subscriptions_) {
            if (subscription.topic == topic) {
                handlers.push_back(subscription.handler);
            }
        }
    }

    // Handlers run without the lock, they may publish or subscribe themselves
    for (const auto &handler : handlers) {
        try {
            handler(message);
        } catch (const std::exception &e) {
            LOG_WARN("InMemoryBroker: Subscriber of '{}' threw: {}", topic, e.what());
        }
    }

    std::promise<void> delivered;
    delivered.set_value();
    return delivered.get_future();
}

SubscriptionId InMemoryBroker::subscribe(const std::string &topic, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_[id] = Subscription{topic, std::move(handler)};
    return id;
}

SubscriptionId InMemoryBroker::subscribeRpc(const std::string &target, RpcHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rpcTargets_.find(target) != rpcTargets_.end()) {
        throw BrokerError("RPC target '" + target + "' already has a subscriber");
    }
    SubscriptionId id = nextSubscriptionId_++;
    rpcSubscriptions_[id] = RpcSubscription{target, std::move(handler)};
    rpcTargets_[target] = id;
    return id;
}

bool InMemoryBroker::unsubscribe(SubscriptionId subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscriptions_.erase(subscriptionId) > 0) {
        return true;
    }

    auto it = rpcSubscriptions_.find(subscriptionId);
    if (it == rpcSubscriptions_.end()) {
        return false;
    }
    rpcTargets_.erase(it->second.target);
    rpcSubscriptions_.erase(it);
    return true;
}

std::future<json> InMemoryBroker::rpcSend(const std::string &target, const json &message) {
    if (!connected_) {
        throw BrokerError("Broker disconnected, cannot reach '" + target + "'");
    }

    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();

    RpcHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rpcTargets_.find(target);
        if (it != rpcTargets_.end()) {
            handler = rpcSubscriptions_[it->second].handler;
        }
    }

    if (!handler) {
        promise->set_exception(std::make_exception_ptr(UnroutableError("No subscriber for RPC target '" + target + "'")));
        return future;
    }

    auto answered = std::make_shared<std::atomic<bool>>(false);
    RpcResponder respond = [promise, answered, target](const json &response) {
        if (answered->exchange(true)) {
            LOG_WARN("InMemoryBroker: Duplicate response from '{}' ignored", target);
            return;
        }
        promise->set_value(response);
    };

    try {
        handler(message, std::move(respond));
    } catch (const std::exception &e) {
        if (!answered->exchange(true)) {
            promise->set_exception(std::current_exception());
        }
        LOG_WARN("InMemoryBroker: RPC handler of '{}' threw: {}", target, e.what());
    }
    return future;
}

bool InMemoryBroker::isConnected() const {
    return connected_;
}

void InMemoryBroker::setConnected(bool connected) {
    connected_ = connected;
    LOG_INFO("InMemoryBroker: {}", connected ? "Connected" : "Disconnected");
}

size_t InMemoryBroker::subscriberCount(const std::string &topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &[id, subscription] : subscriptions_) {
        if (subscription.topic == topic) {
            count++;
        }
    }
    return count;
}

bool InMemoryBroker::hasRpcTarget(const std::string &target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rpcTargets_.find(target) != rpcTargets_.end();
}

}  // namespace RPE
