#include "comms/InMemoryBroker.h"
#include "common/Exceptions.h"
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace RPE {

class InMemoryBrokerTest : public ::testing::Test {
protected:
    InMemoryBroker broker;
};

TEST_F(InMemoryBrokerTest, PublishReachesOnlyTopicSubscribers) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    broker.subscribe("topic.a", [&first](const json &message) { first.push_back(message["n"].get<std::string>()); });
    broker.subscribe("topic.b", [&second](const json &message) { second.push_back(message["n"].get<std::string>()); });

    broker.publish("topic.a", json{{"n", "one"}}).get();
    broker.publish("topic.b", json{{"n", "two"}}).get();
    broker.publish("topic.c", json{{"n", "three"}}).get();

    EXPECT_EQ(std::vector<std::string>({"one"}), first);
    EXPECT_EQ(std::vector<std::string>({"two"}), second);
}

TEST_F(InMemoryBrokerTest, UnsubscribeStopsDelivery) {
    int received = 0;
    auto id = broker.subscribe("topic", [&received](const json &) { received++; });
    EXPECT_EQ(1u, broker.subscriberCount("topic"));

    EXPECT_TRUE(broker.unsubscribe(id));
    EXPECT_FALSE(broker.unsubscribe(id));
    broker.publish("topic", json::object()).get();
    EXPECT_EQ(0, received);
}

TEST_F(InMemoryBrokerTest, ThrowingSubscriberDoesNotStopOthers) {
    int received = 0;
    broker.subscribe("topic", [](const json &) { throw std::runtime_error("bad subscriber"); });
    broker.subscribe("topic", [&received](const json &) { received++; });

    EXPECT_NO_THROW(broker.publish("topic", json::object()).get());
    EXPECT_EQ(1, received);
}

TEST_F(InMemoryBrokerTest, RpcIsAnsweredByTargetOnly) {
    broker.subscribeRpc("a", [](const json &, RpcResponder respond) { respond(json{{"from", "a"}}); });
    broker.subscribeRpc("b", [](const json &, RpcResponder respond) { respond(json{{"from", "b"}}); });

    EXPECT_EQ("a", broker.rpcSend("a", json::object()).get()["from"]);
    EXPECT_EQ("b", broker.rpcSend("b", json::object()).get()["from"]);
}

TEST_F(InMemoryBrokerTest, RpcWithoutTargetIsUnroutable) {
    auto future = broker.rpcSend("nobody", json::object());
    EXPECT_THROW(future.get(), UnroutableError);
}

TEST_F(InMemoryBrokerTest, SecondRpcSubscriberForTargetIsRejected) {
    auto id = broker.subscribeRpc("a", [](const json &, RpcResponder) {});
    EXPECT_THROW(broker.subscribeRpc("a", [](const json &, RpcResponder) {}), BrokerError);

    EXPECT_TRUE(broker.unsubscribe(id));
    EXPECT_FALSE(broker.hasRpcTarget("a"));
    EXPECT_NO_THROW(broker.subscribeRpc("a", [](const json &, RpcResponder) {}));
}

TEST_F(InMemoryBrokerTest, DeferredResponseCompletesLater) {
    RpcResponder saved;
    broker.subscribeRpc("a", [&saved](const json &, RpcResponder respond) { saved = std::move(respond); });

    auto future = broker.rpcSend("a", json::object());
    EXPECT_EQ(std::future_status::timeout, future.wait_for(std::chrono::milliseconds(0)));

    saved(json{{"late", true}});
    saved(json{{"late", false}});
    EXPECT_EQ(true, future.get()["late"]);
}

TEST_F(InMemoryBrokerTest, ThrowingRpcHandlerFailsTheFuture) {
    broker.subscribeRpc("a", [](const json &, RpcResponder) { throw ControlError("refused"); });
    auto future = broker.rpcSend("a", json::object());
    EXPECT_THROW(future.get(), ControlError);
}

TEST_F(InMemoryBrokerTest, DisconnectedBrokerRefusesTraffic) {
    broker.setConnected(false);
    EXPECT_FALSE(broker.isConnected());
    EXPECT_THROW(broker.publish("topic", json::object()), BrokerError);
    EXPECT_THROW(broker.rpcSend("a", json::object()), BrokerError);

    broker.setConnected(true);
    EXPECT_NO_THROW(broker.publish("topic", json::object()).get());
}

}  // namespace RPE
