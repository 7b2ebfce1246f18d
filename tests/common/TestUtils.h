#pragma once

#include "comms/InMemoryBroker.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/TypeRegistry.h"
#include "events/TaskSchedulerImpl.h"
#include "persistence/InMemoryCheckpointStore.h"
#include "persistence/Persister.h"
#include "runtime/Process.h"
#include "runtime/ProcessRegistry.h"
#include "runtime/WaitConditions.h"
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace RPE {
namespace Test {
namespace Utils {

// Common Test Timing Constants
constexpr auto POLL_INTERVAL_MS = std::chrono::milliseconds(10);   // Polling interval for state checks
constexpr auto STANDARD_WAIT_MS = std::chrono::milliseconds(100);  // Standard wait time for async operations
constexpr auto LONG_WAIT_MS = std::chrono::milliseconds(2000);     // Upper bound for cross-thread round trips

}  // namespace Utils

/**
 * @brief Finishes immediately with {"y": 2 * x}
 */
class DoublerProcess : public Process {
public:
    using Process::Process;

    static json validate(const json &inputs) {
        if (!inputs.contains("x") || !inputs["x"].is_number_integer()) {
            throw ValidationError("DoublerProcess requires an integer input 'x'");
        }
        return inputs;
    }

protected:
    StepCommand run() override {
        return Finish{json{{"y", inputs()["x"].get<int64_t>() * 2}}};
    }
};

/**
 * @brief Waits for an explicit resume(), then finishes with {"resumed": true}
 */
class WaitingProcess : public Process {
public:
    WaitingProcess(const ProcessContext &context, const json &inputs, const std::string &pid)
        : Process(context, inputs, pid) {
        registerStep("after_wait", [this]() -> StepCommand {
            afterWaitRuns++;
            return Finish{json{{"resumed", true}}};
        });
    }

    int afterWaitRuns = 0;

protected:
    StepCommand run() override {
        return Wait{"after_wait", "waiting for resume"};
    }
};

/**
 * @brief One scheduler turn per increment until inputs.limit (default 3) is reached
 *
 * The counter is part of the continuation.
 */
class CountingProcess : public Process {
public:
    CountingProcess(const ProcessContext &context, const json &inputs, const std::string &pid)
        : Process(context, inputs, pid) {
        registerStep("count", [this]() -> StepCommand {
            count++;
            if (count < limit()) {
                return Continue{"count"};
            }
            return Finish{json{{"count", count}}};
        });
    }

    int64_t limit() const {
        return inputs().value("limit", int64_t{3});
    }

    json saveContinuation() const override {
        json continuation = Process::saveContinuation();
        continuation["count"] = count;
        return continuation;
    }

    void loadContinuation(const json &continuation) override {
        Process::loadContinuation(continuation);
        count = continuation.value("count", int64_t{0});
    }

    int64_t count = 0;

protected:
    StepCommand run() override {
        return Continue{"count"};
    }
};

/**
 * @brief Throws from its first step
 */
class FailingProcess : public Process {
public:
    using Process::Process;

protected:
    StepCommand run() override {
        throw std::runtime_error("step exploded");
    }
};

/**
 * @brief Sleeps inputs.delay_ms (default 50) on the scheduler, then finishes
 */
class SleepingProcess : public Process {
public:
    SleepingProcess(const ProcessContext &context, const json &inputs, const std::string &pid)
        : Process(context, inputs, pid) {
        registerStep("wake", []() -> StepCommand { return Finish{json{{"slept", true}}}; });
    }

protected:
    StepCommand run() override {
        auto delay = std::chrono::milliseconds(inputs().value("delay_ms", int64_t{50}));
        return Wait{"wake", "sleeping", std::make_shared<DelayCondition>(delay)};
    }

    std::shared_ptr<WaitCondition> restoreWaitCondition() override {
        return std::make_shared<DelayCondition>(std::chrono::milliseconds(inputs().value("delay_ms", int64_t{50})));
    }
};

inline void registerTestProcessTypes() {
    auto &registry = TypeRegistry::getInstance();
    registry.registerProcessType<DoublerProcess>("test.doubler", DoublerProcess::validate);
    registry.registerProcessType<WaitingProcess>("test.waiting");
    registry.registerProcessType<CountingProcess>("test.counting");
    registry.registerProcessType<FailingProcess>("test.failing");
    registry.registerProcessType<SleepingProcess>("test.sleeping");
}

/**
 * @brief Records STATE_CHANGED broadcasts as "pid:to"
 */
class BroadcastRecorder {
public:
    explicit BroadcastRecorder(std::shared_ptr<IBroker> broker) : broker_(std::move(broker)) {
        subscription_ = broker_->subscribe(Constants::BROADCAST_TOPIC, [this](const json &message) {
            if (message.value("kind", "") != "STATE_CHANGED") {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(message.value("pid", "") + ":" + message["payload"].value("to", ""));
        });
    }

    ~BroadcastRecorder() {
        broker_->unsubscribe(subscription_);
    }

    BroadcastRecorder(const BroadcastRecorder &) = delete;
    BroadcastRecorder &operator=(const BroadcastRecorder &) = delete;

    std::vector<std::string> labelsFor(const std::string &pid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> labels;
        for (const auto &event : events_) {
            if (event.rfind(pid + ":", 0) == 0) {
                labels.push_back(event.substr(pid.size() + 1));
            }
        }
        return labels;
    }

private:
    std::shared_ptr<IBroker> broker_;
    SubscriptionId subscription_ = 0;
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/**
 * @brief Fixture base: manual scheduler, in-memory broker and checkpoint store
 */
class ProcessTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        TypeRegistry::getInstance().clear();
        ProcessRegistry::getInstance().clear();
        registerTestProcessTypes();

        scheduler = std::make_shared<TaskSchedulerImpl>(SchedulerMode::MANUAL);
        broker = std::make_shared<InMemoryBroker>();
        store = std::make_shared<InMemoryCheckpointStore>();
        persister = std::make_shared<Persister>(store);

        context.scheduler = scheduler;
        context.broker = broker;
        context.persister = persister;
    }

    void TearDown() override {
        scheduler->stop();
        ProcessRegistry::getInstance().clear();
        TypeRegistry::getInstance().clear();
    }

    std::shared_ptr<TaskSchedulerImpl> scheduler;
    std::shared_ptr<InMemoryBroker> broker;
    std::shared_ptr<InMemoryCheckpointStore> store;
    std::shared_ptr<Persister> persister;
    ProcessContext context;
};

}  // namespace Test
}  // namespace RPE
