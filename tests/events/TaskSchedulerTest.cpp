#include "common/TestUtils.h"
#include "events/TaskSchedulerImpl.h"
#include "mocks/CapturingLoggerBackend.h"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace RPE {

class TaskSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler = std::make_shared<TaskSchedulerImpl>(SchedulerMode::MANUAL);
    }

    std::shared_ptr<TaskSchedulerImpl> scheduler;
    std::vector<int> order;
};

TEST_F(TaskSchedulerTest, PostedTasksRunInFifoOrder) {
    for (int i = 0; i < 5; ++i) {
        scheduler->post([this, i]() { order.push_back(i); });
    }

    EXPECT_EQ(5u, scheduler->pendingTaskCount());
    EXPECT_EQ(5u, scheduler->runOnce());
    EXPECT_EQ(std::vector<int>({0, 1, 2, 3, 4}), order);
    EXPECT_EQ(0u, scheduler->pendingTaskCount());
}

TEST_F(TaskSchedulerTest, TaskPostedDuringTurnRunsOnNextTurn) {
    scheduler->post([this]() {
        order.push_back(1);
        scheduler->post([this]() { order.push_back(2); });
    });

    EXPECT_EQ(1u, scheduler->runOnce());
    EXPECT_EQ(std::vector<int>({1}), order);
    EXPECT_EQ(1u, scheduler->runOnce());
    EXPECT_EQ(std::vector<int>({1, 2}), order);
    EXPECT_EQ(0u, scheduler->runOnce());
}

TEST_F(TaskSchedulerTest, DelayedTasksFollowLogicalTime) {
    scheduler->postDelayed([this]() { order.push_back(200); }, std::chrono::milliseconds(200));
    scheduler->postDelayed([this]() { order.push_back(100); }, std::chrono::milliseconds(100));
    scheduler->post([this]() { order.push_back(0); });

    scheduler->runUntilIdle();
    EXPECT_EQ(std::vector<int>({0}), order);

    scheduler->advanceTime(std::chrono::milliseconds(150));
    scheduler->runUntilIdle();
    EXPECT_EQ(std::vector<int>({0, 100}), order);

    scheduler->advanceTime(std::chrono::milliseconds(50));
    scheduler->runUntilIdle();
    EXPECT_EQ(std::vector<int>({0, 100, 200}), order);
    EXPECT_EQ(std::chrono::milliseconds(200), scheduler->now());
}

TEST_F(TaskSchedulerTest, CancelledTaskNeverRuns) {
    TaskId id = scheduler->postDelayed([this]() { order.push_back(1); }, std::chrono::milliseconds(10));
    scheduler->post([this]() { order.push_back(2); });

    EXPECT_TRUE(scheduler->cancel(id));
    EXPECT_FALSE(scheduler->cancel(id));
    EXPECT_FALSE(scheduler->cancel(9999));
    EXPECT_EQ(1u, scheduler->pendingTaskCount());

    scheduler->advanceTime(std::chrono::milliseconds(20));
    scheduler->runUntilIdle();
    EXPECT_EQ(std::vector<int>({2}), order);
}

TEST_F(TaskSchedulerTest, TaskCanCancelLaterTaskOfSameTurn) {
    TaskId second = 0;
    scheduler->post([this, &second]() {
        order.push_back(1);
        EXPECT_TRUE(scheduler->cancel(second));
    });
    second = scheduler->post([this]() { order.push_back(2); });

    EXPECT_EQ(1u, scheduler->runOnce());
    EXPECT_EQ(std::vector<int>({1}), order);
}

TEST_F(TaskSchedulerTest, ThrowingTaskIsLoggedAndLoopContinues) {
    auto logs = RPE::Test::CapturingLoggerBackend::install();

    scheduler->post([]() { throw std::runtime_error("task failure"); });
    scheduler->post([this]() { order.push_back(1); });

    EXPECT_EQ(2u, scheduler->runOnce());
    EXPECT_EQ(std::vector<int>({1}), order);
    EXPECT_TRUE(logs->contains(LogLevel::Error, "task failure"));

    RPE::Test::CapturingLoggerBackend::uninstall();
}

TEST_F(TaskSchedulerTest, RunUntilJumpsToNextDelayedTaskInManualMode) {
    bool fired = false;
    scheduler->postDelayed([&fired]() { fired = true; }, std::chrono::seconds(30));

    EXPECT_TRUE(scheduler->runUntil([&fired]() { return fired; }, std::chrono::milliseconds(500)));
    EXPECT_EQ(std::chrono::milliseconds(30000), scheduler->now());
}

TEST_F(TaskSchedulerTest, RunUntilReturnsFalseWhenNothingCanSatisfyPredicate) {
    EXPECT_FALSE(scheduler->runUntil([]() { return false; }, std::chrono::milliseconds(50)));
}

TEST_F(TaskSchedulerTest, RunUntilIdleStopsAtTurnLimit) {
    // Reposts itself forever
    std::function<void()> spin;
    int turns = 0;
    spin = [this, &spin, &turns]() {
        turns++;
        scheduler->post(spin);
    };
    scheduler->post(spin);

    auto logs = RPE::Test::CapturingLoggerBackend::install();
    scheduler->runUntilIdle(10);
    EXPECT_EQ(10, turns);
    EXPECT_TRUE(logs->contains(LogLevel::Warn, "Still busy"));
    RPE::Test::CapturingLoggerBackend::uninstall();
}

TEST_F(TaskSchedulerTest, AdvanceTimeIsIgnoredInAutomaticMode) {
    scheduler->setMode(SchedulerMode::AUTOMATIC);
    EXPECT_EQ(SchedulerMode::AUTOMATIC, scheduler->getMode());

    auto before = scheduler->now();
    scheduler->advanceTime(std::chrono::hours(1));
    EXPECT_LT(scheduler->now() - before, std::chrono::minutes(1));
}

TEST_F(TaskSchedulerTest, ModeSwitchKeepsPendingDelays) {
    bool fired = false;
    scheduler->postDelayed([&fired]() { fired = true; }, std::chrono::milliseconds(20));

    scheduler->setMode(SchedulerMode::AUTOMATIC);
    EXPECT_TRUE(scheduler->runUntil([&fired]() { return fired; }, RPE::Test::Utils::LONG_WAIT_MS));
}

TEST(TaskSchedulerLoopTest, RunExecutesTasksPostedFromOtherThreads) {
    auto scheduler = std::make_shared<TaskSchedulerImpl>(SchedulerMode::AUTOMATIC);
    std::thread loop([scheduler]() { scheduler->run(); });

    std::atomic<int> executed{0};
    std::promise<std::thread::id> ranOn;
    auto ranOnFuture = ranOn.get_future();

    for (int i = 0; i < 10; ++i) {
        scheduler->post([&executed]() { executed++; });
    }
    scheduler->postDelayed([&ranOn]() { ranOn.set_value(std::this_thread::get_id()); }, std::chrono::milliseconds(20));

    ASSERT_EQ(std::future_status::ready, ranOnFuture.wait_for(RPE::Test::Utils::LONG_WAIT_MS));
    EXPECT_EQ(loop.get_id(), ranOnFuture.get());
    EXPECT_EQ(10, executed.load());
    EXPECT_TRUE(scheduler->isRunning());

    scheduler->stop();
    loop.join();
    EXPECT_FALSE(scheduler->isRunning());
}

}  // namespace RPE
