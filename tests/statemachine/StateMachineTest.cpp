#include "common/Exceptions.h"
#include "statemachine/StateMachine.h"
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace RPE {

namespace {

TransitionTable trafficTable() {
    TransitionTable table;
    table.allow("green", {"yellow"}).allow("yellow", {"red"}).allow("red", {"green", "off"}).terminal("off");
    return table;
}

class ThrowingState : public State {
public:
    explicit ThrowingState(std::string label) : State(std::move(label)) {}

    void enter() override {
        throw std::runtime_error("enter failed for " + label());
    }
};

class RecordingMachine : public StateMachine {
public:
    RecordingMachine() : StateMachine(trafficTable(), "green") {}

    std::vector<std::string> events;
    std::set<std::string> throwingLabels;

protected:
    std::unique_ptr<State> createState(const std::string &label) override {
        if (throwingLabels.count(label)) {
            return std::make_unique<ThrowingState>(label);
        }
        return StateMachine::createState(label);
    }

    void onExiting(const State &current) override {
        events.push_back("exit:" + current.label());
    }

    void onEntering(const State &next) override {
        events.push_back("entering:" + next.label());
    }

    void onEntered(const std::string &from) override {
        events.push_back("entered:" + currentLabel() + "<-" + from);
    }
};

// Routes every failed transition to "red"
class SelfHealingMachine : public RecordingMachine {
public:
    int failures = 0;

protected:
    void transitionFailed(const std::string &from, const std::string &to, std::exception_ptr error) override {
        (void)from;
        (void)to;
        (void)error;
        failures++;
        transitionTo("red");
    }
};

}  // namespace

class StateMachineTest : public ::testing::Test {
protected:
    RecordingMachine machine;
};

TEST_F(StateMachineTest, InitializeEntersInitialState) {
    EXPECT_FALSE(machine.isInitialized());
    machine.initialize();

    EXPECT_TRUE(machine.isInitialized());
    EXPECT_EQ("green", machine.currentLabel());
    EXPECT_EQ(std::vector<std::string>({"green"}), machine.history());
    EXPECT_EQ(std::vector<std::string>({"entering:green", "entered:green<-"}), machine.events);
    EXPECT_EQ(&machine, machine.currentState()->owner());
}

TEST_F(StateMachineTest, InitializeTwiceThrows) {
    machine.initialize();
    EXPECT_THROW(machine.initialize(), TransitionError);
    EXPECT_EQ("green", machine.currentLabel());
}

TEST_F(StateMachineTest, TransitionRunsHooksInOrder) {
    machine.initialize();
    machine.events.clear();

    machine.transitionTo("yellow");

    EXPECT_EQ("yellow", machine.currentLabel());
    EXPECT_EQ(std::vector<std::string>({"exit:green", "entering:yellow", "entered:yellow<-green"}), machine.events);
    EXPECT_EQ(std::vector<std::string>({"green", "yellow"}), machine.history());
    EXPECT_FALSE(machine.hasFailed());
}

TEST_F(StateMachineTest, DisallowedTransitionLeavesStateUnchanged) {
    machine.initialize();
    machine.events.clear();

    try {
        machine.transitionTo("red");
        FAIL() << "Expected TransitionError";
    } catch (const TransitionError &e) {
        EXPECT_EQ("green", e.from());
        EXPECT_EQ("red", e.to());
    }

    EXPECT_EQ("green", machine.currentLabel());
    EXPECT_TRUE(machine.events.empty());
    EXPECT_TRUE(machine.hasFailed());
    EXPECT_NE(std::string::npos, machine.failureMessage().find("not an allowed transition"));
}

TEST_F(StateMachineTest, TransitionBeforeInitializeThrows) {
    EXPECT_THROW(machine.transitionTo("yellow"), TransitionError);
    EXPECT_FALSE(machine.isInitialized());
}

TEST_F(StateMachineTest, TerminalStateRejectsTransitions) {
    machine.initialize();
    machine.transitionTo("yellow");
    machine.transitionTo("red");
    machine.transitionTo("off");
    ASSERT_TRUE(machine.isTerminal());
    EXPECT_TRUE(machine.currentState()->isTerminal());

    EXPECT_THROW(machine.transitionTo("green"), TransitionError);
    EXPECT_EQ("off", machine.currentLabel());
}

TEST_F(StateMachineTest, NullStateIsRejected) {
    machine.initialize();
    EXPECT_THROW(machine.transitionTo(std::unique_ptr<State>()), TransitionError);
    EXPECT_EQ("green", machine.currentLabel());
}

TEST_F(StateMachineTest, ReentrantTransitionIsRejected) {
    machine.initialize();

    bool rejected = false;
    machine.addTransitionCallback([this, &rejected](StateMachine::TransitionEvent event, const std::string &,
                                                    const std::string &to) {
        if (event == StateMachine::TransitionEvent::ENTERED && to == "yellow") {
            EXPECT_TRUE(machine.isTransitioning());
            try {
                machine.transitionTo("red");
            } catch (const TransitionError &) {
                rejected = true;
            }
        }
    });

    machine.transitionTo("yellow");
    EXPECT_TRUE(rejected);
    EXPECT_EQ("yellow", machine.currentLabel());
    EXPECT_FALSE(machine.isTransitioning());
}

TEST_F(StateMachineTest, ThrowingEnterHookKeepsPreviousState) {
    machine.initialize();
    machine.throwingLabels.insert("yellow");

    EXPECT_THROW(machine.transitionTo("yellow"), std::runtime_error);
    EXPECT_EQ("green", machine.currentLabel());
    EXPECT_TRUE(machine.hasFailed());
    EXPECT_EQ("enter failed for yellow", machine.failureMessage());
    EXPECT_FALSE(machine.isTransitioning());
}

TEST_F(StateMachineTest, CallbacksCanBeRemoved) {
    machine.initialize();

    std::vector<StateMachine::TransitionEvent> seen;
    int id = machine.addTransitionCallback(
        [&seen](StateMachine::TransitionEvent event, const std::string &, const std::string &) {
            seen.push_back(event);
        });

    machine.transitionTo("yellow");
    EXPECT_EQ(std::vector<StateMachine::TransitionEvent>({StateMachine::TransitionEvent::EXITING,
                                                          StateMachine::TransitionEvent::ENTERING,
                                                          StateMachine::TransitionEvent::ENTERED}),
              seen);

    EXPECT_TRUE(machine.removeTransitionCallback(id));
    EXPECT_FALSE(machine.removeTransitionCallback(id));
    machine.transitionTo("red");
    EXPECT_EQ(3u, seen.size());
}

TEST(StateMachineFailureHookTest, TransitionFailedCanRecover) {
    SelfHealingMachine machine;
    machine.initialize();
    machine.transitionTo("yellow");

    // yellow -> green is not an edge, the hook moves on to red instead
    EXPECT_NO_THROW(machine.transitionTo("green"));

    EXPECT_EQ(1, machine.failures);
    EXPECT_EQ("red", machine.currentLabel());
}

TEST(TransitionTableTest, TargetsBecomeKnownLabels) {
    TransitionTable table = trafficTable();

    EXPECT_TRUE(table.hasLabel("off"));
    EXPECT_TRUE(table.isTerminal("off"));
    EXPECT_FALSE(table.isTerminal("red"));
    EXPECT_FALSE(table.isTerminal("unknown"));
    EXPECT_TRUE(table.isAllowed("red", "off"));
    EXPECT_FALSE(table.isAllowed("off", "red"));
    EXPECT_EQ(std::set<std::string>({"green", "off"}), table.allowedTargets("red"));
    EXPECT_EQ(std::vector<std::string>({"green", "off", "red", "yellow"}), table.labels());
}

}  // namespace RPE
