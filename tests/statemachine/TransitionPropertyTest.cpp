#include "common/Exceptions.h"
#include "statemachine/StateMachine.h"
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace RPE {

// Random tables, random attempts: the machine moves exactly along allowed edges
TEST(TransitionPropertyTest, RandomTablesHonorEdgesAndTerminals) {
    std::mt19937 rng(20250101);
    const std::vector<std::string> labels = {"s0", "s1", "s2", "s3", "s4", "s5"};

    for (int trial = 0; trial < 200; ++trial) {
        TransitionTable table;
        for (const auto &label : labels) {
            std::set<std::string> targets;
            for (const auto &target : labels) {
                if (rng() % 3 == 0) {
                    targets.insert(target);
                }
            }
            if (targets.empty()) {
                table.terminal(label);
            } else {
                table.allow(label, targets);
            }
        }

        StateMachine machine(table, "s0");
        machine.initialize();
        size_t expectedHistory = 1;

        for (int attempt = 0; attempt < 30; ++attempt) {
            const std::string from = machine.currentLabel();
            const std::string to = labels[rng() % labels.size()];
            const bool allowed = !table.isTerminal(from) && table.isAllowed(from, to);

            bool threw = false;
            try {
                machine.transitionTo(to);
            } catch (const TransitionError &) {
                threw = true;
            }

            if (allowed) {
                EXPECT_FALSE(threw) << from << " -> " << to;
                EXPECT_EQ(to, machine.currentLabel());
                expectedHistory++;
            } else {
                EXPECT_TRUE(threw) << from << " -> " << to;
                EXPECT_EQ(from, machine.currentLabel());
            }
            EXPECT_EQ(table.isTerminal(machine.currentLabel()), machine.isTerminal());
            EXPECT_FALSE(machine.isTransitioning());
        }

        EXPECT_EQ(expectedHistory, machine.history().size());
    }
}

}  // namespace RPE
