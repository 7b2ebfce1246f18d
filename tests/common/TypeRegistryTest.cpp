#include "common/TestUtils.h"
#include "common/TypeRegistry.h"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <typeindex>
#include <vector>

namespace RPE {

class TypeRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Clear registry before each test
        TypeRegistry::getInstance().clear();
    }

    void TearDown() override {
        TypeRegistry::getInstance().clear();
    }
};

TEST_F(TypeRegistryTest, BasicRegistration) {
    TypeRegistry &registry = TypeRegistry::getInstance();

    EXPECT_TRUE(registry.registerProcessType<RPE::Test::DoublerProcess>("test.doubler"));
    EXPECT_TRUE(registry.isRegisteredType("test.doubler"));
    EXPECT_TRUE(registry.resolve("test.doubler").has_value());
    EXPECT_EQ("test.doubler", registry.findTypeId(std::type_index(typeid(RPE::Test::DoublerProcess))));
}

TEST_F(TypeRegistryTest, DuplicateAndInvalidRegistrationsFail) {
    TypeRegistry &registry = TypeRegistry::getInstance();

    EXPECT_TRUE(registry.registerProcessType<RPE::Test::DoublerProcess>("test.doubler"));
    EXPECT_FALSE(registry.registerProcessType<RPE::Test::WaitingProcess>("test.doubler"));
    EXPECT_FALSE(registry.registerType("", [](const ProcessContext &, const json &, const std::string &) {
        return std::shared_ptr<Process>();
    }));
    EXPECT_FALSE(registry.registerType("test.null", nullptr));
    EXPECT_EQ(std::vector<std::string>({"test.doubler"}), registry.getRegisteredTypes());
}

TEST_F(TypeRegistryTest, UnknownTypes) {
    TypeRegistry &registry = TypeRegistry::getInstance();

    EXPECT_FALSE(registry.isRegisteredType("missing"));
    EXPECT_FALSE(registry.resolve("missing").has_value());
    EXPECT_EQ("", registry.findTypeId(std::type_index(typeid(RPE::Test::WaitingProcess))));
    EXPECT_THROW(registry.validate("missing", json::object()), ValidationError);
}

TEST_F(TypeRegistryTest, ValidatorRunsOnValidate) {
    TypeRegistry &registry = TypeRegistry::getInstance();
    registry.registerProcessType<RPE::Test::DoublerProcess>("test.doubler", RPE::Test::DoublerProcess::validate);
    registry.registerProcessType<RPE::Test::WaitingProcess>("test.waiting");

    EXPECT_EQ(json({{"x", 3}}), registry.validate("test.doubler", {{"x", 3}}));
    EXPECT_THROW(registry.validate("test.doubler", {{"x", "three"}}), ValidationError);
    EXPECT_THROW(registry.validate("test.waiting", json::array()), ValidationError);
    EXPECT_EQ(json({{"anything", true}}), registry.validate("test.waiting", {{"anything", true}}));
}

TEST_F(TypeRegistryTest, UnregisterRemovesReverseLookup) {
    TypeRegistry &registry = TypeRegistry::getInstance();
    registry.registerProcessType<RPE::Test::DoublerProcess>("test.doubler");

    EXPECT_TRUE(registry.unregisterType("test.doubler"));
    EXPECT_FALSE(registry.unregisterType("test.doubler"));
    EXPECT_FALSE(registry.isRegisteredType("test.doubler"));
    EXPECT_EQ("", registry.findTypeId(std::type_index(typeid(RPE::Test::DoublerProcess))));
}

TEST_F(TypeRegistryTest, FactoryBuildsUninitializedProcess) {
    TypeRegistry &registry = TypeRegistry::getInstance();
    registry.registerProcessType<RPE::Test::DoublerProcess>("test.doubler");

    ProcessContext context;
    context.scheduler = std::make_shared<TaskSchedulerImpl>(SchedulerMode::MANUAL);

    auto factory = registry.resolve("test.doubler");
    ASSERT_TRUE(factory.has_value());
    auto process = (*factory)(context, json{{"x", 1}}, "factory-made");
    ASSERT_TRUE(process);
    EXPECT_EQ("factory-made", process->pid());
    EXPECT_FALSE(process->isInitialized());
    EXPECT_TRUE(std::dynamic_pointer_cast<RPE::Test::DoublerProcess>(process));
}

TEST_F(TypeRegistryTest, ConcurrentRegistration) {
    TypeRegistry &registry = TypeRegistry::getInstance();
    constexpr int NUM_THREADS = 8;
    constexpr int REGISTRATIONS_PER_THREAD = 50;

    std::vector<std::thread> threads;
    std::atomic<int> successCount{0};

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&registry, &successCount, i]() {
            for (int j = 0; j < REGISTRATIONS_PER_THREAD; ++j) {
                std::string typeId = "thread" + std::to_string(i) + ".type" + std::to_string(j);
                if (registry.registerProcessType<RPE::Test::WaitingProcess>(typeId)) {
                    successCount++;
                }
                registry.isRegisteredType(typeId);
            }
        });
    }

    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(NUM_THREADS * REGISTRATIONS_PER_THREAD, successCount.load());
    EXPECT_EQ(static_cast<size_t>(NUM_THREADS * REGISTRATIONS_PER_THREAD), registry.getRegisteredTypes().size());
}

}  // namespace RPE
