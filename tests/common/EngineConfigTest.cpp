#include "common/EngineConfig.h"
#include "common/Exceptions.h"
#include "persistence/FileCheckpointStore.h"
#include "persistence/InMemoryCheckpointStore.h"
#include "persistence/Persister.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace RPE {

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        if (!tempFile_.empty()) {
            std::error_code ec;
            std::filesystem::remove(tempFile_, ec);
        }
    }

    static void clearEnvironment() {
        for (const char *name : {"RPE_RPC_TIMEOUT_MS", "RPE_BROADCAST_TIMEOUT_MS", "RPE_CHECKPOINT_DIR", "RPE_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }

    std::string writeTempFile(const std::string &content) {
        tempFile_ = std::filesystem::temp_directory_path() /
                    ("rpe_config_" + std::to_string(::getpid()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        std::ofstream file(tempFile_);
        file << content;
        return tempFile_.string();
    }

    std::filesystem::path tempFile_;
};

TEST_F(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(Constants::DEFAULT_RPC_TIMEOUT, config.rpcTimeout);
    EXPECT_EQ(Constants::DEFAULT_BROADCAST_TIMEOUT, config.broadcastTimeout);
    EXPECT_TRUE(config.checkpointDirectory.empty());
    EXPECT_EQ("info", config.logLevel);
    EXPECT_FALSE(config.logToFile);
}

TEST_F(EngineConfigTest, MergeOverlaysOnlyGivenKeys) {
    EngineConfig config;
    config.merge({{"rpc_timeout_ms", 250}, {"log_level", "debug"}, {"unknown_key", 1}});

    EXPECT_EQ(std::chrono::milliseconds(250), config.rpcTimeout);
    EXPECT_EQ(Constants::DEFAULT_BROADCAST_TIMEOUT, config.broadcastTimeout);
    EXPECT_EQ("debug", config.logLevel);

    config.merge({{"checkpoint_directory", "/tmp/rpe"}, {"log_to_file", true}});
    EXPECT_EQ(std::chrono::milliseconds(250), config.rpcTimeout);
    EXPECT_EQ("/tmp/rpe", config.checkpointDirectory);
    EXPECT_TRUE(config.logToFile);
}

TEST_F(EngineConfigTest, MergeRejectsWrongTypes) {
    EngineConfig config;
    EXPECT_THROW(config.merge(json::array()), ValidationError);
    EXPECT_THROW(config.merge({{"rpc_timeout_ms", "fast"}}), ValidationError);
    EXPECT_THROW(config.merge({{"broadcast_timeout_ms", -1}}), ValidationError);
    EXPECT_THROW(config.merge({{"checkpoint_directory", 3}}), ValidationError);
    EXPECT_THROW(config.merge({{"log_to_file", "yes"}}), ValidationError);
}

TEST_F(EngineConfigTest, JsonRoundTrip) {
    EngineConfig config;
    config.rpcTimeout = std::chrono::milliseconds(1234);
    config.checkpointDirectory = "/var/lib/rpe";
    config.logLevel = "warn";

    EngineConfig copy = EngineConfig::fromJson(config.toJson());
    EXPECT_EQ(config.toJson(), copy.toJson());
}

TEST_F(EngineConfigTest, EnvironmentOverridesDocument) {
    EngineConfig config = EngineConfig::fromJson({{"rpc_timeout_ms", 100}, {"log_level", "info"}});

    ::setenv("RPE_RPC_TIMEOUT_MS", "750", 1);
    ::setenv("RPE_CHECKPOINT_DIR", "/srv/checkpoints", 1);
    ::setenv("RPE_LOG_LEVEL", "trace", 1);
    config.applyEnvironment();

    EXPECT_EQ(std::chrono::milliseconds(750), config.rpcTimeout);
    EXPECT_EQ(Constants::DEFAULT_BROADCAST_TIMEOUT, config.broadcastTimeout);
    EXPECT_EQ("/srv/checkpoints", config.checkpointDirectory);
    EXPECT_EQ("trace", config.logLevel);
}

TEST_F(EngineConfigTest, InvalidEnvironmentTimeoutIsRejected) {
    EngineConfig config;
    ::setenv("RPE_BROADCAST_TIMEOUT_MS", "10ms", 1);
    EXPECT_THROW(config.applyEnvironment(), ValidationError);

    ::setenv("RPE_BROADCAST_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW(config.applyEnvironment(), ValidationError);

    ::setenv("RPE_BROADCAST_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(config.applyEnvironment(), ValidationError);
}

TEST_F(EngineConfigTest, LoadFromFile) {
    std::string path = writeTempFile(R"({"rpc_timeout_ms": 42, "log_directory": "/tmp/rpe-logs"})");

    EngineConfig config = EngineConfig::loadFromFile(path);
    EXPECT_EQ(std::chrono::milliseconds(42), config.rpcTimeout);
    EXPECT_EQ("/tmp/rpe-logs", config.logDirectory);
}

TEST_F(EngineConfigTest, LoadFromBrokenOrMissingFile) {
    EXPECT_THROW(EngineConfig::loadFromFile("/nonexistent/rpe/config.json"), ValidationError);

    std::string path = writeTempFile("{\"rpc_timeout_ms\": ");
    EXPECT_THROW(EngineConfig::loadFromFile(path), ValidationError);
}

TEST_F(EngineConfigTest, PersisterFollowsCheckpointDirectory) {
    EngineConfig config;
    auto inMemory = Persister::fromConfig(config);
    EXPECT_TRUE(std::dynamic_pointer_cast<InMemoryCheckpointStore>(inMemory->store()));

    auto directory = std::filesystem::temp_directory_path() / ("rpe_config_store_" + std::to_string(::getpid()));
    config.checkpointDirectory = directory.string();
    auto onDisk = Persister::fromConfig(config);
    auto fileStore = std::dynamic_pointer_cast<FileCheckpointStore>(onDisk->store());
    ASSERT_TRUE(fileStore);
    EXPECT_EQ(directory, fileStore->directory());

    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
}

}  // namespace RPE
