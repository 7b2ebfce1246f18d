#include "common/Exceptions.h"
#include "persistence/FileCheckpointStore.h"
#include "persistence/InMemoryCheckpointStore.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <type_traits>
#include <unistd.h>

namespace RPE {

namespace {

Bundle makeBundle(const std::string &pid, const std::string &label = "WAITING", int marker = 0) {
    return Bundle::fromJson(json{{"version", 1},
                                 {"type_id", "test.waiting"},
                                 {"pid", pid},
                                 {"label", label},
                                 {"inputs", {{"marker", marker}}},
                                 {"outputs", json::object()},
                                 {"continuation", {{"next", "after_wait"}}},
                                 {"paused", false},
                                 {"paused_message", ""},
                                 {"state", {{"message", "waiting for resume"}}},
                                 {"creation_time", 1700000000000}});
}

std::filesystem::path uniqueTempDirectory() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("rpe_checkpoints_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
            std::to_string(counter++));
}

}  // namespace

template <typename T> class CheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        if constexpr (std::is_same_v<T, FileCheckpointStore>) {
            directory_ = uniqueTempDirectory();
            store_ = std::make_unique<FileCheckpointStore>(directory_);
        } else {
            store_ = std::make_unique<T>();
        }
    }

    void TearDown() override {
        store_.reset();
        if (!directory_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(directory_, ec);
        }
    }

    std::unique_ptr<ICheckpointStore> store_;
    std::filesystem::path directory_;
};

using StoreTypes = ::testing::Types<InMemoryCheckpointStore, FileCheckpointStore>;
TYPED_TEST_SUITE(CheckpointStoreTest, StoreTypes);

TYPED_TEST(CheckpointStoreTest, SaveAndLoadLatest) {
    this->store_->saveCheckpoint(makeBundle("alpha"));

    auto loaded = this->store_->loadCheckpoint("alpha");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(makeBundle("alpha"), *loaded);
    EXPECT_FALSE(this->store_->loadCheckpoint("beta").has_value());
}

TYPED_TEST(CheckpointStoreTest, SavingAgainReplacesCheckpoint) {
    this->store_->saveCheckpoint(makeBundle("alpha", "RUNNING", 1));
    this->store_->saveCheckpoint(makeBundle("alpha", "WAITING", 2));

    auto loaded = this->store_->loadCheckpoint("alpha");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ("WAITING", loaded->label());
    EXPECT_EQ(2, loaded->inputs()["marker"]);
    EXPECT_EQ(1u, this->store_->getCheckpoints().size());
}

TYPED_TEST(CheckpointStoreTest, TagsAreIndependentOfLatest) {
    this->store_->saveCheckpoint(makeBundle("alpha", "RUNNING", 1), "before-upgrade");
    this->store_->saveCheckpoint(makeBundle("alpha", "WAITING", 2));

    auto tagged = this->store_->loadCheckpoint("alpha", "before-upgrade");
    ASSERT_TRUE(tagged.has_value());
    EXPECT_EQ("RUNNING", tagged->label());
    EXPECT_EQ("WAITING", this->store_->loadCheckpoint("alpha")->label());
    EXPECT_FALSE(this->store_->loadCheckpoint("alpha", "other").has_value());
}

TYPED_TEST(CheckpointStoreTest, ListingIsSortedByPidThenTag) {
    this->store_->saveCheckpoint(makeBundle("gamma"));
    this->store_->saveCheckpoint(makeBundle("alpha"), "v2");
    this->store_->saveCheckpoint(makeBundle("beta"));
    this->store_->saveCheckpoint(makeBundle("alpha"));

    std::vector<CheckpointKey> expected = {{"alpha", ""}, {"alpha", "v2"}, {"beta", ""}, {"gamma", ""}};
    EXPECT_EQ(expected, this->store_->getCheckpoints());

    std::vector<CheckpointKey> alphaOnly = {{"alpha", ""}, {"alpha", "v2"}};
    EXPECT_EQ(alphaOnly, this->store_->getProcessCheckpoints("alpha"));
    EXPECT_TRUE(this->store_->getProcessCheckpoints("delta").empty());
}

TYPED_TEST(CheckpointStoreTest, DeleteSingleAndAllOfAProcess) {
    this->store_->saveCheckpoint(makeBundle("alpha"));
    this->store_->saveCheckpoint(makeBundle("alpha"), "t1");
    this->store_->saveCheckpoint(makeBundle("alpha"), "t2");
    this->store_->saveCheckpoint(makeBundle("beta"));

    EXPECT_TRUE(this->store_->deleteCheckpoint("alpha", "t1"));
    EXPECT_FALSE(this->store_->deleteCheckpoint("alpha", "t1"));
    EXPECT_FALSE(this->store_->loadCheckpoint("alpha", "t1").has_value());

    EXPECT_EQ(2u, this->store_->deleteProcessCheckpoints("alpha"));
    EXPECT_EQ(0u, this->store_->deleteProcessCheckpoints("alpha"));

    std::vector<CheckpointKey> remaining = {{"beta", ""}};
    EXPECT_EQ(remaining, this->store_->getCheckpoints());
}

class FileCheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = uniqueTempDirectory();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    std::filesystem::path directory_;
};

TEST_F(FileCheckpointStoreTest, CreatesDirectoryAndWritesOneFilePerCheckpoint) {
    FileCheckpointStore store(directory_ / "nested");
    store.saveCheckpoint(makeBundle("alpha"));
    store.saveCheckpoint(makeBundle("alpha"), "manual");

    EXPECT_TRUE(std::filesystem::exists(directory_ / "nested" / "alpha.json"));
    EXPECT_TRUE(std::filesystem::exists(directory_ / "nested" / "alpha.manual.json"));
    EXPECT_FALSE(std::filesystem::exists(directory_ / "nested" / "alpha.json.tmp"));
}

TEST_F(FileCheckpointStoreTest, CheckpointsSurviveStoreInstances) {
    {
        FileCheckpointStore writer(directory_);
        writer.saveCheckpoint(makeBundle("alpha", "WAITING", 9));
    }

    FileCheckpointStore reader(directory_);
    auto loaded = reader.loadCheckpoint("alpha");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(9, loaded->inputs()["marker"]);
}

TEST_F(FileCheckpointStoreTest, RejectsUnsafeFileNames) {
    FileCheckpointStore store(directory_);
    EXPECT_THROW(store.saveCheckpoint(makeBundle("has.dot")), SerializationError);
    EXPECT_THROW(store.saveCheckpoint(makeBundle("../escape")), SerializationError);
    EXPECT_THROW(store.saveCheckpoint(makeBundle("alpha"), "nested/tag"), SerializationError);
    EXPECT_TRUE(store.getCheckpoints().empty());
}

TEST_F(FileCheckpointStoreTest, CorruptedFileFailsReconstruction) {
    FileCheckpointStore store(directory_);
    {
        std::ofstream file(directory_ / "alpha.json");
        file << "{\"pid\": \"alpha\", ";
    }
    EXPECT_THROW(store.loadCheckpoint("alpha"), ReconstructionError);
}

TEST_F(FileCheckpointStoreTest, InvalidBundleFileFailsReconstruction) {
    FileCheckpointStore store(directory_);
    {
        std::ofstream file(directory_ / "alpha.json");
        file << R"({"pid": "alpha", "label": "WAITING"})";
    }
    EXPECT_THROW(store.loadCheckpoint("alpha"), ReconstructionError);
}

TEST_F(FileCheckpointStoreTest, IgnoresForeignFiles) {
    FileCheckpointStore store(directory_);
    store.saveCheckpoint(makeBundle("alpha"));
    {
        std::ofstream notes(directory_ / "README.txt");
        notes << "not a checkpoint";
        std::ofstream partial(directory_ / "beta.json.tmp");
        partial << "{";
    }
    std::filesystem::create_directory(directory_ / "archive.json");

    std::vector<CheckpointKey> expected = {{"alpha", ""}};
    EXPECT_EQ(expected, store.getCheckpoints());
}

}  // namespace RPE
