#include <gtest/gtest.h>
#include "../core/adapters/JsonFileSubmissionStore.hpp"
#include "../core/OracleError.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace rainoracle;
namespace fs = std::filesystem;

namespace {

SubmissionRecord makeRecord(const std::string& policyId, SubmissionStatus status) {
    SubmissionRecord record;
    record.policyId = policyId;
    record.idempotencyKey = makeIdempotencyKey(policyId, DecisionKind::Matured);
    record.decision.kind = DecisionKind::Matured;
    record.decision.eventOccurred = false;
    record.decision.evidence.cumulative = 42;
    record.decision.evidence.threshold = 500;
    record.decision.evidence.buckets = {{472222, 40}, {472223, 2}};
    record.status = status;
    record.retryCount = 2;
    record.createdAt = 1700000000;
    record.nextAttemptAt = 1700000060;
    record.lastError = "mock chain timeout";
    return record;
}

RainfallCheckpoint makeCheckpoint(const std::string& policyId) {
    RainfallCheckpoint checkpoint;
    checkpoint.policyId = policyId;
    checkpoint.bucketDurationSeconds = 3600;
    checkpoint.fetchedThrough = 472222 * 3600 + 30 * 3600;
    checkpoint.windowStartIndex = 472222;
    checkpoint.lastBucketIndex = 472223;
    checkpoint.prunedBelow = 472222;
    checkpoint.buckets = {{472222, 40}, {472223, 360}};
    checkpoint.mergedTimestamps = {472222 * 3600 + 60, 472223 * 3600 + 60};
    checkpoint.historyGapEnd = 472222 * 3600 + 3600;
    return checkpoint;
}

} // namespace

class JsonFileSubmissionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("rainoracle-store-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        path_ = (dir_ / "state" / "submissions.json").string();
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(JsonFileSubmissionStoreTest, MissingFileStartsEmpty) {
    adapters::JsonFileSubmissionStore store(path_);
    EXPECT_TRUE(store.loadAll().empty());
    EXPECT_TRUE(store.chainGenesis().empty());
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(JsonFileSubmissionStoreTest, RecordsSurviveReopen) {
    {
        adapters::JsonFileSubmissionStore store(path_);
        store.setChainGenesis("0xgenesis-a");
        store.save(makeRecord("7", SubmissionStatus::Pending));
        store.save(makeRecord("8", SubmissionStatus::Confirmed));
    }

    adapters::JsonFileSubmissionStore reopened(path_);
    EXPECT_EQ(reopened.chainGenesis(), "0xgenesis-a");
    ASSERT_EQ(reopened.loadAll().size(), 2u);

    auto record = reopened.load("7:matured");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, SubmissionStatus::Pending);
    EXPECT_EQ(record->retryCount, 2);
    EXPECT_EQ(record->nextAttemptAt, 1700000060);
    EXPECT_EQ(record->decision.kind, DecisionKind::Matured);
    ASSERT_EQ(record->decision.evidence.buckets.size(), 2u);
    EXPECT_EQ(record->decision.evidence.buckets[1].value, 2);
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
}

TEST_F(JsonFileSubmissionStoreTest, EraseAndClearPersist) {
    {
        adapters::JsonFileSubmissionStore store(path_);
        store.save(makeRecord("7", SubmissionStatus::Pending));
        store.save(makeRecord("8", SubmissionStatus::Pending));
        store.erase("7:matured");
    }
    {
        adapters::JsonFileSubmissionStore store(path_);
        EXPECT_FALSE(store.load("7:matured").has_value());
        EXPECT_TRUE(store.load("8:matured").has_value());
        store.clear();
    }
    adapters::JsonFileSubmissionStore store(path_);
    EXPECT_TRUE(store.loadAll().empty());
}

TEST_F(JsonFileSubmissionStoreTest, CorruptFileIsFatal) {
    fs::create_directories(fs::path(path_).parent_path());
    std::ofstream(path_) << "{\"records\": [ {\"policyId\": ";

    try {
        adapters::JsonFileSubmissionStore store(path_);
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isFatal());
    }
}

TEST_F(JsonFileSubmissionStoreTest, UnknownFormatVersionIsFatal) {
    fs::create_directories(fs::path(path_).parent_path());
    std::ofstream(path_) << R"({"formatVersion": 99, "records": []})";

    EXPECT_THROW(adapters::JsonFileSubmissionStore store(path_), OracleError);
}

TEST_F(JsonFileSubmissionStoreTest, CheckpointsSurviveReopenAndClear) {
    {
        adapters::JsonFileSubmissionStore store(path_);
        store.saveCheckpoint(makeCheckpoint("7"));
        store.saveCheckpoint(makeCheckpoint("8"));
        store.eraseCheckpoint("8");
    }
    {
        adapters::JsonFileSubmissionStore store(path_);
        auto checkpoint = store.loadCheckpoint("7");
        ASSERT_TRUE(checkpoint.has_value());
        EXPECT_EQ(checkpoint->fetchedThrough, 472222 * 3600 + 30 * 3600);
        EXPECT_EQ(checkpoint->lastBucketIndex.value(), 472223);
        ASSERT_EQ(checkpoint->buckets.size(), 2u);
        EXPECT_EQ(checkpoint->buckets[1].value, 360);
        EXPECT_EQ(checkpoint->mergedTimestamps.size(), 2u);
        EXPECT_EQ(checkpoint->historyGapEnd.value(), 472222 * 3600 + 3600);
        EXPECT_FALSE(store.loadCheckpoint("8").has_value());
        store.clear();
    }
    adapters::JsonFileSubmissionStore store(path_);
    EXPECT_FALSE(store.loadCheckpoint("7").has_value());
}

TEST_F(JsonFileSubmissionStoreTest, FailedWriteLeavesMemoryMatchingDisk) {
    adapters::JsonFileSubmissionStore store(path_);
    store.setChainGenesis("0xgenesis-a");
    store.save(makeRecord("7", SubmissionStatus::Pending));
    store.saveCheckpoint(makeCheckpoint("7"));

    // A directory where the temp file goes makes every rewrite fail
    fs::create_directories(path_ + ".tmp");

    EXPECT_THROW(store.erase("7:matured"), OracleError);
    EXPECT_TRUE(store.load("7:matured").has_value());

    EXPECT_THROW(store.clear(), OracleError);
    EXPECT_EQ(store.loadAll().size(), 1u);
    EXPECT_TRUE(store.loadCheckpoint("7").has_value());

    EXPECT_THROW(store.eraseCheckpoint("7"), OracleError);
    EXPECT_TRUE(store.loadCheckpoint("7").has_value());

    EXPECT_THROW(store.setChainGenesis("0xgenesis-b"), OracleError);
    EXPECT_EQ(store.chainGenesis(), "0xgenesis-a");

    EXPECT_THROW(store.save(makeRecord("8", SubmissionStatus::Pending)), OracleError);
    EXPECT_FALSE(store.load("8:matured").has_value());

    fs::remove_all(path_ + ".tmp");
    adapters::JsonFileSubmissionStore reopened(path_);
    EXPECT_EQ(reopened.chainGenesis(), "0xgenesis-a");
    EXPECT_EQ(reopened.loadAll().size(), 1u);
    EXPECT_TRUE(reopened.loadCheckpoint("7").has_value());
}

TEST_F(JsonFileSubmissionStoreTest, ConcurrentSavesAreAllPersisted) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    {
        adapters::JsonFileSubmissionStore store(path_);
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&store, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    const std::string policyId = std::to_string(t * 1000 + i);
                    store.save(makeRecord(policyId, SubmissionStatus::Pending));
                    store.saveCheckpoint(makeCheckpoint(policyId));
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        EXPECT_EQ(store.loadAll().size(), static_cast<std::size_t>(kThreads * kPerThread));
        EXPECT_LE(store.writeCount(), static_cast<uint64_t>(2 * kThreads * kPerThread));
    }

    adapters::JsonFileSubmissionStore reopened(path_);
    EXPECT_EQ(reopened.loadAll().size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_TRUE(reopened.loadCheckpoint("7024").has_value());
    EXPECT_TRUE(reopened.load("3017:matured").has_value());
}
