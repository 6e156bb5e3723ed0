/**
 * @file test_file_metrics_store.cpp
 * @brief Unit tests for the append-only metrics file
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "../test_helpers.hpp"
#include "pipemon/sink/FileMetricsStore.hpp"

using namespace PIPEMON;
using namespace PIPEMON::Sink;
using namespace TestHelpers;
using namespace std::chrono_literals;

class FileMetricsStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        path_ = "/tmp/pipemon_store_test_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".dat";
        std::remove(path_.c_str());
    }

    void TearDown() override { std::remove(path_.c_str()); }

    std::vector<LatencyMeasurement> LatencyBatch(TimePoint start, size_t count)
    {
        std::vector<LatencyMeasurement> batch;
        for (size_t i = 0; i < count; ++i) {
            batch.push_back(MakeLatency(PipelineStage::OrderExecution,
                                        start + std::chrono::seconds(i),
                                        10.0 + static_cast<double>(i)));
        }
        return batch;
    }

    long FileSize()
    {
        std::ifstream in(path_, std::ios::binary | std::ios::ate);
        return static_cast<long>(in.tellg());
    }

    std::string path_;
    TimePoint t0_ = fromUnixNs(1700000000LL * 1000000000LL);
};

TEST_F(FileMetricsStoreTest, MissingFileReadsEmpty)
{
    FileMetricsStore store(path_);
    auto result = store.QueryLatency(t0_ - 1h, t0_ + 1h);
    ASSERT_TRUE(isOk(result));
    EXPECT_TRUE(getValue(result).empty());
}

TEST_F(FileMetricsStoreTest, EmptyBatchWritesNothing)
{
    FileMetricsStore store(path_);
    EXPECT_TRUE(isOk(store.StoreLatency({})));
    EXPECT_EQ(store.framesWritten(), 0u);
}

TEST_F(FileMetricsStoreTest, StoresAndQueriesEachKind)
{
    FileMetricsStore store(path_);

    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_, 3))));
    ASSERT_TRUE(isOk(store.StoreThroughput(
        {MakeThroughput(PipelineStage::DataProcessing, t0_, 250, 1, 4)})));

    ViolationRecord violation;
    violation.timestamp = t0_;
    violation.slo_name = "order_execution_latency";
    violation.state = SLOState::Critical;
    violation.current_value = 12000.0;
    violation.target_value = 2000.0;
    ASSERT_TRUE(isOk(store.StoreViolations({violation})));
    EXPECT_EQ(store.framesWritten(), 3u);

    auto latency = store.QueryLatency(t0_ - 1min, t0_ + 1min);
    ASSERT_TRUE(isOk(latency));
    ASSERT_EQ(getValue(latency).size(), 3u);
    EXPECT_EQ(getValue(latency)[0].stage, PipelineStage::OrderExecution);
    EXPECT_DOUBLE_EQ(getValue(latency)[2].duration_ms, 12.0);

    auto throughput = store.QueryThroughput(t0_ - 1min, t0_ + 1min);
    ASSERT_TRUE(isOk(throughput));
    ASSERT_EQ(getValue(throughput).size(), 1u);
    EXPECT_EQ(getValue(throughput)[0].items_processed, 250);
    EXPECT_EQ(getValue(throughput)[0].errors, 4);

    auto violations = store.QueryViolations(t0_ - 1min, t0_ + 1min);
    ASSERT_TRUE(isOk(violations));
    ASSERT_EQ(getValue(violations).size(), 1u);
    EXPECT_EQ(getValue(violations)[0].state, SLOState::Critical);
    EXPECT_EQ(getValue(violations)[0].timestamp, t0_);
}

// Test: Queries filter records to the inclusive range
TEST_F(FileMetricsStoreTest, QueryFiltersByTime)
{
    FileMetricsStore store(path_);
    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_, 10))));
    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_ + 1h, 5))));

    auto middle = store.QueryLatency(t0_ + 2s, t0_ + 4s);
    ASSERT_TRUE(isOk(middle));
    ASSERT_EQ(getValue(middle).size(), 3u);
    EXPECT_EQ(getValue(middle).front().start_time, t0_ + 2s);
    EXPECT_EQ(getValue(middle).back().start_time, t0_ + 4s);

    auto later = store.QueryLatency(t0_ + 30min, t0_ + 2h);
    ASSERT_TRUE(isOk(later));
    EXPECT_EQ(getValue(later).size(), 5u);

    auto none = store.QueryLatency(t0_ - 2h, t0_ - 1h);
    ASSERT_TRUE(isOk(none));
    EXPECT_TRUE(getValue(none).empty());
}

// Test: Data survives reopening with a compressed store
TEST_F(FileMetricsStoreTest, PersistsAcrossInstances)
{
    {
        FileMetricsStore writer(path_, true);
        ASSERT_TRUE(isOk(writer.StoreLatency(LatencyBatch(t0_, 200))));
    }
    FileMetricsStore reader(path_, false);
    auto result = reader.QueryLatency(t0_, t0_ + 1h);
    ASSERT_TRUE(isOk(result));
    EXPECT_EQ(getValue(result).size(), 200u);
}

TEST_F(FileMetricsStoreTest, TruncatedFileFailsQuery)
{
    FileMetricsStore store(path_, false);
    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_, 5))));
    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_, 5))));

    long size = FileSize();
    ASSERT_EQ(truncate(path_.c_str(), size - 10), 0);

    auto result = store.QueryLatency(t0_ - 1h, t0_ + 1h);
    ASSERT_FALSE(isOk(result));
    EXPECT_EQ(getError(result).code, Error::STORAGE_ERROR);
    EXPECT_NE(getError(result).message.find("offset"), std::string::npos);
}

TEST_F(FileMetricsStoreTest, CorruptedPayloadFailsQuery)
{
    FileMetricsStore store(path_, false);
    ASSERT_TRUE(isOk(store.StoreLatency(LatencyBatch(t0_, 5))));

    {
        std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(static_cast<std::streamoff>(sizeof(FrameHeader) + 20));
        char byte = 0;
        file.read(&byte, 1);
        file.seekp(static_cast<std::streamoff>(sizeof(FrameHeader) + 20));
        byte = static_cast<char>(byte ^ 0x40);
        file.write(&byte, 1);
    }

    auto result = store.QueryLatency(t0_ - 1h, t0_ + 1h);
    ASSERT_FALSE(isOk(result));
    EXPECT_EQ(getError(result).code, Error::CHECKSUM_MISMATCH);
}

TEST_F(FileMetricsStoreTest, GarbageFileFailsQuery)
{
    {
        std::ofstream out(path_, std::ios::binary);
        std::string garbage(200, 'x');
        out << garbage;
    }
    FileMetricsStore store(path_);
    auto result = store.QueryThroughput(t0_ - 1h, t0_ + 1h);
    ASSERT_FALSE(isOk(result));
    EXPECT_EQ(getError(result).code, Error::INVALID_FORMAT);
}

TEST_F(FileMetricsStoreTest, UnwritablePathIsStorageError)
{
    FileMetricsStore store("/nonexistent-dir/pipemon/metrics.dat");
    auto status = store.StoreLatency(LatencyBatch(t0_, 1));
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::STORAGE_ERROR);
}
