/**
 * @file test_violation_tracker.cpp
 * @brief Unit tests for bounded violation history
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "../test_helpers.hpp"
#include "pipemon/slo/ViolationTracker.hpp"

using namespace PIPEMON;
using namespace PIPEMON::SLO;
using namespace TestHelpers;
using namespace std::chrono_literals;

class ViolationTrackerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        clock_ = std::make_shared<FakeClock>();
        definition_ = MakeLatencySLO("signal_generation_latency",
                                     PipelineStage::SignalGeneration, 1000, 1500, 3000);
    }

    SLOStatus Warning(double current = 1200.0)
    {
        SLOStatus status;
        status.slo_name = definition_.name;
        status.state = SLOState::Warning;
        status.current_value = current;
        status.target_value = definition_.target_value;
        status.compliance_percentage = 1000.0 / current * 100.0;
        return status;
    }

    std::shared_ptr<FakeClock> clock_;
    SLODefinition definition_;
};

TEST_F(ViolationTrackerTest, RecordStampsClockTimeAndCopiesStatus)
{
    ViolationTracker tracker(10, clock_);
    auto record = tracker.Record(definition_, Warning(1250.0));

    EXPECT_EQ(record.timestamp, clock_->Now());
    EXPECT_EQ(record.slo_name, "signal_generation_latency");
    EXPECT_EQ(record.state, SLOState::Warning);
    EXPECT_DOUBLE_EQ(record.current_value, 1250.0);
    EXPECT_DOUBLE_EQ(record.target_value, 1000.0);
    EXPECT_DOUBLE_EQ(record.compliance_percentage, 80.0);
    EXPECT_EQ(tracker.Size(), 1u);
}

// Test: Violations at -25h, -23h and -1h count as two in the last 24 hours
TEST_F(ViolationTrackerTest, CountsOnlyLast24Hours)
{
    ViolationTracker tracker(10, clock_);
    auto now = clock_->Now();

    for (auto age : {25h, 23h, 1h}) {
        ViolationRecord record;
        record.timestamp = now - age;
        record.slo_name = definition_.name;
        tracker.Append(record);
    }
    ViolationRecord other;
    other.timestamp = now;
    other.slo_name = "order_execution_latency";
    tracker.Append(other);

    EXPECT_EQ(tracker.CountInLast24h(definition_.name), 2u);
    EXPECT_EQ(tracker.CountInLast24h("order_execution_latency"), 1u);
    EXPECT_EQ(tracker.CountInLast24h("unknown"), 0u);

    clock_->Advance(2h);
    EXPECT_EQ(tracker.CountInLast24h(definition_.name), 1u);
}

TEST_F(ViolationTrackerTest, EvictsOldestAtCapacity)
{
    ViolationTracker tracker(3, clock_);
    for (int i = 0; i < 5; ++i) {
        tracker.Record(definition_, Warning(1000.0 + i));
        clock_->Advance(1s);
    }
    EXPECT_EQ(tracker.Size(), 3u);

    auto recent = tracker.Recent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_DOUBLE_EQ(recent.front().current_value, 1002.0);
    EXPECT_DOUBLE_EQ(recent.back().current_value, 1004.0);
}

TEST_F(ViolationTrackerTest, RecentReturnsNewestOldestFirst)
{
    ViolationTracker tracker(10, clock_);
    for (int i = 0; i < 4; ++i) {
        tracker.Record(definition_, Warning(1100.0 + i));
    }
    auto recent = tracker.Recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_DOUBLE_EQ(recent[0].current_value, 1102.0);
    EXPECT_DOUBLE_EQ(recent[1].current_value, 1103.0);
    EXPECT_TRUE(tracker.Recent(0).empty());
}

TEST_F(ViolationTrackerTest, ClearAndZeroCapacity)
{
    ViolationTracker tracker(10, clock_);
    tracker.Record(definition_, Warning());
    tracker.Clear();
    EXPECT_EQ(tracker.Size(), 0u);
    EXPECT_EQ(tracker.Capacity(), 10u);

    EXPECT_THROW(ViolationTracker(0, clock_), std::invalid_argument);
}
