/**
 * @file test_slo_evaluator.cpp
 * @brief Unit tests for SLO classification, compliance and evaluation
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "../test_helpers.hpp"
#include "pipemon/slo/SLOEvaluator.hpp"

using namespace PIPEMON;
using namespace PIPEMON::SLO;
using namespace TestHelpers;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

Collector::LatencyStats LatencyWithP95(double p95)
{
    Collector::LatencyStats stats;
    stats.count = 10;
    stats.mean = p95 / 2.0;
    stats.median = p95 / 2.0;
    stats.p95 = p95;
    stats.p99 = p95;
    stats.min = 0.0;
    stats.max = p95;
    stats.success_rate = 1.0;
    return stats;
}

Collector::ThroughputStats ThroughputWithMean(double mean)
{
    Collector::ThroughputStats stats;
    stats.count = 5;
    stats.mean_throughput = mean;
    stats.max_throughput = mean;
    return stats;
}

} // namespace

// Classification tables

struct ClassificationCase {
    double current;
    SLOState expected;
};

class LatencyClassificationTest : public ::testing::TestWithParam<ClassificationCase> {};

TEST_P(LatencyClassificationTest, Classifies)
{
    auto d = MakeLatencySLO("lat", PipelineStage::SignalGeneration, 1000, 1500, 3000);
    EXPECT_EQ(SLOEvaluator::ClassifyLatency(GetParam().current, d), GetParam().expected);
}

INSTANTIATE_TEST_SUITE_P(
    Thresholds, LatencyClassificationTest,
    ::testing::Values(ClassificationCase{0.0, SLOState::Healthy},
                      ClassificationCase{999.9, SLOState::Healthy},
                      ClassificationCase{1000.0, SLOState::Healthy},
                      ClassificationCase{1000.1, SLOState::Warning},
                      ClassificationCase{1500.0, SLOState::Warning},
                      ClassificationCase{1500.1, SLOState::Critical},
                      ClassificationCase{3000.0, SLOState::Critical},
                      ClassificationCase{50000.0, SLOState::Critical}));

class ThroughputClassificationTest : public ::testing::TestWithParam<ClassificationCase> {};

TEST_P(ThroughputClassificationTest, Classifies)
{
    auto d = MakeThroughputSLO("thr", PipelineStage::DataProcessing, 100, 50, 20);
    EXPECT_EQ(SLOEvaluator::ClassifyThroughput(GetParam().current, d), GetParam().expected);
}

INSTANTIATE_TEST_SUITE_P(
    Thresholds, ThroughputClassificationTest,
    ::testing::Values(ClassificationCase{500.0, SLOState::Healthy},
                      ClassificationCase{100.0, SLOState::Healthy},
                      ClassificationCase{99.9, SLOState::Warning},
                      ClassificationCase{50.0, SLOState::Warning},
                      ClassificationCase{49.9, SLOState::Critical},
                      ClassificationCase{0.0, SLOState::Critical}));

TEST(ComplianceTest, LatencyCompliance)
{
    EXPECT_DOUBLE_EQ(SLOEvaluator::LatencyCompliance(500.0, 1000.0), 100.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::LatencyCompliance(2000.0, 1000.0), 50.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::LatencyCompliance(0.0, 1000.0), 100.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::LatencyCompliance(1000.0, 0.0), 0.0);
}

TEST(ComplianceTest, ThroughputCompliance)
{
    EXPECT_DOUBLE_EQ(SLOEvaluator::ThroughputCompliance(50.0, 100.0), 50.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::ThroughputCompliance(250.0, 100.0), 100.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::ThroughputCompliance(0.0, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(SLOEvaluator::ThroughputCompliance(10.0, 0.0), 100.0);
}

TEST(ComplianceTest, AlwaysWithinBounds)
{
    const double inf = std::numeric_limits<double>::infinity();
    for (double current : {0.0, 1e-9, 1.0, 999.0, 1e12, inf}) {
        for (double target : {0.0, 1.0, 1000.0, 1e12}) {
            double lat = SLOEvaluator::LatencyCompliance(current, target);
            double thr = SLOEvaluator::ThroughputCompliance(current, target);
            EXPECT_GE(lat, 0.0);
            EXPECT_LE(lat, 100.0);
            EXPECT_GE(thr, 0.0);
            EXPECT_LE(thr, 100.0);
        }
    }
}

// Evaluation against a stats source

class SLOEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        clock_ = std::make_shared<FakeClock>();
        tracker_ = std::make_unique<ViolationTracker>(100, clock_);
        ASSERT_TRUE(isOk(registry_.Register(
            MakeLatencySLO("signal_generation_latency", PipelineStage::SignalGeneration,
                           1000, 1500, 3000, 15))));
        ASSERT_TRUE(isOk(registry_.Register(
            MakeThroughputSLO("data_processing_throughput", PipelineStage::DataProcessing,
                              100, 50, 20, 5))));
        evaluator_ = std::make_unique<SLOEvaluator>(registry_, stats_, *tracker_);
    }

    std::shared_ptr<FakeClock> clock_;
    SLORegistry registry_;
    ::testing::NiceMock<MockStatsSource> stats_;
    std::unique_ptr<ViolationTracker> tracker_;
    std::unique_ptr<SLOEvaluator> evaluator_;
};

TEST_F(SLOEvaluatorTest, UsesP95AndDefinitionWindow)
{
    EXPECT_CALL(stats_, GetLatencyStats(PipelineStage::SignalGeneration, 15))
        .WillOnce(Return(LatencyWithP95(1200.0)));

    auto status = evaluator_->Evaluate(registry_.Definitions()[0]);
    EXPECT_EQ(status.slo_name, "signal_generation_latency");
    EXPECT_EQ(status.state, SLOState::Warning);
    EXPECT_DOUBLE_EQ(status.current_value, 1200.0);
    EXPECT_DOUBLE_EQ(status.target_value, 1000.0);
    EXPECT_NEAR(status.compliance_percentage, 1000.0 / 1200.0 * 100.0, 1e-9);
}

TEST_F(SLOEvaluatorTest, UsesMeanThroughput)
{
    EXPECT_CALL(stats_, GetThroughputStats(PipelineStage::DataProcessing, 5))
        .WillOnce(Return(ThroughputWithMean(30.0)));

    auto status = evaluator_->Evaluate(registry_.Definitions()[1]);
    EXPECT_EQ(status.state, SLOState::Critical);
    EXPECT_DOUBLE_EQ(status.compliance_percentage, 30.0);
}

TEST_F(SLOEvaluatorTest, NoDataIsUnknown)
{
    EXPECT_CALL(stats_, GetLatencyStats(_, _)).WillOnce(Return(std::nullopt));

    auto status = evaluator_->Evaluate(registry_.Definitions()[0]);
    EXPECT_EQ(status.state, SLOState::Unknown);
    EXPECT_DOUBLE_EQ(status.current_value, 0.0);
    EXPECT_DOUBLE_EQ(status.compliance_percentage, 0.0);
    EXPECT_DOUBLE_EQ(status.target_value, 1000.0);
    EXPECT_EQ(status.violations_24h, 0u);
}

TEST_F(SLOEvaluatorTest, ThrowingSourceIsUnknown)
{
    EXPECT_CALL(stats_, GetThroughputStats(_, _))
        .WillOnce(Throw(std::runtime_error("stats backend down")));

    auto status = evaluator_->Evaluate(registry_.Definitions()[1]);
    EXPECT_EQ(status.state, SLOState::Unknown);
    EXPECT_DOUBLE_EQ(status.compliance_percentage, 0.0);
}

// Test: A non-standard throw for one SLO leaves the others evaluated
TEST_F(SLOEvaluatorTest, NonStandardThrowIsIsolatedPerSLO)
{
    EXPECT_CALL(stats_, GetLatencyStats(_, _)).WillOnce(Throw(42));
    EXPECT_CALL(stats_, GetThroughputStats(_, _)).WillOnce(Return(ThroughputWithMean(30.0)));

    EvaluationResult result;
    EXPECT_NO_THROW(result = evaluator_->EvaluateAll(true));
    ASSERT_EQ(result.statuses.size(), 2u);
    EXPECT_EQ(result.statuses[0].state, SLOState::Unknown);
    EXPECT_DOUBLE_EQ(result.statuses[0].compliance_percentage, 0.0);
    EXPECT_EQ(result.statuses[1].state, SLOState::Critical);
    ASSERT_EQ(result.new_violations.size(), 1u);
    EXPECT_EQ(result.new_violations[0].slo_name, "data_processing_throughput");
}

// Test: EvaluateAll records warning and critical results only
TEST_F(SLOEvaluatorTest, EvaluateAllRecordsViolations)
{
    ON_CALL(stats_, GetLatencyStats(_, _)).WillByDefault(Return(LatencyWithP95(5000.0)));
    ON_CALL(stats_, GetThroughputStats(_, _)).WillByDefault(Return(ThroughputWithMean(150.0)));

    auto result = evaluator_->EvaluateAll(true);
    ASSERT_EQ(result.statuses.size(), 2u);
    EXPECT_EQ(result.statuses[0].state, SLOState::Critical);
    EXPECT_EQ(result.statuses[1].state, SLOState::Healthy);
    ASSERT_EQ(result.new_violations.size(), 1u);
    EXPECT_EQ(result.new_violations[0].slo_name, "signal_generation_latency");
    EXPECT_EQ(result.new_violations[0].state, SLOState::Critical);
    EXPECT_EQ(tracker_->Size(), 1u);
}

// Test: The 24h count excludes the violation recorded by the same pass
TEST_F(SLOEvaluatorTest, ViolationCountPrecedesRecording)
{
    ON_CALL(stats_, GetLatencyStats(_, _)).WillByDefault(Return(LatencyWithP95(2000.0)));

    auto first = evaluator_->EvaluateAll(true);
    EXPECT_EQ(first.statuses[0].violations_24h, 0u);

    auto second = evaluator_->EvaluateAll(true);
    EXPECT_EQ(second.statuses[0].violations_24h, 1u);
    EXPECT_EQ(tracker_->CountInLast24h("signal_generation_latency"), 2u);
}

TEST_F(SLOEvaluatorTest, EvaluateAllWithoutRecording)
{
    ON_CALL(stats_, GetLatencyStats(_, _)).WillByDefault(Return(LatencyWithP95(9000.0)));

    auto result = evaluator_->EvaluateAll(false);
    EXPECT_EQ(result.statuses[0].state, SLOState::Critical);
    EXPECT_TRUE(result.new_violations.empty());
    EXPECT_EQ(tracker_->Size(), 0u);
}
