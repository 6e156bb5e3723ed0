/**
 * @file test_slo_definition.cpp
 * @brief Unit tests for SLODefinition validation and SLO state helpers
 */

#include <gtest/gtest.h>

#include <limits>

#include "pipemon/core/SLODefinition.hpp"
#include "pipemon/core/SLOStatus.hpp"

using namespace PIPEMON;

namespace {

SLODefinition LatencyDefinition()
{
    SLODefinition d;
    d.name = "signal_generation_latency";
    d.stage = PipelineStage::SignalGeneration;
    d.metric_kind = MetricKind::Latency;
    d.target_value = 1000.0;
    d.warning_threshold = 1500.0;
    d.critical_threshold = 3000.0;
    return d;
}

SLODefinition ThroughputDefinition()
{
    SLODefinition d;
    d.name = "data_processing_throughput";
    d.stage = PipelineStage::DataProcessing;
    d.metric_kind = MetricKind::Throughput;
    d.target_value = 100.0;
    d.warning_threshold = 50.0;
    d.critical_threshold = 20.0;
    d.measurement_window_minutes = 5;
    return d;
}

} // namespace

TEST(SLODefinitionTest, AcceptsWellOrderedThresholds)
{
    EXPECT_TRUE(isOk(LatencyDefinition().Validate()));
    EXPECT_TRUE(isOk(ThroughputDefinition().Validate()));
}

TEST(SLODefinitionTest, AcceptsEqualThresholds)
{
    auto d = LatencyDefinition();
    d.warning_threshold = d.target_value;
    d.critical_threshold = d.target_value;
    EXPECT_TRUE(isOk(d.Validate()));
}

TEST(SLODefinitionTest, RejectsEmptyName)
{
    auto d = LatencyDefinition();
    d.name.clear();
    auto status = d.Validate();
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::INVALID_CONFIG);
}

TEST(SLODefinitionTest, RejectsNonPositiveWindow)
{
    auto d = LatencyDefinition();
    d.measurement_window_minutes = 0;
    EXPECT_FALSE(isOk(d.Validate()));
    d.measurement_window_minutes = -5;
    EXPECT_FALSE(isOk(d.Validate()));
}

TEST(SLODefinitionTest, RejectsMisorderedLatencyThresholds)
{
    auto d = LatencyDefinition();
    d.warning_threshold = 500.0; // below target
    auto status = d.Validate();
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::INVALID_CONFIG);
    EXPECT_NE(getError(status).message.find("signal_generation_latency"), std::string::npos);
}

TEST(SLODefinitionTest, RejectsMisorderedThroughputThresholds)
{
    auto d = ThroughputDefinition();
    d.critical_threshold = 80.0; // above warning
    EXPECT_FALSE(isOk(d.Validate()));
}

TEST(SLODefinitionTest, RejectsNegativeOrNonFiniteValues)
{
    auto d = LatencyDefinition();
    d.target_value = -1.0;
    EXPECT_FALSE(isOk(d.Validate()));

    d = LatencyDefinition();
    d.critical_threshold = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(isOk(d.Validate()));

    d = LatencyDefinition();
    d.warning_threshold = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(isOk(d.Validate()));
}

TEST(SLODefinitionTest, MetricKindNames)
{
    EXPECT_EQ(MetricKindToString(MetricKind::Latency), "latency");
    EXPECT_EQ(MetricKindToString(MetricKind::Throughput), "throughput");
    EXPECT_EQ(MetricKindFromString("throughput"), MetricKind::Throughput);
    EXPECT_FALSE(MetricKindFromString("availability").has_value());
}

TEST(SLOStatusTest, OnlyWarningAndCriticalAreViolations)
{
    EXPECT_FALSE(IsViolation(SLOState::Healthy));
    EXPECT_TRUE(IsViolation(SLOState::Warning));
    EXPECT_TRUE(IsViolation(SLOState::Critical));
    EXPECT_FALSE(IsViolation(SLOState::Unknown));
}

TEST(SLOStatusTest, StateNamesParseBack)
{
    for (auto state : {SLOState::Healthy, SLOState::Warning, SLOState::Critical,
                       SLOState::Unknown}) {
        auto parsed = SLOStateFromString(SLOStateToString(state));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, state);
    }
    EXPECT_FALSE(SLOStateFromString("HEALTHY").has_value());
}

TEST(SLOStatusTest, DefaultStatusIsUnknown)
{
    SLOStatus status;
    EXPECT_EQ(status.state, SLOState::Unknown);
    EXPECT_DOUBLE_EQ(status.current_value, 0.0);
    EXPECT_DOUBLE_EQ(status.compliance_percentage, 0.0);
    EXPECT_EQ(status.violations_24h, 0u);
}
