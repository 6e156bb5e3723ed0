/**
 * @file test_slo_registry.cpp
 * @brief Unit tests for SLO registration
 */

#include <gtest/gtest.h>

#include "../test_helpers.hpp"
#include "pipemon/slo/SLORegistry.hpp"

using namespace PIPEMON;
using namespace PIPEMON::SLO;
using namespace TestHelpers;

TEST(SLORegistryTest, DefaultSetHasThreeValidSLOs)
{
    auto defaults = SLORegistry::DefaultDefinitions();
    ASSERT_EQ(defaults.size(), 3u);

    EXPECT_EQ(defaults[0].name, "signal_generation_latency");
    EXPECT_EQ(defaults[0].stage, PipelineStage::SignalGeneration);
    EXPECT_DOUBLE_EQ(defaults[0].target_value, 1000.0);
    EXPECT_DOUBLE_EQ(defaults[0].warning_threshold, 1500.0);
    EXPECT_DOUBLE_EQ(defaults[0].critical_threshold, 3000.0);

    EXPECT_EQ(defaults[1].name, "order_execution_latency");
    EXPECT_DOUBLE_EQ(defaults[1].target_value, 2000.0);

    EXPECT_EQ(defaults[2].name, "data_processing_throughput");
    EXPECT_EQ(defaults[2].metric_kind, MetricKind::Throughput);
    EXPECT_EQ(defaults[2].measurement_window_minutes, 5);

    auto registry = SLORegistry::FromDefinitions(defaults);
    ASSERT_TRUE(isOk(registry));
    EXPECT_EQ(getValue(registry).Size(), 3u);
}

TEST(SLORegistryTest, RegisterAndFind)
{
    SLORegistry registry;
    EXPECT_TRUE(registry.Empty());

    auto d = MakeLatencySLO("risk_latency", PipelineStage::RiskValidation, 50, 100, 200);
    ASSERT_TRUE(isOk(registry.Register(d)));

    auto found = registry.Find("risk_latency");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->stage, PipelineStage::RiskValidation);
    EXPECT_FALSE(registry.Find("missing").has_value());
}

TEST(SLORegistryTest, DuplicateNameIsRejected)
{
    SLORegistry registry;
    auto d = MakeLatencySLO("dup", PipelineStage::RiskValidation, 50, 100, 200);
    ASSERT_TRUE(isOk(registry.Register(d)));

    auto second = registry.Register(d);
    ASSERT_FALSE(isOk(second));
    EXPECT_EQ(getError(second).code, Error::DUPLICATE_NAME);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(SLORegistryTest, InvalidDefinitionIsRejected)
{
    SLORegistry registry;
    auto d = MakeLatencySLO("bad", PipelineStage::RiskValidation, 300, 100, 200);
    auto status = registry.Register(d);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::INVALID_CONFIG);
    EXPECT_TRUE(registry.Empty());
}

TEST(SLORegistryTest, FromDefinitionsPreservesOrderAndFailsOnFirstError)
{
    std::vector<SLODefinition> defs{
        MakeThroughputSLO("b", PipelineStage::DataProcessing, 100, 50, 20),
        MakeLatencySLO("a", PipelineStage::SignalGeneration, 10, 20, 30)};

    auto registry = SLORegistry::FromDefinitions(defs);
    ASSERT_TRUE(isOk(registry));
    EXPECT_EQ(getValue(registry).Definitions()[0].name, "b");
    EXPECT_EQ(getValue(registry).Definitions()[1].name, "a");

    defs.push_back(defs[0]);
    auto duplicate = SLORegistry::FromDefinitions(defs);
    ASSERT_FALSE(isOk(duplicate));
    EXPECT_EQ(getError(duplicate).code, Error::DUPLICATE_NAME);
}
