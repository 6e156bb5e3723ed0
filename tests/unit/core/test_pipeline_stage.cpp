/**
 * @file test_pipeline_stage.cpp
 * @brief Unit tests for PipelineStage names and indexing
 */

#include <gtest/gtest.h>

#include <set>

#include "pipemon/core/PipelineStage.hpp"

using namespace PIPEMON;

// Test: Every stage has a distinct wire name that parses back
TEST(PipelineStageTest, WireNamesAreDistinctAndParseBack)
{
    std::set<std::string> names;
    for (auto stage : kAllStages) {
        auto name = PipelineStageToString(stage);
        EXPECT_TRUE(names.insert(name).second) << name;

        auto parsed = PipelineStageFromString(name);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, stage);
    }
    EXPECT_EQ(names.size(), kStageCount);
}

// Test: Wire names are snake_case
TEST(PipelineStageTest, KnownWireNames)
{
    EXPECT_EQ(PipelineStageToString(PipelineStage::DataIngestion), "data_ingestion");
    EXPECT_EQ(PipelineStageToString(PipelineStage::SignalGeneration), "signal_generation");
    EXPECT_EQ(PipelineStageToString(PipelineStage::OrderExecution), "order_execution");
    EXPECT_EQ(PipelineStageToString(PipelineStage::PortfolioUpdate), "portfolio_update");
}

// Test: Unknown names are rejected
TEST(PipelineStageTest, UnknownNameIsRejected)
{
    EXPECT_FALSE(PipelineStageFromString("order_routing").has_value());
    EXPECT_FALSE(PipelineStageFromString("").has_value());
    EXPECT_FALSE(PipelineStageFromString("Order_Execution").has_value());
}

// Test: Stage index matches position in kAllStages
TEST(PipelineStageTest, StageIndexMatchesOrder)
{
    for (size_t i = 0; i < kAllStages.size(); ++i) {
        EXPECT_EQ(StageIndex(kAllStages[i]), i);
    }
}
