#ifndef PIPEMON_CORE_PIPELINE_STAGE_HPP
#define PIPEMON_CORE_PIPELINE_STAGE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace PIPEMON {

/**
 * @brief Named steps a unit of work passes through
 *
 * The set is closed at compile time. Per-stage storage is indexed by the
 * enum value, so new stages must be appended before kStageCount.
 */
enum class PipelineStage : uint8_t {
  DataIngestion = 0,
  DataProcessing = 1,
  FeatureExtraction = 2,
  SignalGeneration = 3,
  RiskValidation = 4,
  OrderCreation = 5,
  OrderExecution = 6,
  TradeConfirmation = 7,
  PortfolioUpdate = 8
};

constexpr size_t kStageCount = 9;

constexpr std::array<PipelineStage, kStageCount> kAllStages = {
    PipelineStage::DataIngestion,     PipelineStage::DataProcessing,
    PipelineStage::FeatureExtraction, PipelineStage::SignalGeneration,
    PipelineStage::RiskValidation,    PipelineStage::OrderCreation,
    PipelineStage::OrderExecution,    PipelineStage::TradeConfirmation,
    PipelineStage::PortfolioUpdate};

constexpr size_t StageIndex(PipelineStage stage) {
  return static_cast<size_t>(stage);
}

/**
 * @brief Convert PipelineStage to its wire name (e.g. "order_execution")
 */
inline std::string PipelineStageToString(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::DataIngestion:
    return "data_ingestion";
  case PipelineStage::DataProcessing:
    return "data_processing";
  case PipelineStage::FeatureExtraction:
    return "feature_extraction";
  case PipelineStage::SignalGeneration:
    return "signal_generation";
  case PipelineStage::RiskValidation:
    return "risk_validation";
  case PipelineStage::OrderCreation:
    return "order_creation";
  case PipelineStage::OrderExecution:
    return "order_execution";
  case PipelineStage::TradeConfirmation:
    return "trade_confirmation";
  case PipelineStage::PortfolioUpdate:
    return "portfolio_update";
  default:
    return "unknown";
  }
}

/**
 * @brief Parse a wire name back into a PipelineStage
 * @return std::nullopt for names outside the closed set
 */
inline std::optional<PipelineStage>
PipelineStageFromString(const std::string &name) {
  for (auto stage : kAllStages) {
    if (PipelineStageToString(stage) == name) {
      return stage;
    }
  }
  return std::nullopt;
}

} // namespace PIPEMON

#endif // PIPEMON_CORE_PIPELINE_STAGE_HPP
