#ifndef PIPEMON_MONITOR_HEALTH_SUMMARY_HPP
#define PIPEMON_MONITOR_HEALTH_SUMMARY_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "pipemon/collector/Statistics.hpp"
#include "pipemon/core/Clock.hpp"
#include "pipemon/core/PipelineStage.hpp"
#include "pipemon/core/SLOStatus.hpp"

namespace PIPEMON::Monitor
{

struct StagePerformance {
  PipelineStage stage = PipelineStage::DataIngestion;
  std::optional<Collector::LatencyStats> latency;
  std::optional<Collector::ThroughputStats> throughput;
};

/**
 * @brief On-demand snapshot of pipeline health
 *
 * overall_health_percentage = healthy / total * 100, 100 with no SLOs.
 */
struct HealthSummary {
  TimePoint timestamp;
  double overall_health_percentage = 100.0;
  size_t total = 0;
  size_t healthy = 0;
  size_t warning = 0;
  size_t critical = 0;
  size_t unknown = 0;
  std::vector<SLOStatus> slo_details;
  std::array<StagePerformance, kStageCount> stage_performance;
};

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_HEALTH_SUMMARY_HPP
