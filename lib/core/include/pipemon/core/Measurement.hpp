#ifndef PIPEMON_CORE_MEASUREMENT_HPP
#define PIPEMON_CORE_MEASUREMENT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/PipelineStage.hpp"

namespace PIPEMON {

using Metadata = std::map<std::string, std::string>;

/**
 * @brief One timed execution of a pipeline stage
 */
struct LatencyMeasurement {
  PipelineStage stage = PipelineStage::DataIngestion;
  TimePoint start_time;
  TimePoint end_time;
  double duration_ms = 0.0;
  bool success = true;
  std::optional<std::string> error_message;
  std::optional<Metadata> metadata;
};

/**
 * @brief One explicit throughput report for a stage
 *
 * throughput_per_second is items_processed / window_seconds.
 */
struct ThroughputMeasurement {
  PipelineStage stage = PipelineStage::DataIngestion;
  TimePoint timestamp;
  int64_t items_processed = 0;
  int64_t window_seconds = 1;
  double throughput_per_second = 0.0;
  int64_t errors = 0;
};

} // namespace PIPEMON

#endif // PIPEMON_CORE_MEASUREMENT_HPP
