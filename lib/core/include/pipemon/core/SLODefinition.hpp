#ifndef PIPEMON_CORE_SLO_DEFINITION_HPP
#define PIPEMON_CORE_SLO_DEFINITION_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "pipemon/core/Error.hpp"
#include "pipemon/core/PipelineStage.hpp"

namespace PIPEMON {

/**
 * @brief Which statistic an SLO is judged on
 *
 * Latency: lower is better, current value is the p95 duration in ms.
 * Throughput: higher is better, current value is the mean items/sec.
 */
enum class MetricKind : uint8_t { Latency = 0, Throughput = 1 };

inline std::string MetricKindToString(MetricKind kind) {
  switch (kind) {
  case MetricKind::Latency:
    return "latency";
  case MetricKind::Throughput:
    return "throughput";
  default:
    return "unknown";
  }
}

inline std::optional<MetricKind> MetricKindFromString(const std::string &name) {
  if (name == "latency")
    return MetricKind::Latency;
  if (name == "throughput")
    return MetricKind::Throughput;
  return std::nullopt;
}

/**
 * @brief A target/warning/critical threshold triple for one stage metric
 */
struct SLODefinition {
  std::string name;
  PipelineStage stage = PipelineStage::DataIngestion;
  MetricKind metric_kind = MetricKind::Latency;
  double target_value = 0.0;
  double warning_threshold = 0.0;
  double critical_threshold = 0.0;
  int64_t measurement_window_minutes = 15;
  std::string description;

  /**
   * @brief Check the threshold ordering and value invariants
   *
   * Latency requires target <= warning <= critical, throughput requires
   * target >= warning >= critical. Thresholds must be finite and >= 0, the
   * name non-empty and the window positive.
   * @return INVALID_CONFIG error describing the first violated invariant
   */
  Status Validate() const;
};

} // namespace PIPEMON

#endif // PIPEMON_CORE_SLO_DEFINITION_HPP
