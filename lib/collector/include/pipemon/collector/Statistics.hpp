#ifndef PIPEMON_COLLECTOR_STATISTICS_HPP
#define PIPEMON_COLLECTOR_STATISTICS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/PipelineStage.hpp"

namespace PIPEMON {
namespace Collector {

/**
 * @brief Windowed latency statistics over successful measurements
 *
 * count and the duration fields cover successful in-window measurements
 * only. success_rate is in-window successes divided by all in-window
 * measurements.
 */
struct LatencyStats {
  size_t count = 0;
  double mean = 0.0;
  double median = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double min = 0.0;
  double max = 0.0;
  double success_rate = 0.0;
};

struct ThroughputStats {
  size_t count = 0;
  double mean_throughput = 0.0;
  double max_throughput = 0.0;
  int64_t total_items = 0;
  int64_t total_errors = 0;
  double error_rate = 0.0; // total_errors / total_items, 0 with no items
};

/**
 * @brief Nearest-rank percentile of ascending values
 *
 * index = floor(n * percentile / 100), clamped to n - 1. No interpolation.
 * @param sorted Values sorted ascending, must not be empty
 */
double NearestRankPercentile(const std::vector<double> &sorted,
                             double percentile);

/**
 * @brief Median of ascending values (mean of the middle pair for even n)
 * @param sorted Values sorted ascending, must not be empty
 */
double Median(const std::vector<double> &sorted);

/**
 * @brief Latency statistics for measurements with start_time >= cutoff
 * @return std::nullopt when no successful measurement is in the window
 */
std::optional<LatencyStats>
ComputeLatencyStats(const std::vector<LatencyMeasurement> &measurements,
                    TimePoint cutoff);

/**
 * @brief Throughput statistics for samples with timestamp >= cutoff
 * @return std::nullopt when no sample is in the window
 */
std::optional<ThroughputStats>
ComputeThroughputStats(const std::vector<ThroughputMeasurement> &samples,
                       TimePoint cutoff);

/**
 * @brief Provider of windowed statistics per stage
 *
 * Implemented by PerformanceCollector; the SLO evaluator only sees this
 * interface. Implementations may throw; callers treat that as missing data.
 */
class IStatsSource {
public:
  virtual ~IStatsSource() = default;

  virtual std::optional<LatencyStats>
  GetLatencyStats(PipelineStage stage, int64_t window_minutes) const = 0;

  virtual std::optional<ThroughputStats>
  GetThroughputStats(PipelineStage stage, int64_t window_minutes) const = 0;
};

} // namespace Collector
} // namespace PIPEMON

#endif // PIPEMON_COLLECTOR_STATISTICS_HPP
