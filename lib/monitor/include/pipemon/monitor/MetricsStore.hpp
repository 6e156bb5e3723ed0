#ifndef PIPEMON_MONITOR_METRICS_STORE_HPP
#define PIPEMON_MONITOR_METRICS_STORE_HPP

#include <vector>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/SLOStatus.hpp"

namespace PIPEMON::Monitor
{

/**
 * @brief Durable store for measurements and violations
 *
 * Store* calls append a batch. Query* calls return records whose timestamp
 * (start_time for latency) lies in [from, to]. Implementations may be slow;
 * the monitor only calls them from its background tick.
 */
class IMetricsStore
{
 public:
  virtual ~IMetricsStore() = default;

  virtual Status StoreLatency(
      const std::vector<LatencyMeasurement> &measurements) = 0;
  virtual Status StoreThroughput(
      const std::vector<ThroughputMeasurement> &measurements) = 0;
  virtual Status StoreViolations(
      const std::vector<ViolationRecord> &violations) = 0;

  virtual Result<std::vector<LatencyMeasurement>> QueryLatency(
      TimePoint from, TimePoint to) = 0;
  virtual Result<std::vector<ThroughputMeasurement>> QueryThroughput(
      TimePoint from, TimePoint to) = 0;
  virtual Result<std::vector<ViolationRecord>> QueryViolations(
      TimePoint from, TimePoint to) = 0;
};

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_METRICS_STORE_HPP
