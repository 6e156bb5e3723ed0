#include "pipemon/collector/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace PIPEMON {
namespace Collector {

double NearestRankPercentile(const std::vector<double> &sorted,
                             double percentile) {
  const size_t n = sorted.size();
  auto index = static_cast<size_t>(
      std::floor(static_cast<double>(n) * percentile / 100.0));
  if (index >= n) {
    index = n - 1;
  }
  return sorted[index];
}

double Median(const std::vector<double> &sorted) {
  const size_t n = sorted.size();
  if (n % 2 == 1) {
    return sorted[n / 2];
  }
  return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
}

std::optional<LatencyStats>
ComputeLatencyStats(const std::vector<LatencyMeasurement> &measurements,
                    TimePoint cutoff) {
  std::vector<double> durations;
  size_t in_window = 0;

  for (const auto &m : measurements) {
    if (m.start_time < cutoff) {
      continue;
    }
    ++in_window;
    if (m.success) {
      durations.push_back(m.duration_ms);
    }
  }

  if (durations.empty()) {
    return std::nullopt;
  }

  std::sort(durations.begin(), durations.end());

  LatencyStats stats;
  stats.count = durations.size();
  stats.mean = std::accumulate(durations.begin(), durations.end(), 0.0) /
               static_cast<double>(durations.size());
  stats.median = Median(durations);
  stats.p95 = NearestRankPercentile(durations, 95.0);
  stats.p99 = NearestRankPercentile(durations, 99.0);
  stats.min = durations.front();
  stats.max = durations.back();
  stats.success_rate =
      static_cast<double>(durations.size()) / static_cast<double>(in_window);
  return stats;
}

std::optional<ThroughputStats>
ComputeThroughputStats(const std::vector<ThroughputMeasurement> &samples,
                       TimePoint cutoff) {
  ThroughputStats stats;
  double rate_sum = 0.0;

  for (const auto &s : samples) {
    if (s.timestamp < cutoff) {
      continue;
    }
    if (stats.count == 0 || s.throughput_per_second > stats.max_throughput) {
      stats.max_throughput = s.throughput_per_second;
    }
    ++stats.count;
    rate_sum += s.throughput_per_second;
    stats.total_items += s.items_processed;
    stats.total_errors += s.errors;
  }

  if (stats.count == 0) {
    return std::nullopt;
  }

  stats.mean_throughput = rate_sum / static_cast<double>(stats.count);
  stats.error_rate = stats.total_items > 0
                         ? static_cast<double>(stats.total_errors) /
                               static_cast<double>(stats.total_items)
                         : 0.0;
  return stats;
}

} // namespace Collector
} // namespace PIPEMON
