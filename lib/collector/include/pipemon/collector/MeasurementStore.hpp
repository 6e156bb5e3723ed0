#ifndef PIPEMON_COLLECTOR_MEASUREMENT_STORE_HPP
#define PIPEMON_COLLECTOR_MEASUREMENT_STORE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/PipelineStage.hpp"

namespace PIPEMON {
namespace Collector {

/**
 * @brief A traced stage execution that has not closed yet
 */
struct ActiveTrace {
  std::string trace_id;
  PipelineStage stage = PipelineStage::DataIngestion;
  TimePoint start_time;
  uint64_t start_ns = 0; // steady clock, for elapsed-time checks
  std::optional<Metadata> metadata;
};

/**
 * @brief Bounded per-stage measurement buffers plus the active-trace registry
 *
 * Each stage owns one latency and one throughput ring buffer of fixed
 * capacity. Appending to a full buffer evicts its oldest entry. A single
 * mutex guards every buffer and the registry; readers get copies.
 *
 * Each buffer also counts how many records were ever appended to it. The
 * *Since() readers use that count as a cursor so a consumer can pick up
 * only what arrived after its previous read.
 */
class MeasurementStore {
public:
  /**
   * @throws std::invalid_argument if either capacity is zero
   */
  MeasurementStore(size_t latency_capacity, size_t throughput_capacity);

  MeasurementStore(const MeasurementStore &) = delete;
  MeasurementStore &operator=(const MeasurementStore &) = delete;

  // Active trace registry
  /**
   * @brief Register an open trace
   * @return Registry token for CompleteTrace(); unique even when several
   *         open traces share a trace_id
   */
  uint64_t BeginTrace(ActiveTrace trace);

  /**
   * @brief Append the closing measurement and drop the registry entry
   *
   * Both happen inside the same critical section.
   */
  void CompleteTrace(uint64_t token, LatencyMeasurement measurement);

  std::vector<ActiveTrace> ActiveTraces() const;
  size_t ActiveTraceCount() const;

  // Appends
  void AppendLatency(LatencyMeasurement measurement);
  void AppendThroughput(ThroughputMeasurement measurement);

  // Snapshots (buffer order = append order)
  std::vector<LatencyMeasurement> LatencySnapshot(PipelineStage stage) const;
  std::vector<ThroughputMeasurement>
  ThroughputSnapshot(PipelineStage stage) const;

  /**
   * @brief Latency records appended after @p cursor, newest @p limit only
   *
   * @p cursor is updated to the current append count. Records that were
   * appended and already evicted are skipped.
   */
  std::vector<LatencyMeasurement> LatencySince(PipelineStage stage,
                                               uint64_t &cursor,
                                               size_t limit) const;
  std::vector<ThroughputMeasurement> ThroughputSince(PipelineStage stage,
                                                     uint64_t &cursor,
                                                     size_t limit) const;

  size_t LatencyCount(PipelineStage stage) const;
  size_t ThroughputCount(PipelineStage stage) const;
  uint64_t LatencyAppended(PipelineStage stage) const;
  uint64_t ThroughputAppended(PipelineStage stage) const;

  size_t LatencyCapacity() const { return latency_capacity_; }
  size_t ThroughputCapacity() const { return throughput_capacity_; }

  // Drop all buffered measurements; active traces are kept
  void Clear();

private:
  struct StageBuffers {
    std::deque<LatencyMeasurement> latency;
    std::deque<ThroughputMeasurement> throughput;
    uint64_t latency_appended = 0;
    uint64_t throughput_appended = 0;
  };

  void AppendLatencyLocked(LatencyMeasurement measurement);

  const size_t latency_capacity_;
  const size_t throughput_capacity_;

  mutable std::mutex mutex_;
  std::array<StageBuffers, kStageCount> stages_;
  std::unordered_map<uint64_t, ActiveTrace> active_;
  uint64_t next_token_ = 0;
};

} // namespace Collector
} // namespace PIPEMON

#endif // PIPEMON_COLLECTOR_MEASUREMENT_STORE_HPP
