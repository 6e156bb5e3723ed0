#ifndef PIPEMON_COLLECTOR_PERFORMANCE_COLLECTOR_HPP
#define PIPEMON_COLLECTOR_PERFORMANCE_COLLECTOR_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pipemon/collector/MeasurementStore.hpp"
#include "pipemon/collector/StageTrace.hpp"
#include "pipemon/collector/Statistics.hpp"
#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/Logger.hpp"
#include "pipemon/core/Measurement.hpp"

namespace PIPEMON {
namespace Collector {

struct CollectorConfig {
  size_t latency_capacity = 10000;   // samples per stage
  size_t throughput_capacity = 1000; // samples per stage
};

/**
 * @brief Concurrent measurement capture and windowed statistics
 *
 * Any number of threads may trace stages and report throughput while
 * another thread reads statistics. Statistics are computed on snapshots
 * outside the store lock.
 */
class PerformanceCollector : public IStatsSource {
public:
  /**
   * @param config Buffer capacities
   * @param clock Wall-clock source for record timestamps and windows
   *              (SystemClock when null)
   * @throws std::invalid_argument if a capacity is zero
   */
  explicit PerformanceCollector(const CollectorConfig &config = {},
                                std::shared_ptr<const IClock> clock = nullptr);

  PerformanceCollector(const PerformanceCollector &) = delete;
  PerformanceCollector &operator=(const PerformanceCollector &) = delete;

  // === Stage tracing ===

  /**
   * @brief Open a scoped trace for one stage execution
   * @param trace_id Identifier for the active-trace registry; generated
   *                 when absent
   */
  StageTrace TraceStage(PipelineStage stage,
                        std::optional<std::string> trace_id = std::nullopt,
                        std::optional<Metadata> metadata = std::nullopt);

  /**
   * @brief Run @p fn inside a trace of @p stage
   *
   * An escaping exception is recorded as a failed measurement (what() for
   * std::exception) and rethrown unchanged.
   * @return Whatever @p fn returns
   */
  template <typename Fn>
  auto Trace(PipelineStage stage, Fn &&fn,
             std::optional<std::string> trace_id = std::nullopt,
             std::optional<Metadata> metadata = std::nullopt)
      -> decltype(std::forward<Fn>(fn)()) {
    StageTrace trace =
        TraceStage(stage, std::move(trace_id), std::move(metadata));
    try {
      return std::forward<Fn>(fn)();
    } catch (const std::exception &e) {
      trace.Fail(e.what());
      throw;
    } catch (...) {
      trace.Fail("non-standard exception");
      throw;
    }
  }

  // === Throughput reporting ===

  /**
   * @brief Record items processed over a reporting window
   *
   * rate = items_processed / window_seconds.
   * @return INVALID_ARGUMENT for negative items or errors, or a
   *         non-positive window; nothing is recorded in that case
   */
  Status RecordThroughput(PipelineStage stage, int64_t items_processed,
                          int64_t window_seconds, int64_t errors = 0);

  // === Statistics (IStatsSource) ===

  std::optional<LatencyStats>
  GetLatencyStats(PipelineStage stage, int64_t window_minutes) const override;

  std::optional<ThroughputStats>
  GetThroughputStats(PipelineStage stage,
                     int64_t window_minutes) const override;

  // === Introspection ===

  std::vector<ActiveTrace> GetActiveTraces() const;

  /**
   * @brief Active traces open for at least @p older_than
   */
  std::vector<ActiveTrace>
  GetStalledTraces(std::chrono::milliseconds older_than) const;

  MeasurementStore &Store() { return store_; }
  const MeasurementStore &Store() const { return store_; }
  const IClock &Clock() const { return *clock_; }

  /**
   * @brief "<stage>_<steady ns>_<sequence>" with a process-wide sequence
   */
  static std::string GenerateTraceId(PipelineStage stage);

private:
  friend class StageTrace;

  void CompleteTrace(uint64_t token, const std::string &trace_id,
                     uint64_t start_ns,
                     LatencyMeasurement measurement) noexcept;

  TimePoint WindowCutoff(int64_t window_minutes) const;

  std::shared_ptr<const IClock> clock_;
  MeasurementStore store_;
  std::shared_ptr<Logger> logger_;
};

} // namespace Collector
} // namespace PIPEMON

#endif // PIPEMON_COLLECTOR_PERFORMANCE_COLLECTOR_HPP
