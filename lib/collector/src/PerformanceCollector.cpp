#include "pipemon/collector/PerformanceCollector.hpp"

#include <atomic>

namespace PIPEMON {
namespace Collector {

namespace {

std::atomic<uint64_t> gTraceSequence{0};

} // namespace

PerformanceCollector::PerformanceCollector(const CollectorConfig &config,
                                           std::shared_ptr<const IClock> clock)
    : clock_(clock ? std::move(clock)
                   : std::shared_ptr<const IClock>(
                         std::make_shared<SystemClock>())),
      store_(config.latency_capacity, config.throughput_capacity),
      logger_(Logger::GetLogger("PerformanceCollector")) {}

std::string PerformanceCollector::GenerateTraceId(PipelineStage stage) {
  uint64_t seq = gTraceSequence.fetch_add(1, std::memory_order_relaxed);
  return PipelineStageToString(stage) + "_" +
         std::to_string(getCurrentTimestampNs()) + "_" + std::to_string(seq);
}

StageTrace PerformanceCollector::TraceStage(PipelineStage stage,
                                            std::optional<std::string> trace_id,
                                            std::optional<Metadata> metadata) {
  std::string id = trace_id ? std::move(*trace_id) : GenerateTraceId(stage);

  ActiveTrace active;
  active.trace_id = id;
  active.stage = stage;
  active.start_time = clock_->Now();
  active.start_ns = getCurrentTimestampNs();
  active.metadata = metadata;

  TimePoint start_time = active.start_time;
  uint64_t start_ns = active.start_ns;
  uint64_t token = store_.BeginTrace(std::move(active));

  return StageTrace(this, stage, token, std::move(id), start_time, start_ns,
                    std::move(metadata));
}

void PerformanceCollector::CompleteTrace(uint64_t token,
                                         const std::string &trace_id,
                                         uint64_t start_ns,
                                         LatencyMeasurement measurement) noexcept {
  uint64_t end_ns = getCurrentTimestampNs();
  uint64_t elapsed_ns = end_ns > start_ns ? end_ns - start_ns : 0;
  measurement.duration_ms = static_cast<double>(elapsed_ns) / 1.0e6;
  measurement.end_time =
      measurement.start_time +
      std::chrono::duration_cast<WallClock::duration>(
          std::chrono::nanoseconds(elapsed_ns));

  try {
    store_.CompleteTrace(token, std::move(measurement));
  } catch (const std::exception &e) {
    logger_->Error("Failed to record trace " + trace_id + ": " + e.what());
  }
}

Status PerformanceCollector::RecordThroughput(PipelineStage stage,
                                              int64_t items_processed,
                                              int64_t window_seconds,
                                              int64_t errors) {
  if (items_processed < 0) {
    return Status{Error(Error::INVALID_ARGUMENT,
                        "items_processed must be non-negative, got " +
                            std::to_string(items_processed))};
  }
  if (window_seconds <= 0) {
    return Status{Error(Error::INVALID_ARGUMENT,
                        "window_seconds must be positive, got " +
                            std::to_string(window_seconds))};
  }
  if (errors < 0) {
    return Status{Error(Error::INVALID_ARGUMENT,
                        "errors must be non-negative, got " +
                            std::to_string(errors))};
  }

  ThroughputMeasurement m;
  m.stage = stage;
  m.timestamp = clock_->Now();
  m.items_processed = items_processed;
  m.window_seconds = window_seconds;
  m.throughput_per_second = static_cast<double>(items_processed) /
                            static_cast<double>(window_seconds);
  m.errors = errors;
  store_.AppendThroughput(std::move(m));
  return OkStatus();
}

TimePoint PerformanceCollector::WindowCutoff(int64_t window_minutes) const {
  return clock_->Now() - std::chrono::minutes(window_minutes);
}

std::optional<LatencyStats>
PerformanceCollector::GetLatencyStats(PipelineStage stage,
                                      int64_t window_minutes) const {
  if (window_minutes <= 0) {
    return std::nullopt;
  }
  auto snapshot = store_.LatencySnapshot(stage);
  return ComputeLatencyStats(snapshot, WindowCutoff(window_minutes));
}

std::optional<ThroughputStats>
PerformanceCollector::GetThroughputStats(PipelineStage stage,
                                         int64_t window_minutes) const {
  if (window_minutes <= 0) {
    return std::nullopt;
  }
  auto snapshot = store_.ThroughputSnapshot(stage);
  return ComputeThroughputStats(snapshot, WindowCutoff(window_minutes));
}

std::vector<ActiveTrace> PerformanceCollector::GetActiveTraces() const {
  return store_.ActiveTraces();
}

std::vector<ActiveTrace>
PerformanceCollector::GetStalledTraces(std::chrono::milliseconds older_than) const {
  std::vector<ActiveTrace> result;
  auto now_ns = getCurrentTimestampNs();
  auto threshold_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(older_than).count());

  for (auto &trace : store_.ActiveTraces()) {
    uint64_t elapsed = now_ns > trace.start_ns ? now_ns - trace.start_ns : 0;
    if (elapsed >= threshold_ns) {
      result.push_back(std::move(trace));
    }
  }
  return result;
}

} // namespace Collector
} // namespace PIPEMON
