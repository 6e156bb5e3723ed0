#ifndef PIPEMON_MONITOR_PIPELINE_MONITOR_HPP
#define PIPEMON_MONITOR_PIPELINE_MONITOR_HPP

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pipemon/collector/PerformanceCollector.hpp"
#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/Logger.hpp"
#include "pipemon/monitor/AlertSink.hpp"
#include "pipemon/monitor/HealthSummary.hpp"
#include "pipemon/monitor/MetricsStore.hpp"
#include "pipemon/monitor/MonitorConfig.hpp"
#include "pipemon/slo/SLOEvaluator.hpp"
#include "pipemon/slo/SLORegistry.hpp"
#include "pipemon/slo/ViolationTracker.hpp"

namespace PIPEMON::Monitor
{

enum class MonitorState { Stopped, Running, Stopping };

inline std::string MonitorStateToString(MonitorState state)
{
  switch (state) {
    case MonitorState::Stopped:
      return "Stopped";
    case MonitorState::Running:
      return "Running";
    case MonitorState::Stopping:
      return "Stopping";
    default:
      return "Unknown";
  }
}

/**
 * @brief What one tick did
 */
struct TickReport {
  uint64_t tick_number = 0;
  TimePoint timestamp;
  std::vector<SLOStatus> statuses;
  std::vector<ViolationRecord> new_violations;
  size_t latency_persisted = 0;
  size_t throughput_persisted = 0;
  bool persistence_ok = true;
  size_t alerts_forwarded = 0;
  size_t alerts_suppressed = 0;
  bool alert_ok = true;
  int active_loops = 0;  ///< Tick loops alive while this tick ran
};

/**
 * @brief Background SLO monitoring for one pipeline
 *
 * Owns the collector, SLO registry, violation tracker and evaluator. The
 * background loop ticks every check_interval:
 *   1. evaluate all SLOs, recording violations
 *   2. persist measurements appended since the last tick (bounded per
 *      stage) and the new violations
 *   3. send warning/critical statuses to the alert sink as one batch
 * Persistence and alert failures are logged; the loop keeps going and a
 * failed batch is not retried.
 *
 * Usage:
 *   auto monitor = PipelineMonitor::Create(config, store, sink);
 *   auto &collector = getValue(monitor)->GetCollector();
 *   getValue(monitor)->Start();
 *   collector.Trace(PipelineStage::SignalGeneration, [&] { Generate(); });
 */
class PipelineMonitor
{
 public:
  using TickObserver = std::function<void(const TickReport &)>;

  /**
   * @brief Validate @p config and build a monitor
   * @param store Optional metrics store (nullptr disables persistence)
   * @param sink Optional alert sink (nullptr disables alerting)
   * @param clock Optional wall clock (SystemClock when null)
   */
  static Result<std::unique_ptr<PipelineMonitor>> Create(
      const MonitorConfig &config,
      std::shared_ptr<IMetricsStore> store = nullptr,
      std::shared_ptr<IAlertSink> sink = nullptr,
      std::shared_ptr<const IClock> clock = nullptr);

  ~PipelineMonitor();

  PipelineMonitor(const PipelineMonitor &) = delete;
  PipelineMonitor &operator=(const PipelineMonitor &) = delete;

  /**
   * @brief Launch the tick loop
   * @return true if running afterwards; false while a previous loop that
   *         did not stop in time is still executing
   */
  bool Start();

  /**
   * @brief Ask the loop to exit and wait up to stop_timeout
   * @return true if the loop has finished
   */
  bool Stop();

  bool IsRunning() const { return fRunning.load(); }
  MonitorState GetState() const;

  /**
   * @brief Execute one tick on the calling thread
   *
   * Serialized with the background loop's ticks.
   */
  TickReport RunOnce();

  /**
   * @brief Evaluate all SLOs now, without recording violations
   */
  HealthSummary GetHealthSummary() const;

  std::vector<ViolationRecord> GetRecentViolations(size_t limit) const;

  void SetTickObserver(TickObserver observer);

  Collector::PerformanceCollector &GetCollector() { return *fCollector; }
  const Collector::PerformanceCollector &GetCollector() const
  {
    return *fCollector;
  }
  const SLO::SLORegistry &GetRegistry() const { return fRegistry; }
  SLO::ViolationTracker &GetViolationTracker() { return *fTracker; }
  const MonitorConfig &GetConfig() const { return fConfig; }
  uint64_t GetTickCount() const { return fTickCount.load(); }

 private:
  PipelineMonitor(const MonitorConfig &config, SLO::SLORegistry registry,
                  std::shared_ptr<IMetricsStore> store,
                  std::shared_ptr<IAlertSink> sink,
                  std::shared_ptr<const IClock> clock);

  void MonitorLoop();
  TickReport Tick(int active_loops);
  void PersistMeasurements(TickReport &report);
  void ForwardAlerts(TickReport &report);

  MonitorConfig fConfig;
  std::shared_ptr<const IClock> fClock;
  std::unique_ptr<Collector::PerformanceCollector> fCollector;
  SLO::SLORegistry fRegistry;
  std::unique_ptr<SLO::ViolationTracker> fTracker;
  std::unique_ptr<SLO::SLOEvaluator> fEvaluator;
  std::shared_ptr<IMetricsStore> fStore;
  std::shared_ptr<IAlertSink> fSink;
  std::shared_ptr<Logger> fLogger;

  // Lifecycle
  std::mutex fLifecycleMutex;  ///< Serializes Start/Stop
  std::thread fThread;
  std::atomic<bool> fRunning{false};
  std::atomic<bool> fLoopActive{false};
  std::atomic<int> fActiveLoops{0};
  std::mutex fLoopMutex;
  std::condition_variable fLoopCondition;
  bool fStopRequested{false};  ///< Guarded by fLoopMutex

  // Tick state, guarded by fTickMutex
  std::mutex fTickMutex;
  std::atomic<uint64_t> fTickCount{0};
  std::array<uint64_t, kStageCount> fLatencyCursors{};
  std::array<uint64_t, kStageCount> fThroughputCursors{};
  std::map<std::string, TimePoint> fLastAlerted;
  TickObserver fTickObserver;
};

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_PIPELINE_MONITOR_HPP
