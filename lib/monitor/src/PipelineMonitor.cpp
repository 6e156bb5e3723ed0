#include "pipemon/monitor/PipelineMonitor.hpp"

#include <exception>
#include <sstream>
#include <utility>

namespace PIPEMON::Monitor
{

Result<std::unique_ptr<PipelineMonitor>> PipelineMonitor::Create(
    const MonitorConfig &config, std::shared_ptr<IMetricsStore> store,
    std::shared_ptr<IAlertSink> sink, std::shared_ptr<const IClock> clock)
{
  auto valid = config.Validate();
  if (!isOk(valid)) {
    return Err<std::unique_ptr<PipelineMonitor>>(Error(getError(valid)));
  }

  auto registry = SLO::SLORegistry::FromDefinitions(config.slos);
  if (!isOk(registry)) {
    return Err<std::unique_ptr<PipelineMonitor>>(Error(getError(registry)));
  }

  std::unique_ptr<PipelineMonitor> monitor(new PipelineMonitor(
      config, getValue(std::move(registry)), std::move(store), std::move(sink),
      std::move(clock)));
  return Ok(std::move(monitor));
}

PipelineMonitor::PipelineMonitor(const MonitorConfig &config,
                                 SLO::SLORegistry registry,
                                 std::shared_ptr<IMetricsStore> store,
                                 std::shared_ptr<IAlertSink> sink,
                                 std::shared_ptr<const IClock> clock)
    : fConfig(config),
      fClock(clock ? std::move(clock)
                   : std::shared_ptr<const IClock>(
                         std::make_shared<SystemClock>())),
      fRegistry(std::move(registry)),
      fStore(std::move(store)),
      fSink(std::move(sink)),
      fLogger(Logger::GetLogger("PipelineMonitor"))
{
  fCollector = std::make_unique<Collector::PerformanceCollector>(
      fConfig.buffers, fClock);
  fTracker = std::make_unique<SLO::ViolationTracker>(
      fConfig.violation_capacity, fClock);
  fEvaluator = std::make_unique<SLO::SLOEvaluator>(fRegistry, *fCollector,
                                                   *fTracker);
}

PipelineMonitor::~PipelineMonitor()
{
  Stop();
  if (fThread.joinable()) {
    // Loop outlived stop_timeout; it still references *this
    fThread.join();
  }
}

// === Lifecycle ===

bool PipelineMonitor::Start()
{
  std::lock_guard<std::mutex> lifecycle(fLifecycleMutex);

  if (fRunning) {
    return true;
  }

  if (fLoopActive) {
    fLogger->Warning("Previous monitor loop still executing, not starting");
    return false;
  }

  if (fThread.joinable()) {
    fThread.join();  // Old loop already finished
  }

  {
    std::lock_guard<std::mutex> lock(fLoopMutex);
    fStopRequested = false;
  }
  fLoopActive = true;
  fRunning = true;
  fThread = std::thread(&PipelineMonitor::MonitorLoop, this);

  fLogger->Info("Pipeline monitoring started (interval " +
                std::to_string(fConfig.check_interval.count()) + " ms, " +
                std::to_string(fRegistry.Size()) + " SLOs)");
  return true;
}

bool PipelineMonitor::Stop()
{
  std::lock_guard<std::mutex> lifecycle(fLifecycleMutex);

  fRunning = false;
  if (!fThread.joinable()) {
    return true;
  }

  std::unique_lock<std::mutex> lock(fLoopMutex);
  fStopRequested = true;
  fLoopCondition.notify_all();

  bool finished = fLoopCondition.wait_for(
      lock, fConfig.stop_timeout, [this] { return !fLoopActive.load(); });
  lock.unlock();

  if (!finished) {
    fLogger->Warning("Monitor loop did not stop within " +
                     std::to_string(fConfig.stop_timeout.count()) + " ms");
    return false;
  }

  fThread.join();
  fLogger->Info("Pipeline monitoring stopped");
  return true;
}

MonitorState PipelineMonitor::GetState() const
{
  if (fRunning) {
    return MonitorState::Running;
  }
  if (fLoopActive) {
    return MonitorState::Stopping;
  }
  return MonitorState::Stopped;
}

void PipelineMonitor::MonitorLoop()
{
  int active_loops = ++fActiveLoops;

  while (true) {
    {
      std::lock_guard<std::mutex> lock(fLoopMutex);
      if (fStopRequested) {
        break;
      }
    }

    try {
      std::lock_guard<std::mutex> tick_lock(fTickMutex);
      Tick(active_loops);
    } catch (const std::exception &e) {
      fLogger->Error(std::string("Error in monitoring loop: ") + e.what());
    } catch (...) {
      fLogger->Error("Unknown error in monitoring loop");
    }

    std::unique_lock<std::mutex> lock(fLoopMutex);
    fLoopCondition.wait_for(lock, fConfig.check_interval,
                            [this] { return fStopRequested; });
    if (fStopRequested) {
      break;
    }
  }

  --fActiveLoops;
  {
    std::lock_guard<std::mutex> lock(fLoopMutex);
    fLoopActive = false;
  }
  fLoopCondition.notify_all();
}

// === Ticks ===

TickReport PipelineMonitor::RunOnce()
{
  std::lock_guard<std::mutex> tick_lock(fTickMutex);
  return Tick(fActiveLoops.load());
}

void PipelineMonitor::SetTickObserver(TickObserver observer)
{
  std::lock_guard<std::mutex> tick_lock(fTickMutex);
  fTickObserver = std::move(observer);
}

TickReport PipelineMonitor::Tick(int active_loops)
{
  TickReport report;
  report.tick_number = ++fTickCount;
  report.timestamp = fClock->Now();
  report.active_loops = active_loops;

  auto evaluation = fEvaluator->EvaluateAll(true);
  report.statuses = std::move(evaluation.statuses);
  report.new_violations = std::move(evaluation.new_violations);

  PersistMeasurements(report);
  ForwardAlerts(report);

  if (fTickObserver) {
    fTickObserver(report);
  }
  return report;
}

void PipelineMonitor::PersistMeasurements(TickReport &report)
{
  if (!fStore) {
    return;
  }

  std::vector<LatencyMeasurement> latency;
  std::vector<ThroughputMeasurement> throughput;
  for (auto stage : kAllStages) {
    auto index = StageIndex(stage);
    auto fresh_latency = fCollector->Store().LatencySince(
        stage, fLatencyCursors[index], fConfig.persist_latency_per_stage);
    latency.insert(latency.end(), fresh_latency.begin(), fresh_latency.end());

    auto fresh_throughput = fCollector->Store().ThroughputSince(
        stage, fThroughputCursors[index],
        fConfig.persist_throughput_per_stage);
    throughput.insert(throughput.end(), fresh_throughput.begin(),
                      fresh_throughput.end());
  }

  auto attempt = [this, &report](const char *what, auto &&store_call) {
    try {
      Status status = store_call();
      if (!isOk(status)) {
        fLogger->Error(std::string("Failed to store ") + what + ": " +
                       getError(status).message);
        report.persistence_ok = false;
        return false;
      }
      return true;
    } catch (const std::exception &e) {
      fLogger->Error(std::string("Failed to store ") + what + ": " + e.what());
      report.persistence_ok = false;
      return false;
    } catch (...) {
      fLogger->Error(std::string("Failed to store ") + what +
                     ": unknown exception");
      report.persistence_ok = false;
      return false;
    }
  };

  if (!latency.empty() &&
      attempt("latency measurements",
              [&] { return fStore->StoreLatency(latency); })) {
    report.latency_persisted = latency.size();
  }
  if (!throughput.empty() &&
      attempt("throughput measurements",
              [&] { return fStore->StoreThroughput(throughput); })) {
    report.throughput_persisted = throughput.size();
  }
  if (!report.new_violations.empty()) {
    attempt("SLO violations",
            [&] { return fStore->StoreViolations(report.new_violations); });
  }
}

void PipelineMonitor::ForwardAlerts(TickReport &report)
{
  if (!fSink || !fConfig.alerting.enabled) {
    return;
  }

  const auto cooldown = std::chrono::minutes(fConfig.alerting.cooldown_minutes);
  std::vector<SLOStatus> forward;
  for (const auto &status : report.statuses) {
    if (!IsViolation(status.state)) {
      continue;
    }
    if (cooldown.count() > 0) {
      auto last = fLastAlerted.find(status.slo_name);
      if (last != fLastAlerted.end() &&
          report.timestamp - last->second < cooldown) {
        ++report.alerts_suppressed;
        continue;
      }
    }
    forward.push_back(status);
  }

  if (forward.empty()) {
    return;
  }

  report.alerts_forwarded = forward.size();

  AlertBatch batch = MakeAlertBatch(report.timestamp, std::move(forward));
  try {
    auto status = fSink->SendAlert(batch);
    if (!isOk(status)) {
      fLogger->Error("Failed to send SLO alerts: " + getError(status).message);
      report.alert_ok = false;
    }
  } catch (const std::exception &e) {
    fLogger->Error(std::string("Failed to send SLO alerts: ") + e.what());
    report.alert_ok = false;
  } catch (...) {
    fLogger->Error("Failed to send SLO alerts: unknown exception");
    report.alert_ok = false;
  }

  // Cooldown starts only once a batch was delivered
  if (report.alert_ok) {
    for (const auto &status : batch.violations) {
      fLastAlerted[status.slo_name] = report.timestamp;
    }
  }
}

// === Queries ===

HealthSummary PipelineMonitor::GetHealthSummary() const
{
  HealthSummary summary;
  summary.timestamp = fClock->Now();

  for (const auto &definition : fRegistry.Definitions()) {
    SLOStatus status = fEvaluator->Evaluate(definition);
    switch (status.state) {
      case SLOState::Healthy:
        ++summary.healthy;
        break;
      case SLOState::Warning:
        ++summary.warning;
        break;
      case SLOState::Critical:
        ++summary.critical;
        break;
      case SLOState::Unknown:
        ++summary.unknown;
        break;
    }
    summary.slo_details.push_back(std::move(status));
  }

  summary.total = summary.slo_details.size();
  summary.overall_health_percentage =
      summary.total > 0 ? static_cast<double>(summary.healthy) /
                              static_cast<double>(summary.total) * 100.0
                        : 100.0;

  for (auto stage : kAllStages) {
    auto &perf = summary.stage_performance[StageIndex(stage)];
    perf.stage = stage;
    perf.latency =
        fCollector->GetLatencyStats(stage, fConfig.health_window_minutes);
    perf.throughput =
        fCollector->GetThroughputStats(stage, fConfig.health_window_minutes);
  }
  return summary;
}

std::vector<ViolationRecord> PipelineMonitor::GetRecentViolations(
    size_t limit) const
{
  return fTracker->Recent(limit);
}

}  // namespace PIPEMON::Monitor
