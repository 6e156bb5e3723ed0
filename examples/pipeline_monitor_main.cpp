/**
 * @file pipeline_monitor_main.cpp
 * @brief PipeMon demonstration executable
 *
 * Drives a simulated trading pipeline through every stage, traces each
 * stage with the collector and runs the SLO monitor in the background.
 * Violations are published on the alert channel and measurements are
 * appended to the metrics file.
 *
 * Usage:
 *   pipemon_demo [options]
 *
 * Options:
 *   -c, --config <file>      JSON configuration (default: built-in defaults)
 *   -d, --duration <sec>     Run time in seconds, 0 = until Ctrl+C (default: 60)
 *   -i, --interval <sec>     SLO check interval, overrides the config
 *   -p, --publish <address>  Alert publish address, overrides the config
 *   -s, --store <file>       Metrics file, overrides the config
 *   --slow                   Simulate a degraded signal generator
 *   -h, --help               Show this help message
 *
 * Example:
 *   # Run for two minutes with a 5 second check interval
 *   pipemon_demo -c config/pipeline_monitor.json -d 120 -i 5
 *
 *   # Watch the alerts from another terminal
 *   pipemon_alert_listener -a tcp://localhost:5590
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include "pipemon/pipemon.hpp"

using namespace PIPEMON;

static std::atomic<bool> g_running{true};

void signalHandler(int signum)
{
  (void)signum;
  g_running = false;
}

void printUsage(const char *program)
{
  std::cout << "PipeMon - Pipeline Performance and SLO Monitor\n\n";
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>      JSON configuration file\n";
  std::cout << "  -d, --duration <sec>     Run time in seconds, 0 = until Ctrl+C (default: 60)\n";
  std::cout << "  -i, --interval <sec>     SLO check interval in seconds\n";
  std::cout << "  -p, --publish <address>  Alert publish address (e.g. tcp://*:5590)\n";
  std::cout << "  -s, --store <file>       Metrics file path\n";
  std::cout << "  --slow                   Simulate a degraded signal generator\n";
  std::cout << "  -h, --help               Show this help message\n\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c config/pipeline_monitor.json -d 120 -i 5\n";
}

namespace
{

/**
 * @brief Stand-in for one pass through the trading pipeline
 */
class SimulatedPipeline
{
 public:
  SimulatedPipeline(Collector::PerformanceCollector &collector, bool slow)
      : fCollector(collector), fSlow(slow), fRandom(std::random_device{}())
  {
  }

  void RunCycle(uint64_t cycle)
  {
    std::string id = "cycle_" + std::to_string(cycle);

    Work(PipelineStage::DataIngestion, id, 2, 10);
    Work(PipelineStage::DataProcessing, id, 5, 20);
    Work(PipelineStage::FeatureExtraction, id, 5, 15);
    Work(PipelineStage::SignalGeneration, id, fSlow ? 1200 : 20,
         fSlow ? 2500 : 80);
    Work(PipelineStage::RiskValidation, id, 1, 5);

    // One in twenty orders is rejected by the venue
    try {
      fCollector.Trace(
          PipelineStage::OrderExecution,
          [&] {
            Sleep(10, 60);
            if (Uniform(0, 19) == 0) {
              throw std::runtime_error("order rejected by venue");
            }
          },
          id + "_execution", Metadata{{"venue", "SIM"}});
    } catch (const std::runtime_error &) {
      // Recorded as a failed measurement
    }

    Work(PipelineStage::TradeConfirmation, id, 1, 5);
    Work(PipelineStage::PortfolioUpdate, id, 1, 3);
  }

  void ReportThroughput(int64_t window_seconds)
  {
    auto items = static_cast<int64_t>(Uniform(150, 400));
    auto errors = static_cast<int64_t>(Uniform(0, 3));
    auto status = fCollector.RecordThroughput(PipelineStage::DataProcessing,
                                              items, window_seconds, errors);
    if (!isOk(status)) {
      std::cerr << "RecordThroughput failed: " << getError(status).message
                << std::endl;
    }
  }

 private:
  void Work(PipelineStage stage, const std::string &id, int min_ms, int max_ms)
  {
    auto trace = fCollector.TraceStage(
        stage, id + "_" + PipelineStageToString(stage));
    Sleep(min_ms, max_ms);
  }

  void Sleep(int min_ms, int max_ms)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(Uniform(min_ms, max_ms)));
  }

  int Uniform(int lo, int hi)
  {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(fRandom);
  }

  Collector::PerformanceCollector &fCollector;
  bool fSlow;
  std::mt19937 fRandom;
};

}  // namespace

int main(int argc, char *argv[])
{
  std::string config_path;
  int duration_seconds = 60;
  double interval_seconds = 0.0;
  std::string publish_address;
  std::string store_path;
  bool slow = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      }
    } else if (arg == "-d" || arg == "--duration") {
      if (i + 1 < argc) {
        duration_seconds = std::stoi(argv[++i]);
      }
    } else if (arg == "-i" || arg == "--interval") {
      if (i + 1 < argc) {
        interval_seconds = std::stod(argv[++i]);
      }
    } else if (arg == "-p" || arg == "--publish") {
      if (i + 1 < argc) {
        publish_address = argv[++i];
      }
    } else if (arg == "-s" || arg == "--store") {
      if (i + 1 < argc) {
        store_path = argv[++i];
      }
    } else if (arg == "--slow") {
      slow = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  // Load configuration
  Monitor::MonitorConfig config = Monitor::MonitorConfig::Default();
  if (!config_path.empty()) {
    auto loaded = Monitor::LoadConfigFromFile(config_path);
    if (!isOk(loaded)) {
      const auto &error = getError(loaded);
      std::cerr << "ERROR: " << Error::codeToString(error.code) << ": "
                << error.message << std::endl;
      return 1;
    }
    config = getValue(std::move(loaded));
  }
  if (interval_seconds > 0.0) {
    config.check_interval = std::chrono::milliseconds(
        static_cast<int64_t>(interval_seconds * 1000.0));
  }
  if (!publish_address.empty()) {
    config.alerting.publish_address = publish_address;
  }
  if (!store_path.empty()) {
    config.storage.path = store_path;
  }

  if (!Logger::Initialize(config.logging.directory, config.logging.level)) {
    std::cerr << "ERROR: Cannot open log directory "
              << config.logging.directory << std::endl;
    return 1;
  }

  // Print configuration
  std::cout << "=== PipeMon " << Version::STRING << " ===" << std::endl;
  std::cout << "Check interval:  " << config.check_interval.count() << " ms"
            << std::endl;
  std::cout << "SLOs:            " << config.slos.size() << std::endl;
  std::cout << "Metrics file:    "
            << (config.storage.path.empty() ? "(disabled)" : config.storage.path)
            << std::endl;
  std::cout << "Alerts:          "
            << (config.alerting.enabled ? config.alerting.publish_address
                                        : std::string("(disabled)"))
            << std::endl;
  std::cout << std::endl;

  // Sinks
  std::shared_ptr<Monitor::IMetricsStore> store;
  if (!config.storage.path.empty()) {
    store = std::make_shared<Sink::FileMetricsStore>(config.storage.path,
                                                     config.storage.compression);
  }

  std::shared_ptr<Monitor::IAlertSink> sink;
  std::shared_ptr<Sink::ZMQAlertPublisher> publisher;
  if (config.alerting.enabled) {
    auto fanout = std::make_shared<Sink::FanoutAlertSink>();
    fanout->AddSink(std::make_shared<Sink::LogAlertSink>());

    if (!config.alerting.publish_address.empty()) {
      Sink::AlertChannelConfig channel;
      channel.address = config.alerting.publish_address;
      channel.pattern = config.alerting.pattern;
      channel.bind = config.alerting.bind;

      publisher = std::make_shared<Sink::ZMQAlertPublisher>();
      if (!publisher->Configure(channel) || !publisher->Connect()) {
        std::cerr << "ERROR: Failed to open alert channel "
                  << channel.address << std::endl;
        return 1;
      }
      fanout->AddSink(publisher);
    }
    sink = fanout;
  }

  auto created = Monitor::PipelineMonitor::Create(config, store, sink);
  if (!isOk(created)) {
    std::cerr << "ERROR: " << getError(created).message << std::endl;
    return 1;
  }
  std::unique_ptr<Monitor::PipelineMonitor> monitor =
      getValue(std::move(created));

  monitor->SetTickObserver([](const Monitor::TickReport &report) {
    std::cout << "[Tick " << report.tick_number << "] "
              << report.statuses.size() << " SLOs, "
              << report.new_violations.size() << " violations, "
              << report.latency_persisted + report.throughput_persisted
              << " measurements persisted" << std::endl;
  });

  // Setup signal handlers
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  if (!monitor->Start()) {
    std::cerr << "ERROR: Failed to start monitor" << std::endl;
    return 1;
  }

  std::cout << "*** Monitor running ***" << std::endl;
  std::cout << "Press Ctrl+C to stop.\n" << std::endl;

  SimulatedPipeline pipeline(monitor->GetCollector(), slow);
  auto started = std::chrono::steady_clock::now();
  auto last_report = started;
  uint64_t cycle = 0;

  while (g_running) {
    pipeline.RunCycle(++cycle);

    auto now = std::chrono::steady_clock::now();
    if (now - last_report >= std::chrono::seconds(1)) {
      pipeline.ReportThroughput(1);
      last_report = now;
    }
    if (duration_seconds > 0 &&
        now - started >= std::chrono::seconds(duration_seconds)) {
      break;
    }
  }

  // Cleanup
  std::cout << "Stopping monitor..." << std::endl;
  if (!monitor->Stop()) {
    std::cerr << "WARNING: monitor loop did not stop within "
              << config.stop_timeout.count() << " ms" << std::endl;
  }

  std::cout << "\n=== Health Summary ===" << std::endl;
  nlohmann::json summary = monitor->GetHealthSummary();
  std::cout << summary.dump(2) << std::endl;

  std::cout << "\n=== Final Statistics ===" << std::endl;
  std::cout << "Pipeline cycles:  " << cycle << std::endl;
  std::cout << "SLO checks:       " << monitor->GetTickCount() << std::endl;
  std::cout << "Violations kept:  " << monitor->GetViolationTracker().Size()
            << std::endl;
  if (publisher) {
    std::cout << "Alerts published: " << publisher->GetSentCount() << std::endl;
  }

  return 0;
}
