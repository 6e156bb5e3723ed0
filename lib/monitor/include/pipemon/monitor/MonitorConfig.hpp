#ifndef PIPEMON_MONITOR_MONITOR_CONFIG_HPP
#define PIPEMON_MONITOR_MONITOR_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pipemon/collector/PerformanceCollector.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/Logger.hpp"
#include "pipemon/core/SLODefinition.hpp"

namespace PIPEMON::Monitor
{

struct StorageConfig {
  std::string path;          ///< Metrics file; empty disables file storage
  bool compression = true;   ///< LZ4-compress frame payloads when smaller
};

struct AlertingConfig {
  bool enabled = true;
  std::string publish_address = "tcp://*:5590";  ///< Empty disables ZMQ
  std::string pattern = "PUB";                   ///< "PUB" or "PUSH"
  bool bind = true;
  int64_t cooldown_minutes = 0;  ///< Per-SLO alert suppression, 0 = off
};

struct LoggingConfig {
  LogLevel level = LogLevel::INFO;
  std::string directory;  ///< Empty logs to stderr
};

/**
 * @brief Everything a PipelineMonitor needs at construction
 *
 * Code-constructed or produced by LoadConfigFromJson/LoadConfigFromFile.
 */
struct MonitorConfig {
  std::chrono::milliseconds check_interval{30000};
  std::chrono::milliseconds stop_timeout{5000};
  int64_t health_window_minutes = 60;
  size_t persist_latency_per_stage = 100;
  size_t persist_throughput_per_stage = 50;

  Collector::CollectorConfig buffers;
  size_t violation_capacity = 1000;

  std::vector<SLODefinition> slos;  ///< Registered in order

  StorageConfig storage;
  AlertingConfig alerting;
  LoggingConfig logging;

  /**
   * @brief Defaults plus the built-in SLO set
   */
  static MonitorConfig Default();

  /**
   * @brief Reject non-positive intervals/capacities and invalid SLOs
   * @return INVALID_CONFIG describing the first problem
   */
  Status Validate() const;
};

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_MONITOR_CONFIG_HPP
