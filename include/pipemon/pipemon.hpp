#ifndef PIPEMON_HPP
#define PIPEMON_HPP

/**
 * @file pipemon.hpp
 * @brief Main umbrella header for the PipeMon library
 *
 * This header provides access to all PipeMon components:
 * - Core records, clock, error and logging utilities
 * - Collector for stage tracing, throughput reporting and statistics
 * - SLO registry, evaluator and violation tracker
 * - Pipeline monitor, configuration and record codec
 * - Sinks for alert delivery and metrics persistence
 *
 * Usage:
 *   #include <pipemon/pipemon.hpp>
 *
 * For selective inclusion, use individual headers:
 * - For tracing only: #include "pipemon/collector/PerformanceCollector.hpp"
 * - For the monitor: #include "pipemon/monitor/PipelineMonitor.hpp"
 * - For ZeroMQ alerts: #include "pipemon/sink/ZMQAlertPublisher.hpp"
 */

// ============================================================================
// CORE LIBRARY HEADERS
// ============================================================================

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/Logger.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/PipelineStage.hpp"
#include "pipemon/core/SLODefinition.hpp"
#include "pipemon/core/SLOStatus.hpp"

// ============================================================================
// COLLECTOR LIBRARY HEADERS
// ============================================================================

#include "pipemon/collector/MeasurementStore.hpp"
#include "pipemon/collector/PerformanceCollector.hpp"
#include "pipemon/collector/StageTrace.hpp"
#include "pipemon/collector/Statistics.hpp"

// ============================================================================
// SLO LIBRARY HEADERS
// ============================================================================

#include "pipemon/slo/SLOEvaluator.hpp"
#include "pipemon/slo/SLORegistry.hpp"
#include "pipemon/slo/ViolationTracker.hpp"

// ============================================================================
// MONITOR LIBRARY HEADERS
// ============================================================================

#include "pipemon/monitor/AlertSink.hpp"
#include "pipemon/monitor/ConfigLoader.hpp"
#include "pipemon/monitor/HealthSummary.hpp"
#include "pipemon/monitor/MetricsStore.hpp"
#include "pipemon/monitor/MonitorConfig.hpp"
#include "pipemon/monitor/PipelineMonitor.hpp"
#include "pipemon/monitor/RecordCodec.hpp"

// ============================================================================
// SINK LIBRARY HEADERS
// ============================================================================

#include "pipemon/sink/FanoutAlertSink.hpp"
#include "pipemon/sink/FileMetricsStore.hpp"
#include "pipemon/sink/FrameProtocol.hpp"
#include "pipemon/sink/LogAlertSink.hpp"
#include "pipemon/sink/MetricsFrameCodec.hpp"
#include "pipemon/sink/ZMQAlertPublisher.hpp"

namespace PIPEMON {

/**
 * @brief Library version information
 */
struct Version {
  static constexpr int MAJOR = 1;
  static constexpr int MINOR = 0;
  static constexpr int PATCH = 0;

  static constexpr const char *STRING = "1.0.0";
};

} // namespace PIPEMON

#endif // PIPEMON_HPP
