#ifndef PIPEMON_MONITOR_ALERT_SINK_HPP
#define PIPEMON_MONITOR_ALERT_SINK_HPP

#include <string>
#include <vector>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Error.hpp"
#include "pipemon/core/SLOStatus.hpp"

namespace PIPEMON::Monitor
{

/**
 * @brief Warning/critical statuses of one tick, delivered together
 */
struct AlertBatch {
  TimePoint timestamp;
  std::vector<SLOStatus> violations;
  std::string text;  ///< Human-readable summary, see FormatAlertText()
};

/**
 * @brief Human-readable alert summary
 *
 *   SLO Violations Detected
 *   Time: 2026-10-19 12:00:00
 *   Violations: 1
 *
 *   - order_execution_latency:
 *     Status: CRITICAL
 *     Current: 12000.00
 *     Target: 2000.00
 *     Compliance: 16.7%
 */
std::string FormatAlertText(TimePoint timestamp,
                            const std::vector<SLOStatus> &violations);

/**
 * @brief Batch with text filled in
 */
AlertBatch MakeAlertBatch(TimePoint timestamp,
                          std::vector<SLOStatus> violations);

/**
 * @brief Outbound alert delivery
 *
 * Fire-and-forget: the monitor logs a failed Status and moves on.
 */
class IAlertSink
{
 public:
  virtual ~IAlertSink() = default;

  virtual Status SendAlert(const AlertBatch &batch) = 0;
};

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_ALERT_SINK_HPP
