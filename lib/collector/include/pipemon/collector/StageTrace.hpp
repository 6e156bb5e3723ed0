#ifndef PIPEMON_COLLECTOR_STAGE_TRACE_HPP
#define PIPEMON_COLLECTOR_STAGE_TRACE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/PipelineStage.hpp"

namespace PIPEMON {
namespace Collector {

class PerformanceCollector;

/**
 * @brief Scoped handle around one execution of a pipeline stage
 *
 * Obtained from PerformanceCollector::TraceStage(). Closing the handle
 * (Finish(), destruction, or destruction while an exception unwinds the
 * scope) appends exactly one LatencyMeasurement and removes the
 * active-trace entry. A scope left by an exception, or marked with Fail(),
 * produces success = false.
 *
 * Usage:
 *   {
 *     auto trace = collector.TraceStage(PipelineStage::OrderExecution);
 *     SubmitOrder(order);   // a throw here is recorded, then propagates
 *   }
 */
class StageTrace {
public:
  StageTrace(StageTrace &&other) noexcept;
  StageTrace &operator=(StageTrace &&other) = delete;
  StageTrace(const StageTrace &) = delete;
  StageTrace &operator=(const StageTrace &) = delete;

  ~StageTrace();

  /**
   * @brief Mark this execution failed without throwing
   */
  void Fail(const std::string &error_message);

  /**
   * @brief Close the trace now instead of at scope exit
   *
   * Later calls and the destructor do nothing.
   */
  void Finish();

  const std::string &TraceId() const { return trace_id_; }
  PipelineStage Stage() const { return stage_; }
  bool IsActive() const { return collector_ != nullptr; }

private:
  friend class PerformanceCollector;

  StageTrace(PerformanceCollector *collector, PipelineStage stage,
             uint64_t token, std::string trace_id, TimePoint start_time,
             uint64_t start_ns, std::optional<Metadata> metadata);

  PerformanceCollector *collector_;
  PipelineStage stage_;
  uint64_t token_; // active-trace registry key
  std::string trace_id_;
  TimePoint start_time_;
  uint64_t start_ns_;
  std::optional<Metadata> metadata_;
  std::optional<std::string> error_message_;
  int uncaught_on_entry_;
};

} // namespace Collector
} // namespace PIPEMON

#endif // PIPEMON_COLLECTOR_STAGE_TRACE_HPP
