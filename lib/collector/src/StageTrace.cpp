#include "pipemon/collector/StageTrace.hpp"
#include "pipemon/collector/PerformanceCollector.hpp"

#include <exception>
#include <utility>

namespace PIPEMON {
namespace Collector {

StageTrace::StageTrace(PerformanceCollector *collector, PipelineStage stage,
                       uint64_t token, std::string trace_id,
                       TimePoint start_time, uint64_t start_ns,
                       std::optional<Metadata> metadata)
    : collector_(collector), stage_(stage), token_(token),
      trace_id_(std::move(trace_id)),
      start_time_(start_time), start_ns_(start_ns),
      metadata_(std::move(metadata)),
      uncaught_on_entry_(std::uncaught_exceptions()) {}

StageTrace::StageTrace(StageTrace &&other) noexcept
    : collector_(std::exchange(other.collector_, nullptr)),
      stage_(other.stage_), token_(other.token_),
      trace_id_(std::move(other.trace_id_)),
      start_time_(other.start_time_), start_ns_(other.start_ns_),
      metadata_(std::move(other.metadata_)),
      error_message_(std::move(other.error_message_)),
      uncaught_on_entry_(other.uncaught_on_entry_) {}

StageTrace::~StageTrace() {
  if (collector_ == nullptr) {
    return;
  }
  if (!error_message_ && std::uncaught_exceptions() > uncaught_on_entry_) {
    error_message_ = "exception propagated through traced scope";
  }
  Finish();
}

void StageTrace::Fail(const std::string &error_message) {
  error_message_ = error_message;
}

void StageTrace::Finish() {
  if (collector_ == nullptr) {
    return;
  }
  PerformanceCollector *collector = collector_;
  collector_ = nullptr;

  LatencyMeasurement m;
  m.stage = stage_;
  m.start_time = start_time_;
  m.success = !error_message_.has_value();
  m.error_message = std::move(error_message_);
  m.metadata = std::move(metadata_);
  collector->CompleteTrace(token_, trace_id_, start_ns_, std::move(m));
}

} // namespace Collector
} // namespace PIPEMON
