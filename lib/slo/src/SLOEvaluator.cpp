#include "pipemon/slo/SLOEvaluator.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <sstream>

namespace PIPEMON {
namespace SLO {

namespace {

double ClampPercentage(double value) {
  if (!(value >= 0.0)) { // also catches NaN
    return 0.0;
  }
  return std::min(100.0, value);
}

} // namespace

SLOEvaluator::SLOEvaluator(const SLORegistry &registry,
                           const Collector::IStatsSource &stats,
                           ViolationTracker &tracker)
    : registry_(registry), stats_(stats), tracker_(tracker),
      logger_(Logger::GetLogger("SLOEvaluator")) {}

SLOState SLOEvaluator::ClassifyLatency(double current,
                                       const SLODefinition &definition) {
  if (current <= definition.target_value) {
    return SLOState::Healthy;
  }
  if (current <= definition.warning_threshold) {
    return SLOState::Warning;
  }
  return SLOState::Critical;
}

SLOState SLOEvaluator::ClassifyThroughput(double current,
                                          const SLODefinition &definition) {
  if (current >= definition.target_value) {
    return SLOState::Healthy;
  }
  if (current >= definition.warning_threshold) {
    return SLOState::Warning;
  }
  return SLOState::Critical;
}

double SLOEvaluator::LatencyCompliance(double current, double target) {
  if (current <= 0.0) {
    return 100.0;
  }
  return ClampPercentage(target / current * 100.0);
}

double SLOEvaluator::ThroughputCompliance(double current, double target) {
  if (target <= 0.0) {
    return 100.0;
  }
  return ClampPercentage(current / target * 100.0);
}

SLOStatus SLOEvaluator::Evaluate(const SLODefinition &definition) const {
  SLOStatus status;
  status.slo_name = definition.name;
  status.target_value = definition.target_value;

  std::optional<double> current;
  try {
    if (definition.metric_kind == MetricKind::Latency) {
      auto stats = stats_.GetLatencyStats(definition.stage,
                                          definition.measurement_window_minutes);
      if (stats) {
        current = stats->p95;
      }
    } else {
      auto stats = stats_.GetThroughputStats(
          definition.stage, definition.measurement_window_minutes);
      if (stats) {
        current = stats->mean_throughput;
      }
    }
  } catch (const std::exception &e) {
    logger_->Error("Failed to evaluate SLO " + definition.name + ": " +
                   e.what());
    return status; // Unknown, current 0, compliance 0
  } catch (...) {
    logger_->Error("Failed to evaluate SLO " + definition.name +
                   ": unknown exception");
    return status;
  }

  if (!current) {
    logger_->Debug("No data for SLO " + definition.name + " in the last " +
                   std::to_string(definition.measurement_window_minutes) +
                   " minutes");
    return status;
  }

  status.current_value = *current;
  if (definition.metric_kind == MetricKind::Latency) {
    status.state = ClassifyLatency(*current, definition);
    status.compliance_percentage =
        LatencyCompliance(*current, definition.target_value);
  } else {
    status.state = ClassifyThroughput(*current, definition);
    status.compliance_percentage =
        ThroughputCompliance(*current, definition.target_value);
  }
  status.violations_24h = tracker_.CountInLast24h(definition.name);
  return status;
}

EvaluationResult SLOEvaluator::EvaluateAll(bool record_violations) {
  EvaluationResult result;
  result.statuses.reserve(registry_.Size());

  for (const auto &definition : registry_.Definitions()) {
    SLOStatus status = Evaluate(definition);

    if (record_violations && IsViolation(status.state)) {
      std::ostringstream oss;
      oss << "SLO violation: " << definition.name << " is "
          << SLOStateToString(status.state) << " (current "
          << status.current_value << ", target " << status.target_value
          << ")";
      logger_->Warning(oss.str());
      result.new_violations.push_back(tracker_.Record(definition, status));
    }
    result.statuses.push_back(std::move(status));
  }
  return result;
}

} // namespace SLO
} // namespace PIPEMON
