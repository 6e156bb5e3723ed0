#include "pipemon/core/SLODefinition.hpp"

#include <cmath>
#include <sstream>

namespace PIPEMON {

Status SLODefinition::Validate() const {
  auto invalid = [this](const std::string &what) {
    return Status{Error(Error::INVALID_CONFIG, "SLO '" + name + "': " + what)};
  };

  if (name.empty()) {
    return Status{Error(Error::INVALID_CONFIG, "SLO name must not be empty")};
  }
  if (measurement_window_minutes <= 0) {
    return invalid("measurement window must be positive");
  }

  for (double value : {target_value, warning_threshold, critical_threshold}) {
    if (!std::isfinite(value) || value < 0.0) {
      return invalid("thresholds must be finite and non-negative");
    }
  }

  std::ostringstream thresholds;
  thresholds << " (target=" << target_value
             << ", warning=" << warning_threshold
             << ", critical=" << critical_threshold << ")";

  if (metric_kind == MetricKind::Latency) {
    if (!(target_value <= warning_threshold &&
          warning_threshold <= critical_threshold)) {
      return invalid("latency SLO requires target <= warning <= critical" +
                     thresholds.str());
    }
  } else {
    if (!(target_value >= warning_threshold &&
          warning_threshold >= critical_threshold)) {
      return invalid("throughput SLO requires target >= warning >= critical" +
                     thresholds.str());
    }
  }

  return OkStatus();
}

} // namespace PIPEMON
