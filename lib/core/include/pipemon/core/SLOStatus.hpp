#ifndef PIPEMON_CORE_SLO_STATUS_HPP
#define PIPEMON_CORE_SLO_STATUS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "pipemon/core/Clock.hpp"

namespace PIPEMON {

enum class SLOState : uint8_t {
  Healthy = 0,
  Warning = 1,
  Critical = 2,
  Unknown = 3
};

inline std::string SLOStateToString(SLOState state) {
  switch (state) {
  case SLOState::Healthy:
    return "healthy";
  case SLOState::Warning:
    return "warning";
  case SLOState::Critical:
    return "critical";
  case SLOState::Unknown:
    return "unknown";
  default:
    return "unknown";
  }
}

inline std::optional<SLOState> SLOStateFromString(const std::string &name) {
  if (name == "healthy")
    return SLOState::Healthy;
  if (name == "warning")
    return SLOState::Warning;
  if (name == "critical")
    return SLOState::Critical;
  if (name == "unknown")
    return SLOState::Unknown;
  return std::nullopt;
}

// Warning and critical results count as violations
inline bool IsViolation(SLOState state) {
  return state == SLOState::Warning || state == SLOState::Critical;
}

/**
 * @brief Result of evaluating one SLO against current statistics
 */
struct SLOStatus {
  std::string slo_name;
  SLOState state = SLOState::Unknown;
  double current_value = 0.0;
  double target_value = 0.0;
  double compliance_percentage = 0.0; // [0, 100]
  uint64_t violations_24h = 0;
};

/**
 * @brief Historical record of a warning or critical evaluation
 */
struct ViolationRecord {
  TimePoint timestamp;
  std::string slo_name;
  SLOState state = SLOState::Warning;
  double current_value = 0.0;
  double target_value = 0.0;
  double compliance_percentage = 0.0;
};

} // namespace PIPEMON

#endif // PIPEMON_CORE_SLO_STATUS_HPP
