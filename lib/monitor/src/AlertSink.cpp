#include "pipemon/monitor/AlertSink.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace PIPEMON::Monitor
{

std::string FormatAlertText(TimePoint timestamp,
                            const std::vector<SLOStatus> &violations)
{
  auto time_t_value = WallClock::to_time_t(timestamp);
  std::tm tm_utc{};
  gmtime_r(&time_t_value, &tm_utc);

  std::ostringstream oss;
  oss << "SLO Violations Detected\n";
  oss << "Time: " << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << " UTC\n";
  oss << "Violations: " << violations.size() << "\n";

  oss << std::fixed;
  for (const auto &violation : violations) {
    std::string state = SLOStateToString(violation.state);
    std::transform(state.begin(), state.end(), state.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    oss << "\n- " << violation.slo_name << ":\n";
    oss << "  Status: " << state << "\n";
    oss << std::setprecision(2) << "  Current: " << violation.current_value
        << "\n";
    oss << "  Target: " << violation.target_value << "\n";
    oss << std::setprecision(1)
        << "  Compliance: " << violation.compliance_percentage << "%\n";
  }
  return oss.str();
}

AlertBatch MakeAlertBatch(TimePoint timestamp,
                          std::vector<SLOStatus> violations)
{
  AlertBatch batch;
  batch.timestamp = timestamp;
  batch.text = FormatAlertText(timestamp, violations);
  batch.violations = std::move(violations);
  return batch;
}

}  // namespace PIPEMON::Monitor
