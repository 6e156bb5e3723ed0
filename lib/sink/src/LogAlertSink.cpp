#include "pipemon/sink/LogAlertSink.hpp"

#include <sstream>

namespace PIPEMON::Sink
{

LogAlertSink::LogAlertSink(const std::string &component)
    : fLogger(Logger::GetLogger(component))
{
}

Status LogAlertSink::SendAlert(const Monitor::AlertBatch &batch)
{
  fLogger->Info(batch.text);
  for (const auto &violation : batch.violations) {
    std::ostringstream oss;
    oss << "SLO violation: " << violation.slo_name << " - "
        << SLOStateToString(violation.state) << " (current "
        << violation.current_value << ", target " << violation.target_value
        << ", compliance " << violation.compliance_percentage << "%)";
    fLogger->Warning(oss.str());
  }
  return OkStatus();
}

}  // namespace PIPEMON::Sink
