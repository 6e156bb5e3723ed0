#include "pipemon/monitor/MonitorConfig.hpp"

#include <set>

#include "pipemon/slo/SLORegistry.hpp"

namespace PIPEMON::Monitor
{

MonitorConfig MonitorConfig::Default()
{
  MonitorConfig config;
  config.slos = SLO::SLORegistry::DefaultDefinitions();
  return config;
}

Status MonitorConfig::Validate() const
{
  auto invalid = [](const std::string &what) {
    return Status{Error(Error::INVALID_CONFIG, what)};
  };

  if (check_interval.count() <= 0) {
    return invalid("check interval must be positive");
  }
  if (stop_timeout.count() <= 0) {
    return invalid("stop timeout must be positive");
  }
  if (health_window_minutes <= 0) {
    return invalid("health window must be positive");
  }
  if (buffers.latency_capacity == 0 || buffers.throughput_capacity == 0 ||
      violation_capacity == 0) {
    return invalid("buffer capacities must be positive");
  }
  if (alerting.cooldown_minutes < 0) {
    return invalid("alert cooldown must not be negative");
  }
  if (alerting.pattern != "PUB" && alerting.pattern != "PUSH") {
    return invalid("alert pattern must be PUB or PUSH, got '" +
                   alerting.pattern + "'");
  }

  std::set<std::string> names;
  for (const auto &slo : slos) {
    auto status = slo.Validate();
    if (!isOk(status)) {
      return status;
    }
    if (!names.insert(slo.name).second) {
      return invalid("duplicate SLO name '" + slo.name + "'");
    }
  }
  return OkStatus();
}

}  // namespace PIPEMON::Monitor
