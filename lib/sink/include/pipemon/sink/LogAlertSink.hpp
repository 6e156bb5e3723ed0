#pragma once

#include <memory>
#include <string>

#include "pipemon/core/Logger.hpp"
#include "pipemon/monitor/AlertSink.hpp"

namespace PIPEMON::Sink
{

/**
 * @brief IAlertSink writing alerts to the component log
 *
 * The text summary goes out at INFO, followed by one WARNING line per
 * violation.
 */
class LogAlertSink : public Monitor::IAlertSink
{
 public:
  explicit LogAlertSink(const std::string &component = "SLOAlerts");

  Status SendAlert(const Monitor::AlertBatch &batch) override;

 private:
  std::shared_ptr<Logger> fLogger;
};

}  // namespace PIPEMON::Sink
