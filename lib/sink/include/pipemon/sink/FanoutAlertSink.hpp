#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "pipemon/monitor/AlertSink.hpp"

namespace PIPEMON::Sink
{

/**
 * @brief Forwards each batch to several sinks
 *
 * Every sink is tried; the first failure is returned.
 */
class FanoutAlertSink : public Monitor::IAlertSink
{
 public:
  FanoutAlertSink() = default;
  explicit FanoutAlertSink(
      std::vector<std::shared_ptr<Monitor::IAlertSink>> sinks);

  void AddSink(std::shared_ptr<Monitor::IAlertSink> sink);
  size_t GetSinkCount() const { return fSinks.size(); }

  Status SendAlert(const Monitor::AlertBatch &batch) override;

 private:
  std::vector<std::shared_ptr<Monitor::IAlertSink>> fSinks;
};

}  // namespace PIPEMON::Sink
