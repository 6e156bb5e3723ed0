#include "pipemon/sink/FanoutAlertSink.hpp"

#include <exception>
#include <optional>
#include <string>

namespace PIPEMON::Sink
{

FanoutAlertSink::FanoutAlertSink(
    std::vector<std::shared_ptr<Monitor::IAlertSink>> sinks)
    : fSinks(std::move(sinks))
{
}

void FanoutAlertSink::AddSink(std::shared_ptr<Monitor::IAlertSink> sink)
{
  if (sink) {
    fSinks.push_back(std::move(sink));
  }
}

Status FanoutAlertSink::SendAlert(const Monitor::AlertBatch &batch)
{
  std::optional<Error> first_failure;

  for (auto &sink : fSinks) {
    if (!sink) {
      continue;
    }
    try {
      auto status = sink->SendAlert(batch);
      if (!isOk(status) && !first_failure) {
        first_failure = getError(status);
      }
    } catch (const std::exception &e) {
      if (!first_failure) {
        first_failure = Error(Error::TRANSPORT_ERROR,
                              std::string("Alert sink threw: ") + e.what());
      }
    } catch (...) {
      if (!first_failure) {
        first_failure =
            Error(Error::TRANSPORT_ERROR, "Alert sink threw unknown exception");
      }
    }
  }

  if (first_failure) {
    return Status{*first_failure};
  }
  return OkStatus();
}

}  // namespace PIPEMON::Sink
