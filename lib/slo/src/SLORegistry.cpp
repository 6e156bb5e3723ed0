#include "pipemon/slo/SLORegistry.hpp"

namespace PIPEMON {
namespace SLO {

Result<SLORegistry>
SLORegistry::FromDefinitions(const std::vector<SLODefinition> &definitions) {
  SLORegistry registry;
  for (const auto &definition : definitions) {
    auto status = registry.Register(definition);
    if (!isOk(status)) {
      return Err<SLORegistry>(Error(getError(status)));
    }
  }
  return Ok(std::move(registry));
}

Status SLORegistry::Register(const SLODefinition &definition) {
  auto valid = definition.Validate();
  if (!isOk(valid)) {
    return valid;
  }
  if (Find(definition.name)) {
    return Status{Error(Error::DUPLICATE_NAME,
                        "SLO '" + definition.name + "' is already registered")};
  }
  definitions_.push_back(definition);
  return OkStatus();
}

std::optional<SLODefinition>
SLORegistry::Find(const std::string &name) const {
  for (const auto &definition : definitions_) {
    if (definition.name == name) {
      return definition;
    }
  }
  return std::nullopt;
}

std::vector<SLODefinition> SLORegistry::DefaultDefinitions() {
  std::vector<SLODefinition> defaults;

  SLODefinition signal;
  signal.name = "signal_generation_latency";
  signal.stage = PipelineStage::SignalGeneration;
  signal.metric_kind = MetricKind::Latency;
  signal.target_value = 1000.0;
  signal.warning_threshold = 1500.0;
  signal.critical_threshold = 3000.0;
  signal.measurement_window_minutes = 15;
  signal.description = "Signal generation should complete within 1 second";
  defaults.push_back(signal);

  SLODefinition execution;
  execution.name = "order_execution_latency";
  execution.stage = PipelineStage::OrderExecution;
  execution.metric_kind = MetricKind::Latency;
  execution.target_value = 2000.0;
  execution.warning_threshold = 5000.0;
  execution.critical_threshold = 10000.0;
  execution.measurement_window_minutes = 15;
  execution.description = "Order execution should complete within 2 seconds";
  defaults.push_back(execution);

  SLODefinition processing;
  processing.name = "data_processing_throughput";
  processing.stage = PipelineStage::DataProcessing;
  processing.metric_kind = MetricKind::Throughput;
  processing.target_value = 100.0;
  processing.warning_threshold = 50.0;
  processing.critical_threshold = 20.0;
  processing.measurement_window_minutes = 5;
  processing.description = "Data processing should handle 100+ items per second";
  defaults.push_back(processing);

  return defaults;
}

} // namespace SLO
} // namespace PIPEMON
