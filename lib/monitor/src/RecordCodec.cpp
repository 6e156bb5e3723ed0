#include "pipemon/monitor/RecordCodec.hpp"

#include <stdexcept>

namespace PIPEMON
{

using nlohmann::json;

TimePoint TimestampFromJson(const json &j)
{
  auto text = j.get<std::string>();
  auto parsed = parseIso8601(text);
  if (!parsed) {
    throw std::invalid_argument("invalid timestamp: " + text);
  }
  return *parsed;
}

void to_json(json &j, PipelineStage stage)
{
  j = PipelineStageToString(stage);
}

void from_json(const json &j, PipelineStage &stage)
{
  auto name = j.get<std::string>();
  auto parsed = PipelineStageFromString(name);
  if (!parsed) {
    throw std::invalid_argument("unknown pipeline stage: " + name);
  }
  stage = *parsed;
}

void to_json(json &j, MetricKind kind) { j = MetricKindToString(kind); }

void from_json(const json &j, MetricKind &kind)
{
  auto name = j.get<std::string>();
  auto parsed = MetricKindFromString(name);
  if (!parsed) {
    throw std::invalid_argument("unknown metric type: " + name);
  }
  kind = *parsed;
}

void to_json(json &j, SLOState state) { j = SLOStateToString(state); }

void from_json(const json &j, SLOState &state)
{
  auto name = j.get<std::string>();
  auto parsed = SLOStateFromString(name);
  if (!parsed) {
    throw std::invalid_argument("unknown SLO status: " + name);
  }
  state = *parsed;
}

void to_json(json &j, const LatencyMeasurement &m)
{
  j = json{{"stage", m.stage},
           {"start_time", formatIso8601(m.start_time)},
           {"end_time", formatIso8601(m.end_time)},
           {"duration_ms", m.duration_ms},
           {"success", m.success}};
  j["error_message"] = m.error_message ? json(*m.error_message) : json(nullptr);
  j["metadata"] = m.metadata ? json(*m.metadata) : json(nullptr);
}

void from_json(const json &j, LatencyMeasurement &m)
{
  m.stage = j.at("stage").get<PipelineStage>();
  m.start_time = TimestampFromJson(j.at("start_time"));
  m.end_time = TimestampFromJson(j.at("end_time"));
  m.duration_ms = j.at("duration_ms").get<double>();
  m.success = j.at("success").get<bool>();

  m.error_message.reset();
  if (j.contains("error_message") && !j["error_message"].is_null()) {
    m.error_message = j["error_message"].get<std::string>();
  }
  m.metadata.reset();
  if (j.contains("metadata") && !j["metadata"].is_null()) {
    m.metadata = j["metadata"].get<Metadata>();
  }
}

void to_json(json &j, const ThroughputMeasurement &m)
{
  j = json{{"stage", m.stage},
           {"timestamp", formatIso8601(m.timestamp)},
           {"items_processed", m.items_processed},
           {"window_seconds", m.window_seconds},
           {"throughput_per_second", m.throughput_per_second},
           {"errors", m.errors}};
}

void from_json(const json &j, ThroughputMeasurement &m)
{
  m.stage = j.at("stage").get<PipelineStage>();
  m.timestamp = TimestampFromJson(j.at("timestamp"));
  m.items_processed = j.at("items_processed").get<int64_t>();
  m.window_seconds = j.at("window_seconds").get<int64_t>();
  m.throughput_per_second = j.at("throughput_per_second").get<double>();
  m.errors = j.at("errors").get<int64_t>();
}

void to_json(json &j, const SLODefinition &d)
{
  j = json{{"name", d.name},
           {"stage", d.stage},
           {"metric_type", d.metric_kind},
           {"target_value", d.target_value},
           {"warning_threshold", d.warning_threshold},
           {"critical_threshold", d.critical_threshold},
           {"measurement_window_minutes", d.measurement_window_minutes},
           {"description", d.description}};
}

void from_json(const json &j, SLODefinition &d)
{
  d.name = j.at("name").get<std::string>();
  d.stage = j.at("stage").get<PipelineStage>();
  d.metric_kind = j.at("metric_type").get<MetricKind>();
  d.target_value = j.at("target_value").get<double>();
  d.warning_threshold = j.at("warning_threshold").get<double>();
  d.critical_threshold = j.at("critical_threshold").get<double>();
  d.measurement_window_minutes =
      j.value("measurement_window_minutes", int64_t{15});
  d.description = j.value("description", std::string());
}

void to_json(json &j, const SLOStatus &s)
{
  j = json{{"slo_name", s.slo_name},
           {"status", s.state},
           {"current_value", s.current_value},
           {"target_value", s.target_value},
           {"compliance_percentage", s.compliance_percentage},
           {"violation_count_24h", s.violations_24h}};
}

void from_json(const json &j, SLOStatus &s)
{
  s.slo_name = j.at("slo_name").get<std::string>();
  s.state = j.at("status").get<SLOState>();
  s.current_value = j.at("current_value").get<double>();
  s.target_value = j.at("target_value").get<double>();
  s.compliance_percentage = j.at("compliance_percentage").get<double>();
  s.violations_24h = j.value("violation_count_24h", uint64_t{0});
}

void to_json(json &j, const ViolationRecord &v)
{
  j = json{{"timestamp", formatIso8601(v.timestamp)},
           {"slo_name", v.slo_name},
           {"status", v.state},
           {"current_value", v.current_value},
           {"target_value", v.target_value},
           {"compliance_percentage", v.compliance_percentage}};
}

void from_json(const json &j, ViolationRecord &v)
{
  v.timestamp = TimestampFromJson(j.at("timestamp"));
  v.slo_name = j.at("slo_name").get<std::string>();
  v.state = j.at("status").get<SLOState>();
  v.current_value = j.at("current_value").get<double>();
  v.target_value = j.at("target_value").get<double>();
  v.compliance_percentage = j.at("compliance_percentage").get<double>();
}

namespace Collector
{

void to_json(json &j, const LatencyStats &s)
{
  j = json{{"count", s.count},   {"mean_ms", s.mean},
           {"median_ms", s.median}, {"p95_ms", s.p95},
           {"p99_ms", s.p99},     {"min_ms", s.min},
           {"max_ms", s.max},     {"success_rate", s.success_rate}};
}

void to_json(json &j, const ThroughputStats &s)
{
  j = json{{"count", s.count},
           {"mean_throughput", s.mean_throughput},
           {"max_throughput", s.max_throughput},
           {"total_items", s.total_items},
           {"total_errors", s.total_errors},
           {"error_rate", s.error_rate}};
}

}  // namespace Collector

namespace Monitor
{

void to_json(json &j, const HealthSummary &h)
{
  json stages = json::object();
  for (const auto &perf : h.stage_performance) {
    json entry;
    entry["latency"] = perf.latency ? json(*perf.latency) : json(nullptr);
    entry["throughput"] =
        perf.throughput ? json(*perf.throughput) : json(nullptr);
    stages[PipelineStageToString(perf.stage)] = entry;
  }

  j = json{{"timestamp", formatIso8601(h.timestamp)},
           {"overall_health_percentage", h.overall_health_percentage},
           {"slo_summary",
            {{"total", h.total},
             {"healthy", h.healthy},
             {"warning", h.warning},
             {"critical", h.critical},
             {"unknown", h.unknown}}},
           {"slo_details", h.slo_details},
           {"stage_performance", stages}};
}

void to_json(json &j, const AlertBatch &b)
{
  j = json{{"alert_type", "slo_violation"},
           {"timestamp", formatIso8601(b.timestamp)},
           {"violations", b.violations},
           {"text", b.text}};
}

void from_json(const json &j, AlertBatch &b)
{
  b.timestamp = TimestampFromJson(j.at("timestamp"));
  b.violations = j.at("violations").get<std::vector<SLOStatus>>();
  b.text = j.value("text", std::string());
}

}  // namespace Monitor

}  // namespace PIPEMON
