#ifndef PIPEMON_MONITOR_RECORD_CODEC_HPP
#define PIPEMON_MONITOR_RECORD_CODEC_HPP

#include <nlohmann/json.hpp>

#include "pipemon/collector/Statistics.hpp"
#include "pipemon/core/Measurement.hpp"
#include "pipemon/core/PipelineStage.hpp"
#include "pipemon/core/SLODefinition.hpp"
#include "pipemon/core/SLOStatus.hpp"
#include "pipemon/monitor/AlertSink.hpp"
#include "pipemon/monitor/HealthSummary.hpp"

// JSON projections of monitor records.
//
// Timestamps are ISO-8601 UTC strings with microseconds, enums travel as
// their wire names. from_json throws nlohmann::json::exception for wrong
// types or missing keys and std::invalid_argument for unknown enum names
// or unparsable timestamps.

namespace PIPEMON
{

void to_json(nlohmann::json &j, PipelineStage stage);
void from_json(const nlohmann::json &j, PipelineStage &stage);

void to_json(nlohmann::json &j, MetricKind kind);
void from_json(const nlohmann::json &j, MetricKind &kind);

void to_json(nlohmann::json &j, SLOState state);
void from_json(const nlohmann::json &j, SLOState &state);

void to_json(nlohmann::json &j, const LatencyMeasurement &m);
void from_json(const nlohmann::json &j, LatencyMeasurement &m);

void to_json(nlohmann::json &j, const ThroughputMeasurement &m);
void from_json(const nlohmann::json &j, ThroughputMeasurement &m);

void to_json(nlohmann::json &j, const SLODefinition &d);
void from_json(const nlohmann::json &j, SLODefinition &d);

void to_json(nlohmann::json &j, const SLOStatus &s);
void from_json(const nlohmann::json &j, SLOStatus &s);

void to_json(nlohmann::json &j, const ViolationRecord &v);
void from_json(const nlohmann::json &j, ViolationRecord &v);

/**
 * @brief Read an ISO-8601 timestamp field
 * @throws std::invalid_argument if the string does not parse
 */
TimePoint TimestampFromJson(const nlohmann::json &j);

namespace Collector
{
void to_json(nlohmann::json &j, const LatencyStats &s);
void to_json(nlohmann::json &j, const ThroughputStats &s);
}  // namespace Collector

namespace Monitor
{
void to_json(nlohmann::json &j, const HealthSummary &h);

/// Wire form: {"alert_type":"slo_violation","timestamp",...,"violations",[...],"text"}
void to_json(nlohmann::json &j, const AlertBatch &b);
void from_json(const nlohmann::json &j, AlertBatch &b);
}  // namespace Monitor

}  // namespace PIPEMON

#endif  // PIPEMON_MONITOR_RECORD_CODEC_HPP
