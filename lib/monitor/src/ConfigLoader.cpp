#include "pipemon/monitor/ConfigLoader.hpp"

#include <cerrno>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "pipemon/monitor/RecordCodec.hpp"
#include "pipemon/slo/SLORegistry.hpp"

namespace PIPEMON::Monitor
{

using nlohmann::json;

namespace
{

const json *Section(const json &document, const char *name)
{
  if (!document.contains(name)) {
    return nullptr;
  }
  const json &section = document.at(name);
  if (!section.is_object()) {
    throw std::invalid_argument(std::string("section '") + name +
                                "' must be an object");
  }
  return &section;
}

// Upper bound for *_seconds keys (one week)
constexpr int64_t kMaxIntervalSeconds = 7 * 24 * 3600;

std::chrono::milliseconds SecondsField(const json &section, const char *key,
                                       std::chrono::milliseconds fallback)
{
  if (!section.contains(key)) {
    return fallback;
  }
  const json &value = section.at(key);
  if (!value.is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a number");
  }
  double seconds = value.get<double>();
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    throw std::invalid_argument(std::string(key) + " must be positive");
  }
  if (seconds > kMaxIntervalSeconds) {
    throw std::invalid_argument(std::string(key) + " must not exceed " +
                                std::to_string(kMaxIntervalSeconds) +
                                " seconds");
  }
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

size_t CountField(const json &section, const char *key, size_t fallback)
{
  if (!section.contains(key)) {
    return fallback;
  }
  const json &value = section.at(key);
  if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
    throw std::invalid_argument(std::string(key) +
                                " must be a positive integer");
  }
  return static_cast<size_t>(value.get<int64_t>());
}

}  // namespace

Result<MonitorConfig> LoadConfigFromJson(const json &document)
{
  MonitorConfig config = MonitorConfig::Default();

  try {
    if (!document.is_object()) {
      throw std::invalid_argument("configuration must be a JSON object");
    }

    if (const json *monitoring = Section(document, "monitoring")) {
      config.check_interval = SecondsField(
          *monitoring, "check_interval_seconds", config.check_interval);
      config.stop_timeout = SecondsField(*monitoring, "stop_timeout_seconds",
                                         config.stop_timeout);
      config.health_window_minutes = static_cast<int64_t>(
          CountField(*monitoring, "health_window_minutes",
                     static_cast<size_t>(config.health_window_minutes)));
      config.persist_latency_per_stage =
          CountField(*monitoring, "persist_latency_per_stage",
                     config.persist_latency_per_stage);
      config.persist_throughput_per_stage =
          CountField(*monitoring, "persist_throughput_per_stage",
                     config.persist_throughput_per_stage);
    }

    if (const json *buffers = Section(document, "buffers")) {
      config.buffers.latency_capacity = CountField(
          *buffers, "latency_capacity", config.buffers.latency_capacity);
      config.buffers.throughput_capacity = CountField(
          *buffers, "throughput_capacity", config.buffers.throughput_capacity);
      config.violation_capacity = CountField(*buffers, "violation_capacity",
                                             config.violation_capacity);
    }

    if (const json *storage = Section(document, "storage")) {
      config.storage.path = storage->value("path", config.storage.path);
      config.storage.compression =
          storage->value("compression", config.storage.compression);
    }

    if (const json *alerting = Section(document, "alerting")) {
      config.alerting.enabled =
          alerting->value("enabled", config.alerting.enabled);
      config.alerting.publish_address =
          alerting->value("publish_address", config.alerting.publish_address);
      config.alerting.pattern =
          alerting->value("pattern", config.alerting.pattern);
      config.alerting.bind = alerting->value("bind", config.alerting.bind);
      config.alerting.cooldown_minutes = alerting->value(
          "cooldown_minutes", config.alerting.cooldown_minutes);
    }

    if (const json *logging = Section(document, "logging")) {
      if (logging->contains("level")) {
        auto name = logging->at("level").get<std::string>();
        auto level = LogLevelFromString(name);
        if (!level) {
          throw std::invalid_argument("unknown log level '" + name + "'");
        }
        config.logging.level = *level;
      }
      config.logging.directory =
          logging->value("directory", config.logging.directory);
    }

    if (document.contains("slos")) {
      const json &slos = document.at("slos");
      if (!slos.is_array()) {
        throw std::invalid_argument("'slos' must be an array");
      }
      config.slos = slos.get<std::vector<SLODefinition>>();
    }
  } catch (const json::exception &e) {
    return Err<MonitorConfig>(
        Error(Error::INVALID_CONFIG, std::string("configuration: ") + e.what()));
  } catch (const std::invalid_argument &e) {
    return Err<MonitorConfig>(
        Error(Error::INVALID_CONFIG, std::string("configuration: ") + e.what()));
  }

  auto valid = config.Validate();
  if (!isOk(valid)) {
    return Err<MonitorConfig>(Error(getError(valid)));
  }
  return Ok(std::move(config));
}

Result<MonitorConfig> LoadConfigFromFile(const std::string &path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    return Err<MonitorConfig>(Error(Error::SYSTEM_ERROR,
                                    "cannot open config file: " + path, errno));
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  json document;
  try {
    document = json::parse(content);
  } catch (const json::parse_error &e) {
    return Err<MonitorConfig>(Error(
        Error::INVALID_FORMAT, "malformed JSON in " + path + ": " + e.what()));
  }
  return LoadConfigFromJson(document);
}

json ConfigToJson(const MonitorConfig &config)
{
  auto seconds = [](std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
  };

  return json{
      {"monitoring",
       {{"check_interval_seconds", seconds(config.check_interval)},
        {"stop_timeout_seconds", seconds(config.stop_timeout)},
        {"health_window_minutes", config.health_window_minutes},
        {"persist_latency_per_stage", config.persist_latency_per_stage},
        {"persist_throughput_per_stage", config.persist_throughput_per_stage}}},
      {"buffers",
       {{"latency_capacity", config.buffers.latency_capacity},
        {"throughput_capacity", config.buffers.throughput_capacity},
        {"violation_capacity", config.violation_capacity}}},
      {"storage",
       {{"path", config.storage.path},
        {"compression", config.storage.compression}}},
      {"alerting",
       {{"enabled", config.alerting.enabled},
        {"publish_address", config.alerting.publish_address},
        {"pattern", config.alerting.pattern},
        {"bind", config.alerting.bind},
        {"cooldown_minutes", config.alerting.cooldown_minutes}}},
      {"logging",
       {{"level", LogLevelToString(config.logging.level)},
        {"directory", config.logging.directory}}},
      {"slos", config.slos}};
}

}  // namespace PIPEMON::Monitor
