#ifndef PIPEMON_MONITOR_CONFIG_LOADER_HPP
#define PIPEMON_MONITOR_CONFIG_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "pipemon/core/Error.hpp"
#include "pipemon/monitor/MonitorConfig.hpp"

namespace PIPEMON::Monitor
{

/**
 * @brief Build a MonitorConfig from a JSON document
 *
 * Sections: monitoring, buffers, storage, alerting, logging, slos. Every
 * key is optional. A missing "slos" key selects the built-in SLO set, an
 * empty array selects none.
 *
 * @return INVALID_CONFIG for wrong types, unknown names or values that
 *         fail MonitorConfig::Validate()
 */
Result<MonitorConfig> LoadConfigFromJson(const nlohmann::json &document);

/**
 * @brief Read and parse a JSON config file
 * @return SYSTEM_ERROR if the file cannot be read, INVALID_FORMAT if it is
 *         not JSON, otherwise as LoadConfigFromJson()
 */
Result<MonitorConfig> LoadConfigFromFile(const std::string &path);

nlohmann::json ConfigToJson(const MonitorConfig &config);

}  // namespace PIPEMON::Monitor

#endif  // PIPEMON_MONITOR_CONFIG_LOADER_HPP
