#ifndef PIPEMON_SLO_SLO_REGISTRY_HPP
#define PIPEMON_SLO_SLO_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "pipemon/core/Error.hpp"
#include "pipemon/core/SLODefinition.hpp"

namespace PIPEMON {
namespace SLO {

/**
 * @brief Validated set of SLO definitions with unique names
 *
 * Filled once at startup and read-only afterwards. Registration order is
 * kept and is the evaluation order.
 */
class SLORegistry {
public:
  SLORegistry() = default;

  /**
   * @brief Build a registry from a list, stopping at the first bad entry
   */
  static Result<SLORegistry>
  FromDefinitions(const std::vector<SLODefinition> &definitions);

  /**
   * @brief Register one definition
   * @return INVALID_CONFIG if Validate() fails, DUPLICATE_NAME if the name
   *         is already taken
   */
  Status Register(const SLODefinition &definition);

  std::optional<SLODefinition> Find(const std::string &name) const;
  const std::vector<SLODefinition> &Definitions() const { return definitions_; }
  size_t Size() const { return definitions_.size(); }
  bool Empty() const { return definitions_.empty(); }

  /**
   * @brief Built-in objectives used when configuration names none
   *
   * signal_generation_latency  p95 <= 1000 ms (warn 1500, crit 3000), 15 min
   * order_execution_latency    p95 <= 2000 ms (warn 5000, crit 10000), 15 min
   * data_processing_throughput mean >= 100/s (warn 50, crit 20), 5 min
   */
  static std::vector<SLODefinition> DefaultDefinitions();

private:
  std::vector<SLODefinition> definitions_;
};

} // namespace SLO
} // namespace PIPEMON

#endif // PIPEMON_SLO_SLO_REGISTRY_HPP
