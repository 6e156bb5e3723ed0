#ifndef PIPEMON_SLO_SLO_EVALUATOR_HPP
#define PIPEMON_SLO_SLO_EVALUATOR_HPP

#include <memory>
#include <vector>

#include "pipemon/collector/Statistics.hpp"
#include "pipemon/core/Logger.hpp"
#include "pipemon/core/SLODefinition.hpp"
#include "pipemon/core/SLOStatus.hpp"
#include "pipemon/slo/SLORegistry.hpp"
#include "pipemon/slo/ViolationTracker.hpp"

namespace PIPEMON {
namespace SLO {

struct EvaluationResult {
  std::vector<SLOStatus> statuses;              // registry order
  std::vector<ViolationRecord> new_violations;  // recorded by this call
};

/**
 * @brief Derives SLO status from current statistics
 *
 * Nothing is cached: every call pulls fresh stats. Latency SLOs are judged
 * on p95, throughput SLOs on mean throughput. Missing data or a throwing
 * stats source yields Unknown for that SLO only.
 */
class SLOEvaluator {
public:
  /**
   * All three collaborators must outlive the evaluator.
   */
  SLOEvaluator(const SLORegistry &registry,
               const Collector::IStatsSource &stats,
               ViolationTracker &tracker);

  /**
   * @brief Evaluate every registered SLO
   * @param record_violations Append warning/critical results to the tracker
   */
  EvaluationResult EvaluateAll(bool record_violations);

  /**
   * @brief Evaluate one SLO without recording anything
   */
  SLOStatus Evaluate(const SLODefinition &definition) const;

  // Pure classification helpers
  static SLOState ClassifyLatency(double current,
                                  const SLODefinition &definition);
  static SLOState ClassifyThroughput(double current,
                                     const SLODefinition &definition);
  static double LatencyCompliance(double current, double target);
  static double ThroughputCompliance(double current, double target);

private:
  const SLORegistry &registry_;
  const Collector::IStatsSource &stats_;
  ViolationTracker &tracker_;
  std::shared_ptr<Logger> logger_;
};

} // namespace SLO
} // namespace PIPEMON

#endif // PIPEMON_SLO_SLO_EVALUATOR_HPP
