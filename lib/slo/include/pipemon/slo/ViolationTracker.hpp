#ifndef PIPEMON_SLO_VIOLATION_TRACKER_HPP
#define PIPEMON_SLO_VIOLATION_TRACKER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pipemon/core/Clock.hpp"
#include "pipemon/core/SLODefinition.hpp"
#include "pipemon/core/SLOStatus.hpp"

namespace PIPEMON {
namespace SLO {

/**
 * @brief Bounded append-only history of SLO violations
 *
 * Once capacity is reached each new record evicts the oldest one.
 * Thread-safe.
 */
class ViolationTracker {
public:
  static constexpr std::chrono::hours kRollingWindow{24};

  /**
   * @throws std::invalid_argument if capacity is zero
   */
  explicit ViolationTracker(size_t capacity = 1000,
                            std::shared_ptr<const IClock> clock = nullptr);

  /**
   * @brief Append a record stamped with the current time
   */
  ViolationRecord Record(const SLODefinition &definition,
                         const SLOStatus &status);

  // Append a record as-is (history replay, tests)
  void Append(ViolationRecord record);

  /**
   * @brief Records for @p slo_name with timestamp >= now - 24h
   */
  uint64_t CountInLast24h(const std::string &slo_name) const;

  /**
   * @brief Newest @p limit records, oldest first
   */
  std::vector<ViolationRecord> Recent(size_t limit) const;

  size_t Size() const;
  size_t Capacity() const { return capacity_; }
  void Clear();

private:
  const size_t capacity_;
  std::shared_ptr<const IClock> clock_;

  mutable std::mutex mutex_;
  std::deque<ViolationRecord> history_;
};

} // namespace SLO
} // namespace PIPEMON

#endif // PIPEMON_SLO_VIOLATION_TRACKER_HPP
