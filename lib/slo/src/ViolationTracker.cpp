#include "pipemon/slo/ViolationTracker.hpp"

#include <algorithm>
#include <stdexcept>

namespace PIPEMON {
namespace SLO {

constexpr std::chrono::hours ViolationTracker::kRollingWindow;

ViolationTracker::ViolationTracker(size_t capacity,
                                   std::shared_ptr<const IClock> clock)
    : capacity_(capacity),
      clock_(clock ? std::move(clock)
                   : std::shared_ptr<const IClock>(
                         std::make_shared<SystemClock>())) {
  if (capacity_ == 0) {
    throw std::invalid_argument("violation capacity must be positive");
  }
}

ViolationRecord ViolationTracker::Record(const SLODefinition &definition,
                                         const SLOStatus &status) {
  ViolationRecord record;
  record.timestamp = clock_->Now();
  record.slo_name = definition.name;
  record.state = status.state;
  record.current_value = status.current_value;
  record.target_value = status.target_value;
  record.compliance_percentage = status.compliance_percentage;

  Append(record);
  return record;
}

void ViolationTracker::Append(ViolationRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (history_.size() >= capacity_) {
    history_.pop_front();
  }
  history_.push_back(std::move(record));
}

uint64_t ViolationTracker::CountInLast24h(const std::string &slo_name) const {
  TimePoint cutoff = clock_->Now() - kRollingWindow;

  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<uint64_t>(
      std::count_if(history_.begin(), history_.end(),
                    [&](const ViolationRecord &record) {
                      return record.slo_name == slo_name &&
                             record.timestamp >= cutoff;
                    }));
}

std::vector<ViolationRecord> ViolationTracker::Recent(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t take = std::min(limit, history_.size());
  return std::vector<ViolationRecord>(history_.end() - take, history_.end());
}

size_t ViolationTracker::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

void ViolationTracker::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
}

} // namespace SLO
} // namespace PIPEMON
