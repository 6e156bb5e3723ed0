#include "pipemon/collector/MeasurementStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace PIPEMON {
namespace Collector {

namespace {

// Newest min(appended - cursor, limit) entries of a buffer
template <typename Deque>
std::vector<typename Deque::value_type>
TakeSince(const Deque &buffer, uint64_t appended, uint64_t &cursor,
          size_t limit) {
  uint64_t fresh = appended > cursor ? appended - cursor : 0;
  size_t available = static_cast<size_t>(
      std::min<uint64_t>(fresh, static_cast<uint64_t>(buffer.size())));
  size_t take = std::min(available, limit);
  cursor = appended;
  return std::vector<typename Deque::value_type>(buffer.end() - take,
                                                 buffer.end());
}

} // namespace

MeasurementStore::MeasurementStore(size_t latency_capacity,
                                   size_t throughput_capacity)
    : latency_capacity_(latency_capacity),
      throughput_capacity_(throughput_capacity) {
  if (latency_capacity_ == 0 || throughput_capacity_ == 0) {
    throw std::invalid_argument("buffer capacities must be positive");
  }
}

uint64_t MeasurementStore::BeginTrace(ActiveTrace trace) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t token = ++next_token_;
  active_.emplace(token, std::move(trace));
  return token;
}

void MeasurementStore::CompleteTrace(uint64_t token,
                                     LatencyMeasurement measurement) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppendLatencyLocked(std::move(measurement));
  active_.erase(token);
}

std::vector<ActiveTrace> MeasurementStore::ActiveTraces() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ActiveTrace> result;
  result.reserve(active_.size());
  for (const auto &[token, trace] : active_) {
    result.push_back(trace);
  }
  return result;
}

size_t MeasurementStore::ActiveTraceCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

void MeasurementStore::AppendLatency(LatencyMeasurement measurement) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppendLatencyLocked(std::move(measurement));
}

void MeasurementStore::AppendLatencyLocked(LatencyMeasurement measurement) {
  auto &buffers = stages_[StageIndex(measurement.stage)];
  if (buffers.latency.size() >= latency_capacity_) {
    buffers.latency.pop_front();
  }
  buffers.latency.push_back(std::move(measurement));
  ++buffers.latency_appended;
}

void MeasurementStore::AppendThroughput(ThroughputMeasurement measurement) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &buffers = stages_[StageIndex(measurement.stage)];
  if (buffers.throughput.size() >= throughput_capacity_) {
    buffers.throughput.pop_front();
  }
  buffers.throughput.push_back(std::move(measurement));
  ++buffers.throughput_appended;
}

std::vector<LatencyMeasurement>
MeasurementStore::LatencySnapshot(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &buffer = stages_[StageIndex(stage)].latency;
  return std::vector<LatencyMeasurement>(buffer.begin(), buffer.end());
}

std::vector<ThroughputMeasurement>
MeasurementStore::ThroughputSnapshot(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &buffer = stages_[StageIndex(stage)].throughput;
  return std::vector<ThroughputMeasurement>(buffer.begin(), buffer.end());
}

std::vector<LatencyMeasurement>
MeasurementStore::LatencySince(PipelineStage stage, uint64_t &cursor,
                               size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &buffers = stages_[StageIndex(stage)];
  return TakeSince(buffers.latency, buffers.latency_appended, cursor, limit);
}

std::vector<ThroughputMeasurement>
MeasurementStore::ThroughputSince(PipelineStage stage, uint64_t &cursor,
                                  size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &buffers = stages_[StageIndex(stage)];
  return TakeSince(buffers.throughput, buffers.throughput_appended, cursor,
                   limit);
}

size_t MeasurementStore::LatencyCount(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stages_[StageIndex(stage)].latency.size();
}

size_t MeasurementStore::ThroughputCount(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stages_[StageIndex(stage)].throughput.size();
}

uint64_t MeasurementStore::LatencyAppended(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stages_[StageIndex(stage)].latency_appended;
}

uint64_t MeasurementStore::ThroughputAppended(PipelineStage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stages_[StageIndex(stage)].throughput_appended;
}

void MeasurementStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &buffers : stages_) {
    buffers.latency.clear();
    buffers.throughput.clear();
  }
}

} // namespace Collector
} // namespace PIPEMON
