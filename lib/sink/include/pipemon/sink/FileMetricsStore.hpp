/**
 * @file FileMetricsStore.hpp
 * @brief Append-only metrics file implementing IMetricsStore
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "pipemon/core/Logger.hpp"
#include "pipemon/monitor/MetricsStore.hpp"
#include "pipemon/sink/MetricsFrameCodec.hpp"

namespace PIPEMON::Sink {

/**
 * @brief IMetricsStore backed by a single file of frames
 *
 * Each Store* call appends one frame. Queries scan the file, skip frames
 * of another kind or whose record time bounds miss the range, and decode
 * the rest. A corrupt or truncated frame fails the whole query. A missing
 * file reads as empty.
 */
class FileMetricsStore : public Monitor::IMetricsStore {
public:
    /**
     * @param path Metrics file, created on first write
     * @param compression LZ4-compress frame payloads when smaller
     */
    explicit FileMetricsStore(std::string path, bool compression = true);

    Status StoreLatency(const std::vector<LatencyMeasurement>& measurements) override;
    Status StoreThroughput(const std::vector<ThroughputMeasurement>& measurements) override;
    Status StoreViolations(const std::vector<ViolationRecord>& violations) override;

    Result<std::vector<LatencyMeasurement>> QueryLatency(TimePoint from, TimePoint to) override;
    Result<std::vector<ThroughputMeasurement>> QueryThroughput(TimePoint from, TimePoint to) override;
    Result<std::vector<ViolationRecord>> QueryViolations(TimePoint from, TimePoint to) override;

    /**
     * @brief Number of frames written by this instance
     */
    uint64_t framesWritten() const;

    const std::string& path() const { return path_; }

private:
    template <typename Record>
    Status appendRecords(RecordKind kind, const std::vector<Record>& records);

    template <typename Record>
    Result<std::vector<Record>> queryRecords(RecordKind kind, TimePoint from, TimePoint to);

    /**
     * @brief JSON record arrays of all frames of @p kind overlapping [from, to]
     */
    Result<std::vector<nlohmann::json>> readFrames(RecordKind kind,
                                                   int64_t from_ns, int64_t to_ns);

    std::string path_;
    MetricsFrameCodec codec_;
    mutable std::mutex file_mutex_;
    uint64_t frames_written_ = 0;
    std::shared_ptr<Logger> logger_;
};

} // namespace PIPEMON::Sink
