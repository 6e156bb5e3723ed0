/**
 * @file FileMetricsStore.cpp
 * @brief Implementation of FileMetricsStore
 */

#include "pipemon/sink/FileMetricsStore.hpp"
#include "pipemon/monitor/RecordCodec.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace PIPEMON::Sink {

namespace {

TimePoint recordTime(const LatencyMeasurement& m) { return m.start_time; }
TimePoint recordTime(const ThroughputMeasurement& m) { return m.timestamp; }
TimePoint recordTime(const ViolationRecord& v) { return v.timestamp; }

} // namespace

FileMetricsStore::FileMetricsStore(std::string path, bool compression)
    : path_(std::move(path))
    , logger_(Logger::GetLogger("FileMetricsStore"))
{
    codec_.enableCompression(compression);
}

Status FileMetricsStore::StoreLatency(const std::vector<LatencyMeasurement>& measurements) {
    return appendRecords(RecordKind::Latency, measurements);
}

Status FileMetricsStore::StoreThroughput(const std::vector<ThroughputMeasurement>& measurements) {
    return appendRecords(RecordKind::Throughput, measurements);
}

Status FileMetricsStore::StoreViolations(const std::vector<ViolationRecord>& violations) {
    return appendRecords(RecordKind::Violation, violations);
}

Result<std::vector<LatencyMeasurement>> FileMetricsStore::QueryLatency(TimePoint from, TimePoint to) {
    return queryRecords<LatencyMeasurement>(RecordKind::Latency, from, to);
}

Result<std::vector<ThroughputMeasurement>> FileMetricsStore::QueryThroughput(TimePoint from, TimePoint to) {
    return queryRecords<ThroughputMeasurement>(RecordKind::Throughput, from, to);
}

Result<std::vector<ViolationRecord>> FileMetricsStore::QueryViolations(TimePoint from, TimePoint to) {
    return queryRecords<ViolationRecord>(RecordKind::Violation, from, to);
}

uint64_t FileMetricsStore::framesWritten() const {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return frames_written_;
}

template <typename Record>
Status FileMetricsStore::appendRecords(RecordKind kind, const std::vector<Record>& records) {
    if (records.empty()) {
        return OkStatus();
    }

    int64_t earliest = std::numeric_limits<int64_t>::max();
    int64_t latest = std::numeric_limits<int64_t>::min();
    nlohmann::json array = nlohmann::json::array();
    for (const auto& record : records) {
        int64_t ns = toUnixNs(recordTime(record));
        earliest = std::min(earliest, ns);
        latest = std::max(latest, ns);
        array.push_back(record);
    }

    auto frame = codec_.encode(kind, array, earliest, latest);
    if (!isOk(frame)) {
        return Status{Error(getError(frame))};
    }
    const auto& bytes = getValue(frame);

    std::lock_guard<std::mutex> lock(file_mutex_);
    std::ofstream file(path_, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return Status{Error(Error::STORAGE_ERROR, "Cannot open metrics file: " + path_, errno)};
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        return Status{Error(Error::STORAGE_ERROR, "Failed to write metrics file: " + path_)};
    }

    ++frames_written_;
    logger_->Debug(std::string("Stored ") + std::to_string(records.size()) + " " +
                   RecordKindToString(kind) + " records");
    return OkStatus();
}

template <typename Record>
Result<std::vector<Record>> FileMetricsStore::queryRecords(RecordKind kind, TimePoint from, TimePoint to) {
    int64_t from_ns = toUnixNs(from);
    int64_t to_ns = toUnixNs(to);

    auto frames = readFrames(kind, from_ns, to_ns);
    if (!isOk(frames)) {
        return Err<std::vector<Record>>(Error(getError(frames)));
    }

    std::vector<Record> result;
    try {
        for (const auto& array : getValue(frames)) {
            for (const auto& item : array) {
                Record record = item.template get<Record>();
                TimePoint t = recordTime(record);
                if (t >= from && t <= to) {
                    result.push_back(std::move(record));
                }
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        return Err<std::vector<Record>>(
            Error(Error::DESERIALIZATION_ERROR, std::string("Malformed record: ") + e.what()));
    }
    catch (const std::invalid_argument& e) {
        return Err<std::vector<Record>>(
            Error(Error::DESERIALIZATION_ERROR, std::string("Malformed record: ") + e.what()));
    }
    return Ok(std::move(result));
}

Result<std::vector<nlohmann::json>> FileMetricsStore::readFrames(RecordKind kind,
                                                                 int64_t from_ns, int64_t to_ns) {
    std::vector<nlohmann::json> arrays;

    std::lock_guard<std::mutex> lock(file_mutex_);
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return Ok(std::move(arrays)); // Nothing written yet
    }

    file.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    uint64_t offset = 0;
    std::vector<uint8_t> header_bytes(sizeof(FrameHeader));
    std::vector<uint8_t> payload;

    while (offset < file_size) {
        file.read(reinterpret_cast<char*>(header_bytes.data()),
                  static_cast<std::streamsize>(header_bytes.size()));
        if (file.gcount() != static_cast<std::streamsize>(header_bytes.size())) {
            return Err<std::vector<nlohmann::json>>(Error(
                Error::STORAGE_ERROR, "Truncated frame header at offset " + std::to_string(offset)));
        }

        auto header = codec_.decodeHeader(header_bytes.data(), header_bytes.size());
        if (!isOk(header)) {
            return Err<std::vector<nlohmann::json>>(Error(
                getError(header).code,
                getError(header).message + " at offset " + std::to_string(offset)));
        }
        const FrameHeader h = getValue(header);
        const uint32_t stored_size = h.stored_size;
        const uint64_t frame_end = offset + sizeof(FrameHeader) + stored_size;
        if (frame_end > file_size) {
            return Err<std::vector<nlohmann::json>>(Error(
                Error::STORAGE_ERROR, "Truncated frame payload at offset " + std::to_string(offset)));
        }

        bool wanted = h.record_kind == static_cast<uint16_t>(kind) &&
                      h.latest_record_ns >= from_ns && h.earliest_record_ns <= to_ns;
        if (!wanted) {
            file.seekg(static_cast<std::streamoff>(frame_end), std::ios::beg);
            offset = frame_end;
            continue;
        }

        payload.resize(stored_size);
        file.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(stored_size));
        if (file.gcount() != static_cast<std::streamsize>(stored_size)) {
            return Err<std::vector<nlohmann::json>>(Error(
                Error::STORAGE_ERROR, "Truncated frame payload at offset " + std::to_string(offset)));
        }

        auto records = codec_.decodePayload(h, payload.data(), payload.size());
        if (!isOk(records)) {
            return Err<std::vector<nlohmann::json>>(Error(
                getError(records).code,
                getError(records).message + " at offset " + std::to_string(offset)));
        }
        arrays.push_back(getValue(records));
        offset = frame_end;
    }

    return Ok(std::move(arrays));
}

} // namespace PIPEMON::Sink
