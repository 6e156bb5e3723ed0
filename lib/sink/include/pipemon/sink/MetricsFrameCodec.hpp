/**
 * @file MetricsFrameCodec.hpp
 * @brief Encoding and decoding of metrics file frames
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

#include "pipemon/core/Error.hpp"
#include "pipemon/sink/FrameProtocol.hpp"

namespace PIPEMON::Sink {

/**
 * @brief Builds and parses frames
 *
 * Features:
 * - CBOR payload produced from a JSON array of records
 * - LZ4 compression when enabled and it makes the payload smaller
 * - xxHash32 checksum over the uncompressed payload
 */
class MetricsFrameCodec {
public:
    MetricsFrameCodec() = default;

    /**
     * @brief Enable or disable LZ4 compression of payloads
     */
    void enableCompression(bool enabled) { compression_enabled_ = enabled; }
    bool compressionEnabled() const { return compression_enabled_; }

    /**
     * @brief Build one frame
     * @param kind Kind of records in @p records
     * @param records JSON array of records
     * @param earliest_ns Smallest record timestamp (Unix ns)
     * @param latest_ns Largest record timestamp (Unix ns)
     * @return Header followed by payload, or an error
     */
    Result<std::vector<uint8_t>> encode(RecordKind kind,
                                        const nlohmann::json& records,
                                        int64_t earliest_ns,
                                        int64_t latest_ns) const;

    /**
     * @brief Parse and validate a frame header
     * @return INVALID_FORMAT for a bad magic, version or header size,
     *         INVALID_DATA for an implausible payload size
     */
    Result<FrameHeader> decodeHeader(const uint8_t* data, size_t size) const;

    /**
     * @brief Decompress, verify and decode the payload of a frame
     * @param header Header returned by decodeHeader()
     * @param payload Exactly header.stored_size bytes
     * @return JSON array of records, or COMPRESSION_FAILED,
     *         CHECKSUM_MISMATCH, DESERIALIZATION_ERROR
     */
    Result<nlohmann::json> decodePayload(const FrameHeader& header,
                                         const uint8_t* payload,
                                         size_t size) const;

    /**
     * @brief Calculate xxHash32 checksum (seed 0)
     */
    static uint32_t calculateChecksum(const uint8_t* data, size_t size);

private:
    bool compression_enabled_ = true;

    int compressData(const uint8_t* input, size_t input_size,
                     uint8_t* output, size_t max_output_size) const;
    int decompressData(const uint8_t* input, size_t input_size,
                       uint8_t* output, size_t max_output_size) const;
};

} // namespace PIPEMON::Sink
