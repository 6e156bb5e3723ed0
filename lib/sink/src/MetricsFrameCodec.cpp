/**
 * @file MetricsFrameCodec.cpp
 * @brief Implementation of MetricsFrameCodec
 */

#include "pipemon/sink/MetricsFrameCodec.hpp"
#include "pipemon/core/Clock.hpp"
#include <lz4.h>
#include <xxhash.h>
#include <cstring>
#include <new>

namespace PIPEMON::Sink {

Result<std::vector<uint8_t>> MetricsFrameCodec::encode(RecordKind kind,
                                                       const nlohmann::json& records,
                                                       int64_t earliest_ns,
                                                       int64_t latest_ns) const {
    if (!records.is_array()) {
        return Error{Error::INVALID_DATA, "Frame records must be a JSON array"};
    }

    try {
        std::vector<uint8_t> payload = nlohmann::json::to_cbor(records);
        if (payload.size() > MAX_FRAME_PAYLOAD) {
            return Error{Error::SERIALIZATION_ERROR, "Frame payload exceeds size limit"};
        }

        FrameHeader header;
        std::memset(&header, 0, sizeof(header));
        header.magic_number = FRAME_MAGIC;
        header.format_version = FRAME_FORMAT_VERSION;
        header.header_size = FRAME_HEADER_SIZE;
        header.record_kind = static_cast<uint16_t>(kind);
        header.flags = 0;
        header.record_count = static_cast<uint32_t>(records.size());
        header.uncompressed_size = static_cast<uint32_t>(payload.size());
        header.stored_size = header.uncompressed_size;
        header.write_timestamp_ns = toUnixNs(WallClock::now());
        header.earliest_record_ns = earliest_ns;
        header.latest_record_ns = latest_ns;

        // Checksum on original uncompressed payload
        header.checksum = calculateChecksum(payload.data(), payload.size());

        const uint8_t* stored_ptr = payload.data();
        size_t stored_size = payload.size();

        std::vector<uint8_t> compressed;
        if (compression_enabled_ && payload.size() >= MIN_COMPRESS_SIZE) {
            compressed.resize(LZ4_compressBound(static_cast<int>(payload.size())));
            int compressed_size = compressData(payload.data(), payload.size(),
                                               compressed.data(), compressed.size());

            // Keep compressed form only when it is smaller
            if (compressed_size > 0 && static_cast<size_t>(compressed_size) < payload.size()) {
                stored_ptr = compressed.data();
                stored_size = static_cast<size_t>(compressed_size);
                header.flags |= FRAME_FLAG_COMPRESSED;
                header.stored_size = static_cast<uint32_t>(compressed_size);
            }
        }

        std::vector<uint8_t> frame(sizeof(FrameHeader) + stored_size);
        std::memcpy(frame.data(), &header, sizeof(FrameHeader));
        std::memcpy(frame.data() + sizeof(FrameHeader), stored_ptr, stored_size);
        return frame;
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate buffer for frame encoding"};
    }
    catch (const nlohmann::json::exception& e) {
        return Error{Error::SERIALIZATION_ERROR, std::string("CBOR encoding failed: ") + e.what()};
    }
}

Result<FrameHeader> MetricsFrameCodec::decodeHeader(const uint8_t* data, size_t size) const {
    if (!data || size < sizeof(FrameHeader)) {
        return Error{Error::INVALID_DATA, "Data too small to contain frame header"};
    }

    FrameHeader header;
    std::memcpy(&header, data, sizeof(FrameHeader));

    if (header.magic_number != FRAME_MAGIC) {
        return Error{Error::INVALID_FORMAT, "Invalid magic number in frame header"};
    }
    if (header.format_version != FRAME_FORMAT_VERSION) {
        return Error{Error::INVALID_FORMAT,
                     "Unsupported frame format version " + std::to_string(header.format_version)};
    }
    if (header.header_size != FRAME_HEADER_SIZE) {
        return Error{Error::INVALID_FORMAT, "Unexpected frame header size"};
    }
    if (header.stored_size > MAX_FRAME_PAYLOAD || header.uncompressed_size > MAX_FRAME_PAYLOAD) {
        return Error{Error::INVALID_DATA, "Frame payload size exceeds limit"};
    }
    bool compressed = (header.flags & FRAME_FLAG_COMPRESSED) != 0;
    if (!compressed && header.stored_size != header.uncompressed_size) {
        return Error{Error::INVALID_DATA, "Frame size mismatch for uncompressed payload"};
    }
    return header;
}

Result<nlohmann::json> MetricsFrameCodec::decodePayload(const FrameHeader& header,
                                                        const uint8_t* payload,
                                                        size_t size) const {
    if (size != header.stored_size || (!payload && size > 0)) {
        return Error{Error::INVALID_DATA, "Payload size mismatch with header"};
    }

    try {
        std::vector<uint8_t> uncompressed;
        const uint8_t* payload_ptr = payload;
        size_t payload_size = size;

        if (header.flags & FRAME_FLAG_COMPRESSED) {
            uncompressed.resize(header.uncompressed_size);
            int decompressed_size = decompressData(payload, size,
                                                   uncompressed.data(), uncompressed.size());
            if (decompressed_size != static_cast<int>(header.uncompressed_size)) {
                return Error{Error::COMPRESSION_FAILED, "LZ4 decompression failed or size mismatch"};
            }
            payload_ptr = uncompressed.data();
            payload_size = uncompressed.size();
        }

        // Verify checksum on uncompressed payload
        if (calculateChecksum(payload_ptr, payload_size) != header.checksum) {
            return Error{Error::CHECKSUM_MISMATCH, "Payload checksum verification failed"};
        }

        nlohmann::json records = nlohmann::json::from_cbor(payload_ptr, payload_ptr + payload_size);
        if (!records.is_array() || records.size() != header.record_count) {
            return Error{Error::DESERIALIZATION_ERROR, "Frame payload does not match record count"};
        }
        return records;
    }
    catch (const std::bad_alloc&) {
        return Error{Error::MEMORY_ALLOCATION, "Failed to allocate memory for frame decoding"};
    }
    catch (const nlohmann::json::exception& e) {
        return Error{Error::DESERIALIZATION_ERROR, std::string("CBOR decoding failed: ") + e.what()};
    }
}

uint32_t MetricsFrameCodec::calculateChecksum(const uint8_t* data, size_t size) {
    return XXH32(data, size, 0); // Use seed 0
}

int MetricsFrameCodec::compressData(const uint8_t* input, size_t input_size,
                                    uint8_t* output, size_t max_output_size) const {
    if (!input || !output || input_size == 0) {
        return -1; // Invalid parameters
    }
    return LZ4_compress_default(reinterpret_cast<const char*>(input),
                                reinterpret_cast<char*>(output),
                                static_cast<int>(input_size),
                                static_cast<int>(max_output_size));
}

int MetricsFrameCodec::decompressData(const uint8_t* input, size_t input_size,
                                      uint8_t* output, size_t max_output_size) const {
    return LZ4_decompress_safe(reinterpret_cast<const char*>(input),
                               reinterpret_cast<char*>(output),
                               static_cast<int>(input_size),
                               static_cast<int>(max_output_size));
}

} // namespace PIPEMON::Sink
