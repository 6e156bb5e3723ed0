#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @file FrameProtocol.hpp
 * @brief Constants and header layout of the PipeMon metrics file format
 *
 * A metrics file is a sequence of frames. Each frame is a fixed 64-byte
 * header followed by a payload holding one batch of records as a CBOR
 * encoded JSON array, optionally LZ4 compressed.
 */

namespace PIPEMON::Sink {

// Compile-time endianness check - MUST be little-endian
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__,
              "PipeMon metrics files require a little-endian platform");

/**
 * @brief Magic number identifying a PipeMon frame ("PIPEMON\0")
 */
constexpr uint64_t FRAME_MAGIC = 0x504950454D4F4E00ULL;

/**
 * @brief Current frame format version
 */
constexpr uint32_t FRAME_FORMAT_VERSION = 1;

/**
 * @brief Fixed size of the frame header in bytes
 */
constexpr uint32_t FRAME_HEADER_SIZE = 64;

/**
 * @brief Payloads smaller than this are stored uncompressed
 */
constexpr size_t MIN_COMPRESS_SIZE = 512;

/**
 * @brief Upper bound on a single frame payload (64 MB)
 *
 * Guards against allocating from a corrupt size field.
 */
constexpr uint32_t MAX_FRAME_PAYLOAD = 64u * 1024u * 1024u;

/**
 * @brief Frame flag: payload is LZ4 compressed
 */
constexpr uint16_t FRAME_FLAG_COMPRESSED = 0x0001;

/**
 * @brief Kind of records carried by a frame
 */
enum class RecordKind : uint16_t {
    Latency = 1,
    Throughput = 2,
    Violation = 3
};

inline const char* RecordKindToString(RecordKind kind) {
    switch (kind) {
        case RecordKind::Latency: return "latency";
        case RecordKind::Throughput: return "throughput";
        case RecordKind::Violation: return "violation";
        default: return "unknown";
    }
}

/**
 * @brief Frame header (fixed 64 bytes, little-endian)
 */
struct __attribute__((packed)) FrameHeader {
    uint64_t magic_number;        ///< FRAME_MAGIC
    uint32_t format_version;      ///< FRAME_FORMAT_VERSION
    uint32_t header_size;         ///< Always 64
    uint16_t record_kind;         ///< RecordKind
    uint16_t flags;               ///< FRAME_FLAG_*
    uint32_t record_count;        ///< Records in payload
    uint32_t uncompressed_size;   ///< CBOR payload size
    uint32_t stored_size;         ///< Bytes following the header
    uint32_t checksum;            ///< xxHash32 of the uncompressed payload
    uint32_t reserved;            ///< Zero
    int64_t write_timestamp_ns;   ///< Unix ns when the frame was written
    int64_t earliest_record_ns;   ///< Smallest record timestamp (Unix ns)
    int64_t latest_record_ns;     ///< Largest record timestamp (Unix ns)
}; // Total: 64 bytes

static_assert(sizeof(FrameHeader) == FRAME_HEADER_SIZE,
              "FrameHeader must be exactly 64 bytes");

} // namespace PIPEMON::Sink
