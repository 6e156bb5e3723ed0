/**
 * @file test_metrics_frame_codec.cpp
 * @brief Unit tests for metrics frame encoding, compression and integrity checks
 */

#include <gtest/gtest.h>

#include <cstring>
#include <nlohmann/json.hpp>
#include <vector>

#include "pipemon/sink/MetricsFrameCodec.hpp"

using namespace PIPEMON;
using namespace PIPEMON::Sink;
using nlohmann::json;

class MetricsFrameCodecTest : public ::testing::Test {
protected:
    // Highly repetitive records so compression pays off
    json MakeRecords(size_t count)
    {
        json records = json::array();
        for (size_t i = 0; i < count; ++i) {
            records.push_back({{"stage", "order_execution"},
                               {"duration_ms", 12.5},
                               {"success", true},
                               {"sequence", i}});
        }
        return records;
    }

    FrameHeader HeaderOf(const std::vector<uint8_t> &frame)
    {
        FrameHeader header;
        std::memcpy(&header, frame.data(), sizeof(FrameHeader));
        return header;
    }

    MetricsFrameCodec codec_;
};

TEST_F(MetricsFrameCodecTest, HeaderIsSixtyFourBytes)
{
    EXPECT_EQ(sizeof(FrameHeader), 64u);
    EXPECT_EQ(FRAME_HEADER_SIZE, 64u);
}

TEST_F(MetricsFrameCodecTest, EncodeDecodeSmallFrameUncompressed)
{
    auto records = MakeRecords(2);
    auto frame = codec_.encode(RecordKind::Latency, records, 100, 200);
    ASSERT_TRUE(isOk(frame));
    const auto &bytes = getValue(frame);

    auto header = codec_.decodeHeader(bytes.data(), bytes.size());
    ASSERT_TRUE(isOk(header));
    const auto &h = getValue(header);
    // FrameHeader is packed; copy fields before gtest binds references
    EXPECT_EQ(uint64_t{h.magic_number}, FRAME_MAGIC);
    EXPECT_EQ(uint16_t{h.record_kind}, static_cast<uint16_t>(RecordKind::Latency));
    EXPECT_EQ(uint32_t{h.record_count}, 2u);
    EXPECT_EQ(h.flags & FRAME_FLAG_COMPRESSED, 0);
    EXPECT_EQ(int64_t{h.earliest_record_ns}, 100);
    EXPECT_EQ(int64_t{h.latest_record_ns}, 200);
    EXPECT_EQ(bytes.size(), sizeof(FrameHeader) + h.stored_size);

    auto decoded = codec_.decodePayload(h, bytes.data() + sizeof(FrameHeader),
                                        bytes.size() - sizeof(FrameHeader));
    ASSERT_TRUE(isOk(decoded));
    EXPECT_EQ(getValue(decoded), records);
}

TEST_F(MetricsFrameCodecTest, LargeRepetitiveFrameIsCompressed)
{
    auto records = MakeRecords(500);
    auto frame = codec_.encode(RecordKind::Throughput, records, 0, 0);
    ASSERT_TRUE(isOk(frame));
    auto h = HeaderOf(getValue(frame));

    EXPECT_NE(h.flags & FRAME_FLAG_COMPRESSED, 0);
    EXPECT_LT(uint32_t{h.stored_size}, uint32_t{h.uncompressed_size});

    const auto &bytes = getValue(frame);
    auto decoded = codec_.decodePayload(h, bytes.data() + sizeof(FrameHeader), h.stored_size);
    ASSERT_TRUE(isOk(decoded));
    EXPECT_EQ(getValue(decoded).size(), 500u);
}

TEST_F(MetricsFrameCodecTest, CompressionCanBeDisabled)
{
    codec_.enableCompression(false);
    EXPECT_FALSE(codec_.compressionEnabled());

    auto frame = codec_.encode(RecordKind::Violation, MakeRecords(500), 0, 0);
    ASSERT_TRUE(isOk(frame));
    auto h = HeaderOf(getValue(frame));
    EXPECT_EQ(h.flags & FRAME_FLAG_COMPRESSED, 0);
    EXPECT_EQ(uint32_t{h.stored_size}, uint32_t{h.uncompressed_size});
}

TEST_F(MetricsFrameCodecTest, RejectsNonArrayRecords)
{
    auto frame = codec_.encode(RecordKind::Latency, json{{"not", "array"}}, 0, 0);
    ASSERT_FALSE(isOk(frame));
    EXPECT_EQ(getError(frame).code, Error::INVALID_DATA);
}

TEST_F(MetricsFrameCodecTest, RejectsShortOrForeignHeaders)
{
    std::vector<uint8_t> tiny(10, 0);
    auto short_header = codec_.decodeHeader(tiny.data(), tiny.size());
    ASSERT_FALSE(isOk(short_header));
    EXPECT_EQ(getError(short_header).code, Error::INVALID_DATA);

    auto frame = getValue(codec_.encode(RecordKind::Latency, MakeRecords(1), 0, 0));
    frame[0] ^= 0xFF;
    auto bad_magic = codec_.decodeHeader(frame.data(), frame.size());
    ASSERT_FALSE(isOk(bad_magic));
    EXPECT_EQ(getError(bad_magic).code, Error::INVALID_FORMAT);
}

TEST_F(MetricsFrameCodecTest, RejectsUnsupportedVersion)
{
    auto frame = getValue(codec_.encode(RecordKind::Latency, MakeRecords(1), 0, 0));
    FrameHeader h = HeaderOf(frame);
    h.format_version = 99;
    std::memcpy(frame.data(), &h, sizeof(FrameHeader));

    auto header = codec_.decodeHeader(frame.data(), frame.size());
    ASSERT_FALSE(isOk(header));
    EXPECT_EQ(getError(header).code, Error::INVALID_FORMAT);
}

// Test: A flipped payload byte is caught by the checksum
TEST_F(MetricsFrameCodecTest, DetectsCorruptedPayload)
{
    codec_.enableCompression(false);
    auto frame = getValue(codec_.encode(RecordKind::Latency, MakeRecords(3), 0, 0));
    frame[sizeof(FrameHeader) + 5] ^= 0x01;

    auto h = getValue(codec_.decodeHeader(frame.data(), frame.size()));
    auto decoded = codec_.decodePayload(h, frame.data() + sizeof(FrameHeader),
                                        frame.size() - sizeof(FrameHeader));
    ASSERT_FALSE(isOk(decoded));
    EXPECT_EQ(getError(decoded).code, Error::CHECKSUM_MISMATCH);
}

TEST_F(MetricsFrameCodecTest, DetectsCorruptedCompressedPayload)
{
    auto frame = getValue(codec_.encode(RecordKind::Latency, MakeRecords(500), 0, 0));
    auto h = HeaderOf(frame);
    ASSERT_NE(h.flags & FRAME_FLAG_COMPRESSED, 0);
    for (size_t i = sizeof(FrameHeader) + 8; i < frame.size(); i += 16) {
        frame[i] ^= 0x5A;
    }

    auto decoded = codec_.decodePayload(h, frame.data() + sizeof(FrameHeader), h.stored_size);
    ASSERT_FALSE(isOk(decoded));
    auto code = getError(decoded).code;
    EXPECT_TRUE(code == Error::COMPRESSION_FAILED || code == Error::CHECKSUM_MISMATCH)
        << Error::codeToString(code);
}

TEST_F(MetricsFrameCodecTest, PayloadSizeMustMatchHeader)
{
    auto frame = getValue(codec_.encode(RecordKind::Latency, MakeRecords(2), 0, 0));
    auto h = HeaderOf(frame);
    auto decoded = codec_.decodePayload(h, frame.data() + sizeof(FrameHeader), h.stored_size - 1);
    ASSERT_FALSE(isOk(decoded));
    EXPECT_EQ(getError(decoded).code, Error::INVALID_DATA);
}

TEST_F(MetricsFrameCodecTest, ChecksumIsDeterministic)
{
    const uint8_t data[] = {1, 2, 3, 4, 5};
    EXPECT_EQ(MetricsFrameCodec::calculateChecksum(data, sizeof(data)),
              MetricsFrameCodec::calculateChecksum(data, sizeof(data)));
    const uint8_t other[] = {1, 2, 3, 4, 6};
    EXPECT_NE(MetricsFrameCodec::calculateChecksum(data, sizeof(data)),
              MetricsFrameCodec::calculateChecksum(other, sizeof(other)));
}
