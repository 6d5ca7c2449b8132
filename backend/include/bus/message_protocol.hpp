#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/errors.h"

namespace candlecast::bus {

constexpr uint16_t kFrameVersion = 1;

enum class FrameType : uint16_t {
    CandleBatch = 1,
    JobRequest = 2
};

enum class PayloadEncoding : uint16_t {
    Packed = 0,      // little-endian structs, see candle_batch_codec.hpp
    FlatBuffers = 1, // schemas/candle_batch.fbs
    Json = 2
};

// Every frame carries the CRC32 of its payload; receivers reject mismatches.
struct FrameHeader {
    uint16_t version;
    uint16_t type;
    uint16_t encoding;
    uint16_t reserved;
    uint32_t size;
    uint32_t crc32;
    uint64_t timestamp_ns;
};

static_assert(sizeof(FrameHeader) == 24, "FrameHeader must be 24 bytes.");

struct Frame {
    FrameHeader header;
    const uint8_t* payload;
};

std::vector<uint8_t> encode_frame(FrameType type, PayloadEncoding encoding, const void* data, size_t size,
                                  uint64_t timestamp_ns);

/**
 * @brief Validate a frame and point at its payload.
 * @return CANDLECAST_ERR_PROTO on unknown version, short buffer, size or CRC mismatch.
 */
CandlecastStatus decode_frame(const void* data, size_t size, Frame* out);

uint32_t compute_crc32(const uint8_t* data, size_t size);

} // namespace candlecast::bus
