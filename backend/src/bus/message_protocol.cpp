#include "bus/message_protocol.hpp"

#include <array>
#include <cstring>

namespace candlecast::bus {

namespace {

std::array<uint32_t, 256> build_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (uint32_t j = 0; j < 8; ++j) {
            c = (c & 1) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

} // namespace

uint32_t compute_crc32(const uint8_t* data, size_t size) {
    if (!data || size == 0) return 0;
    static const std::array<uint32_t, 256> table = build_crc32_table();
    uint32_t c = 0xFFFFFFFFU;
    for (size_t i = 0; i < size; ++i) {
        c = table[(c ^ data[i]) & 0xFFU] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFU;
}

std::vector<uint8_t> encode_frame(FrameType type, PayloadEncoding encoding, const void* data, size_t size,
                                  uint64_t timestamp_ns) {
    FrameHeader header{};
    header.version = kFrameVersion;
    header.type = static_cast<uint16_t>(type);
    header.encoding = static_cast<uint16_t>(encoding);
    header.size = static_cast<uint32_t>(size);
    header.crc32 = compute_crc32(static_cast<const uint8_t*>(data), size);
    header.timestamp_ns = timestamp_ns;

    std::vector<uint8_t> buffer(sizeof(header) + size);
    std::memcpy(buffer.data(), &header, sizeof(header));
    if (size > 0 && data) std::memcpy(buffer.data() + sizeof(header), data, size);
    return buffer;
}

CandlecastStatus decode_frame(const void* data, size_t size, Frame* out) {
    if (!data || !out) return CANDLECAST_ERR_INVALID;
    if (size < sizeof(FrameHeader)) return CANDLECAST_ERR_PROTO;

    std::memcpy(&out->header, data, sizeof(FrameHeader));
    if (out->header.version != kFrameVersion) return CANDLECAST_ERR_PROTO;
    if (out->header.size != size - sizeof(FrameHeader)) return CANDLECAST_ERR_PROTO;

    out->payload = static_cast<const uint8_t*>(data) + sizeof(FrameHeader);
    if (compute_crc32(out->payload, out->header.size) != out->header.crc32) return CANDLECAST_ERR_PROTO;
    return CANDLECAST_OK;
}

} // namespace candlecast::bus
