#include "bus/message_protocol.hpp"
#include "codec/candle_batch_codec.hpp"

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

int main() {
    using namespace candlecast;

    core::CandleBatch batch;
    batch.symbol = "BTCUSDT";
    for (int i = 0; i < 3; ++i) {
        batch.candles.push_back(core::PriceCandle{1700000040000LL + i * 60000LL, 100.0 + i, 101.0 + i, 99.0 + i,
                                                  100.5 + i, 10.0 * (i + 1)});
    }

    std::vector<uint8_t> frame;
    assert(codec::encode_candle_batch(batch, &frame) == CANDLECAST_OK);
    core::CandleBatch decoded;
    assert(codec::decode_candle_batch(frame.data(), frame.size(), &decoded) == CANDLECAST_OK);
    assert(decoded.symbol == "BTCUSDT");
    assert(decoded.candles.size() == 3);
    assert(decoded.candles[2].open_time_ms == 1700000160000LL);
    assert(decoded.candles[1].close == 101.5);

    // Truncated frames and foreign message types are rejected.
    assert(codec::decode_candle_batch(frame.data(), frame.size() - 1, &decoded) == CANDLECAST_ERR_PROTO);
    assert(codec::decode_candle_batch(frame.data(), 8, &decoded) == CANDLECAST_ERR_PROTO);
    const char json[] = "{}";
    std::vector<uint8_t> job =
        bus::encode_frame(bus::FrameType::JobRequest, bus::PayloadEncoding::Json, json, sizeof(json) - 1, 1);
    assert(codec::decode_candle_batch(job.data(), job.size(), &decoded) == CANDLECAST_ERR_PROTO);

    // Chunking: 2,500 candles at 1,000 per message.
    core::CandleBatch large;
    large.symbol = "ETHUSDT";
    for (int i = 0; i < 2500; ++i) {
        large.candles.push_back(core::PriceCandle{i * 60000LL, 1.0, 2.0, 0.5, 1.5, 3.0});
    }
    std::vector<std::vector<uint8_t>> frames;
    assert(codec::encode_candle_chunks(large, 1000, &frames) == CANDLECAST_OK);
    assert(frames.size() == 3);
    size_t total = 0;
    for (const auto& f : frames) {
        core::CandleBatch part;
        assert(codec::decode_candle_batch(f.data(), f.size(), &part) == CANDLECAST_OK);
        assert(part.symbol == "ETHUSDT");
        total += part.candles.size();
    }
    assert(total == 2500);
    assert(codec::encode_candle_chunks(large, 0, &frames) == CANDLECAST_ERR_INVALID);

    // CRC32 check value and corruption detection.
    const char check[] = "123456789";
    assert(bus::compute_crc32(reinterpret_cast<const uint8_t*>(check), 9) == 0xCBF43926U);

    const char payload[] = "candle-payload";
    std::vector<uint8_t> raw =
        bus::encode_frame(bus::FrameType::CandleBatch, bus::PayloadEncoding::Packed, payload, sizeof(payload), 42);
    assert(raw.size() == sizeof(bus::FrameHeader) + sizeof(payload));
    bus::Frame parsed{};
    assert(bus::decode_frame(raw.data(), raw.size(), &parsed) == CANDLECAST_OK);
    assert(parsed.header.timestamp_ns == 42);
    assert(parsed.header.encoding == static_cast<uint16_t>(bus::PayloadEncoding::Packed));
    assert(std::memcmp(parsed.payload, payload, sizeof(payload)) == 0);
    raw.back() ^= 0x01;
    assert(bus::decode_frame(raw.data(), raw.size(), &parsed) == CANDLECAST_ERR_PROTO);

    std::vector<uint8_t> flipped = frame;
    flipped[sizeof(bus::FrameHeader) + 3] ^= 0x40;
    assert(codec::decode_candle_batch(flipped.data(), flipped.size(), &decoded) == CANDLECAST_ERR_PROTO);

    std::vector<uint8_t> bad_version = frame;
    bad_version[0] = 9;
    assert(bus::decode_frame(bad_version.data(), bad_version.size(), &parsed) == CANDLECAST_ERR_PROTO);

    // A frame whose encoding this build does not know is refused.
    std::vector<uint8_t> foreign =
        bus::encode_frame(bus::FrameType::CandleBatch, bus::PayloadEncoding::Json, json, sizeof(json) - 1, 1);
    assert(codec::decode_candle_batch(foreign.data(), foreign.size(), &decoded) == CANDLECAST_ERR_PROTO);

    return 0;
}
