#include "codec/candle_batch_codec.hpp"

#include "bus/message_protocol.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#ifdef CANDLECAST_USE_FLATBUFFERS
#include "candle_batch_generated.h"
#include <flatbuffers/flatbuffers.h>
#include <flatbuffers/verifier.h>
#endif

namespace candlecast::codec {

namespace {

uint64_t frame_timestamp(const core::CandleBatch& batch) {
    if (batch.candles.empty()) return core::unix_now_ns();
    return static_cast<uint64_t>(batch.candles.back().open_time_ms) * 1000000ULL;
}

CandlecastStatus decode_packed(const uint8_t* payload, size_t size, core::CandleBatch* out) {
    size_t pos = 0;
    uint16_t symbol_len = 0;
    if (size < sizeof(symbol_len)) return CANDLECAST_ERR_PROTO;
    std::memcpy(&symbol_len, payload, sizeof(symbol_len));
    pos += sizeof(symbol_len);
    if (size - pos < symbol_len) return CANDLECAST_ERR_PROTO;
    out->symbol.assign(reinterpret_cast<const char*>(payload + pos), symbol_len);
    pos += symbol_len;

    uint32_t count = 0;
    if (size - pos < sizeof(count)) return CANDLECAST_ERR_PROTO;
    std::memcpy(&count, payload + pos, sizeof(count));
    pos += sizeof(count);
    if ((size - pos) != static_cast<size_t>(count) * sizeof(core::PriceCandle)) return CANDLECAST_ERR_PROTO;

    out->candles.resize(count);
    if (count > 0) {
        std::memcpy(out->candles.data(), payload + pos, static_cast<size_t>(count) * sizeof(core::PriceCandle));
    }
    return CANDLECAST_OK;
}

} // namespace

CandlecastStatus encode_candle_batch(const core::CandleBatch& batch, std::vector<uint8_t>* out) {
    if (!out) return CANDLECAST_ERR_INVALID;
    if (batch.symbol.size() > std::numeric_limits<uint16_t>::max()) return CANDLECAST_ERR_RANGE;
    if (batch.candles.size() > std::numeric_limits<uint32_t>::max()) return CANDLECAST_ERR_RANGE;

    const uint16_t symbol_len = static_cast<uint16_t>(batch.symbol.size());
    const uint32_t count = static_cast<uint32_t>(batch.candles.size());
    std::vector<uint8_t> payload(sizeof(symbol_len) + symbol_len + sizeof(count) + count * sizeof(core::PriceCandle));
    size_t pos = 0;
    std::memcpy(payload.data() + pos, &symbol_len, sizeof(symbol_len));
    pos += sizeof(symbol_len);
    std::memcpy(payload.data() + pos, batch.symbol.data(), symbol_len);
    pos += symbol_len;
    std::memcpy(payload.data() + pos, &count, sizeof(count));
    pos += sizeof(count);
    if (count > 0) {
        std::memcpy(payload.data() + pos, batch.candles.data(), count * sizeof(core::PriceCandle));
    }

    *out = bus::encode_frame(bus::FrameType::CandleBatch, bus::PayloadEncoding::Packed, payload.data(), payload.size(),
                             frame_timestamp(batch));
    return CANDLECAST_OK;
}

#ifdef CANDLECAST_USE_FLATBUFFERS
CandlecastStatus encode_candle_batch_flatbuffers(const core::CandleBatch& batch, std::vector<uint8_t>* out) {
    if (!out) return CANDLECAST_ERR_INVALID;

    flatbuffers::FlatBufferBuilder builder(128 + batch.candles.size() * sizeof(core::PriceCandle));
    std::vector<candlecast::schema::Candle> candles;
    candles.reserve(batch.candles.size());
    for (const auto& c : batch.candles) {
        candles.emplace_back(c.open_time_ms, c.open, c.high, c.low, c.close, c.volume);
    }
    auto symbol = builder.CreateString(batch.symbol);
    auto vec = builder.CreateVectorOfStructs(candles);
    auto root = candlecast::schema::CreateCandleBatch(builder, symbol, vec);
    builder.Finish(root);

    *out = bus::encode_frame(bus::FrameType::CandleBatch,
                             bus::PayloadEncoding::FlatBuffers,
                             builder.GetBufferPointer(),
                             builder.GetSize(),
                             frame_timestamp(batch));
    return CANDLECAST_OK;
}
#endif

CandlecastStatus decode_candle_batch(const void* data, size_t size, core::CandleBatch* out) {
    if (!data || !out) return CANDLECAST_ERR_INVALID;

    bus::Frame frame{};
    CandlecastStatus status = bus::decode_frame(data, size, &frame);
    if (status != CANDLECAST_OK) return status;
    if (frame.header.type != static_cast<uint16_t>(bus::FrameType::CandleBatch)) return CANDLECAST_ERR_PROTO;
    const uint8_t* payload = frame.payload;

#ifdef CANDLECAST_USE_FLATBUFFERS
    if (frame.header.encoding == static_cast<uint16_t>(bus::PayloadEncoding::FlatBuffers)) {
        flatbuffers::Verifier verifier(payload, frame.header.size);
        if (!verifier.VerifyBuffer<candlecast::schema::CandleBatch>(nullptr)) return CANDLECAST_ERR_PROTO;
        const auto* root = flatbuffers::GetRoot<candlecast::schema::CandleBatch>(payload);
        if (!root) return CANDLECAST_ERR_PROTO;
        out->symbol = root->symbol() ? root->symbol()->str() : std::string();
        out->candles.clear();
        if (const auto* candles = root->candles()) {
            out->candles.reserve(candles->size());
            for (const auto* c : *candles) {
                out->candles.push_back(core::PriceCandle{c->open_time_ms(), c->open(), c->high(), c->low(),
                                                         c->close(), c->volume()});
            }
        }
        return CANDLECAST_OK;
    }
#endif

    if (frame.header.encoding != static_cast<uint16_t>(bus::PayloadEncoding::Packed)) return CANDLECAST_ERR_PROTO;
    return decode_packed(payload, frame.header.size, out);
}

CandlecastStatus encode_candle_chunks(const core::CandleBatch& batch, size_t chunk,
                                      std::vector<std::vector<uint8_t>>* out) {
    if (!out || chunk == 0) return CANDLECAST_ERR_INVALID;
    out->clear();
    core::CandleBatch part;
    part.symbol = batch.symbol;
    for (size_t offset = 0; offset < batch.candles.size(); offset += chunk) {
        const size_t end = std::min(batch.candles.size(), offset + chunk);
        part.candles.assign(batch.candles.begin() + static_cast<std::ptrdiff_t>(offset),
                            batch.candles.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<uint8_t> frame;
#ifdef CANDLECAST_USE_FLATBUFFERS
        CandlecastStatus status = encode_candle_batch_flatbuffers(part, &frame);
#else
        CandlecastStatus status = encode_candle_batch(part, &frame);
#endif
        if (status != CANDLECAST_OK) return status;
        out->push_back(std::move(frame));
    }
    return CANDLECAST_OK;
}

} // namespace candlecast::codec
