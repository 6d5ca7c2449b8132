#pragma once

#include "core/errors.h"
#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace candlecast::codec {

// Packed payload: u16 symbol length, symbol bytes, u32 count, PriceCandle records.
CandlecastStatus encode_candle_batch(const core::CandleBatch& batch, std::vector<uint8_t>* out);

// Accepts packed frames, and FlatBuffers frames when built with CANDLECAST_USE_FLATBUFFERS.
CandlecastStatus decode_candle_batch(const void* data, size_t size, core::CandleBatch* out);

#ifdef CANDLECAST_USE_FLATBUFFERS
CandlecastStatus encode_candle_batch_flatbuffers(const core::CandleBatch& batch, std::vector<uint8_t>* out);
#endif

// Splits candles into batches of at most chunk records and encodes each one.
CandlecastStatus encode_candle_chunks(const core::CandleBatch& batch, size_t chunk,
                                      std::vector<std::vector<uint8_t>>* out);

} // namespace candlecast::codec
