#pragma once

#include "core/types.hpp"
#include "inference/inference_provider.hpp"

#include <vector>

namespace candlecast::pipeline {

constexpr size_t kFeatureColumns = 5; // open, high, low, close, volume

/**
 * @brief Min-max normalise each OHLCV column over the window and flatten
 * row-major (seq_len * 5 values). Constant columns are left unscaled.
 * Shorter windows are zero-padded at the front to seq_len rows.
 */
inference::FeatureVector build_features(const std::vector<core::PriceCandle>& window, size_t seq_len);

} // namespace candlecast::pipeline
