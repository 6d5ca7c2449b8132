#include "pipeline/feature_builder.hpp"

#include <algorithm>
#include <array>

namespace candlecast::pipeline {

namespace {

std::array<double, kFeatureColumns> columns(const core::PriceCandle& candle) {
    return {candle.open, candle.high, candle.low, candle.close, candle.volume};
}

} // namespace

inference::FeatureVector build_features(const std::vector<core::PriceCandle>& window, size_t seq_len) {
    const size_t rows = std::min(window.size(), seq_len);
    const size_t first = window.size() - rows;

    std::array<double, kFeatureColumns> lo{};
    std::array<double, kFeatureColumns> hi{};
    for (size_t r = 0; r < rows; ++r) {
        const auto values = columns(window[first + r]);
        for (size_t c = 0; c < kFeatureColumns; ++c) {
            if (r == 0 || values[c] < lo[c]) lo[c] = values[c];
            if (r == 0 || values[c] > hi[c]) hi[c] = values[c];
        }
    }

    inference::FeatureVector features(seq_len * kFeatureColumns, 0.0);
    const size_t pad = seq_len - rows;
    for (size_t r = 0; r < rows; ++r) {
        const auto values = columns(window[first + r]);
        for (size_t c = 0; c < kFeatureColumns; ++c) {
            double v = values[c];
            if (hi[c] > lo[c]) v = (v - lo[c]) / (hi[c] - lo[c]);
            features[(pad + r) * kFeatureColumns + c] = v;
        }
    }
    return features;
}

} // namespace candlecast::pipeline
