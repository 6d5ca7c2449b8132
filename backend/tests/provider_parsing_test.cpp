#include "inference/inference_provider.hpp"
#include "marketdata/market_data_source.hpp"

#include <cassert>
#include <string>
#include <vector>

int main() {
    using namespace candlecast;

    // Klines: prices arrive as strings, the still-open candle is dropped.
    const std::string page = R"([
        [1700000040000, "37000.5", "37010.0", "36990.0", "37005.0", "12.5", 1700000099999, "0", 10, "0", "0", "0"],
        [1700000100000, "37005.0", "37020.0", "37000.0", "37015.0", "8.25", 1700000159999, "0", 7, "0", "0", "0"]
    ])";
    std::vector<core::PriceCandle> candles;
    size_t raw_rows = 0;
    assert(marketdata::BinanceKlineSource::parse_klines(page, 1700000120000, &candles, &raw_rows).is_ok());
    assert(raw_rows == 2);
    assert(candles.size() == 1);
    assert(candles[0].open_time_ms == 1700000040000);
    assert(candles[0].open == 37000.5);
    assert(candles[0].volume == 12.5);

    candles.clear();
    assert(marketdata::BinanceKlineSource::parse_klines(page, 1700000200000, &candles, &raw_rows).is_ok());
    assert(candles.size() == 2);

    candles.clear();
    assert(marketdata::BinanceKlineSource::parse_klines("{\"code\":-1121}", 0, &candles, &raw_rows).error() ==
           core::ErrorCode::Parse);
    assert(marketdata::BinanceKlineSource::parse_klines("[[1, \"x\", \"1\", \"1\", \"1\", \"1\", 2]]", 10, &candles,
                                                        &raw_rows).error() == core::ErrorCode::Parse);
    assert(marketdata::BinanceKlineSource::parse_klines("[[1, 2, 3]]", 10, &candles, &raw_rows).error() ==
           core::ErrorCode::Parse);

    // Versions are zero-based on the wire.
    auto index = inference::HttpInferenceProvider::version_index("v1");
    assert(index && index.value() == 0);
    index = inference::HttpInferenceProvider::version_index("v3");
    assert(index && index.value() == 2);
    assert(inference::HttpInferenceProvider::version_index("latest").error() == core::ErrorCode::Invalid);

    std::vector<inference::Prediction> predictions;
    assert(inference::HttpInferenceProvider::parse_predictions(R"({"predictions": [[0.2, 0.3, 0.5], 0.7]})", 2,
                                                               &predictions).is_ok());
    assert(predictions.size() == 2);
    assert(predictions[0].size() == 3 && predictions[0][2] == 0.5);
    assert(predictions[1].size() == 1 && predictions[1][0] == 0.7);

    predictions.clear();
    assert(inference::HttpInferenceProvider::parse_predictions(R"({"predictions": [0.1]})", 2, &predictions).error() ==
           core::ErrorCode::Proto);
    assert(inference::HttpInferenceProvider::parse_predictions(R"({"result": []})", 0, &predictions).error() ==
           core::ErrorCode::Parse);
    assert(inference::HttpInferenceProvider::parse_predictions(R"({"predictions": ["up"]})", 1, &predictions).error() ==
           core::ErrorCode::Parse);
    return 0;
}
