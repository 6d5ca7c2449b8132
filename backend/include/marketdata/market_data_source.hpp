#pragma once

#include "core/error.hpp"
#include "core/retry.hpp"
#include "core/types.hpp"
#include "net/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace candlecast::marketdata {

/**
 * @class MarketDataSource
 * @brief Source of closed one-minute candles.
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    // All closed candles with open_time > after_ms, ascending.
    virtual core::Expected<std::vector<core::PriceCandle>> fetch_since(const std::string& symbol, int64_t after_ms) = 0;
};

struct BinanceKlineOptions {
    std::string base_url = "https://api.binance.com";
    std::string interval = "1m";
    size_t page_limit = 1000;
    std::chrono::milliseconds page_delay{250};
    std::chrono::seconds timeout{30};
    core::RetryPolicy retry{};
    core::Sleeper sleeper = core::sleep_for_ms;
};

// Paginated /api/v3/klines reader.
class BinanceKlineSource final : public MarketDataSource {
public:
    explicit BinanceKlineSource(BinanceKlineOptions options = {});

    core::Expected<std::vector<core::PriceCandle>> fetch_since(const std::string& symbol, int64_t after_ms) override;

    // Parses one klines page, keeping rows whose close time is before now_ms.
    static core::Status parse_klines(const std::string& body, int64_t now_ms, std::vector<core::PriceCandle>* out,
                                     size_t* raw_rows);

private:
    BinanceKlineOptions options_;
    net::HttpClient http_;
};

} // namespace candlecast::marketdata
