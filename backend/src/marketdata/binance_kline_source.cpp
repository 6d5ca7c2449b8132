#include "marketdata/market_data_source.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace candlecast::marketdata {

namespace {

bool number_field(const nlohmann::json& value, double* out) {
    if (value.is_number()) {
        *out = value.get<double>();
        return true;
    }
    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        char* end = nullptr;
        *out = std::strtod(text.c_str(), &end);
        return end && *end == '\0' && !text.empty();
    }
    return false;
}

} // namespace

BinanceKlineSource::BinanceKlineSource(BinanceKlineOptions options)
    : options_(std::move(options)) {
    if (options_.page_limit == 0) options_.page_limit = 1000;
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
}

core::Status BinanceKlineSource::parse_klines(const std::string& body, int64_t now_ms,
                                              std::vector<core::PriceCandle>* out, size_t* raw_rows) {
    auto page = nlohmann::json::parse(body, nullptr, false);
    if (page.is_discarded() || !page.is_array()) {
        return core::make_error(core::ErrorCode::Parse, "klines response is not a JSON array");
    }
    if (raw_rows) *raw_rows = page.size();
    for (const auto& row : page) {
        if (!row.is_array() || row.size() < 7 || !row[0].is_number_integer() || !row[6].is_number_integer()) {
            return core::make_error(core::ErrorCode::Parse, "malformed kline row");
        }
        core::PriceCandle candle{};
        candle.open_time_ms = row[0].get<int64_t>();
        const int64_t close_time_ms = row[6].get<int64_t>();
        if (!number_field(row[1], &candle.open) || !number_field(row[2], &candle.high) ||
            !number_field(row[3], &candle.low) || !number_field(row[4], &candle.close) ||
            !number_field(row[5], &candle.volume)) {
            return core::make_error(core::ErrorCode::Parse, "non-numeric kline field");
        }
        if (close_time_ms >= now_ms) continue; // still open
        out->push_back(candle);
    }
    return core::Status::ok();
}

core::Expected<std::vector<core::PriceCandle>> BinanceKlineSource::fetch_since(const std::string& symbol,
                                                                               int64_t after_ms) {
    std::vector<core::PriceCandle> candles;
    int64_t start = after_ms + 1;
    for (;;) {
        const std::string url = options_.base_url + "/api/v3/klines?symbol=" + net::HttpClient::url_encode(symbol) +
                                "&interval=" + options_.interval + "&startTime=" + std::to_string(start) +
                                "&limit=" + std::to_string(options_.page_limit);
        auto response = core::retry_with_backoff(
            options_.retry, [&] { return http_.get(url, options_.timeout); }, options_.sleeper);
        if (!response) return response.error_info();

        std::vector<core::PriceCandle> page;
        size_t raw_rows = 0;
        core::Status parsed = parse_klines(response.value().body, core::unix_now_ms(), &page, &raw_rows);
        if (!parsed) return parsed.error_info();

        for (const auto& candle : page) {
            if (candle.open_time_ms > after_ms && (candles.empty() || candle.open_time_ms > candles.back().open_time_ms)) {
                candles.push_back(candle);
            }
        }
        if (raw_rows < options_.page_limit || page.empty()) break;
        start = page.back().open_time_ms + 1;
        options_.sleeper(options_.page_delay);
    }
    if (!candles.empty()) {
        audit::log_info("Fetched " + std::to_string(candles.size()) + " candles for " + symbol + " since " +
                        core::format_iso8601(after_ms));
    }
    return candles;
}

} // namespace candlecast::marketdata
