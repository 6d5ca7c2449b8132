#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "inference/inference_provider.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace candlecast::persist {

struct PredictionRow {
    int64_t open_time_ms = 0;
    inference::Prediction values;
};

// DATA_PATH/prices/{SYMBOL}.csv
std::filesystem::path candle_ledger_path(const std::string& data_path, const std::string& symbol);
// DATA_PATH/predictions/{SYMBOL}/{model}/{version}.csv
std::filesystem::path prediction_ledger_path(const std::string& data_path, const std::string& symbol,
                                             const std::string& model, const std::string& version);

/**
 * @class LedgerFile
 * @brief Local append-only CSV file.
 * Candle ledgers hold "open_time,open,high,low,close,volume" rows, prediction
 * ledgers hold "open_time,pred" rows. The header is written on first append.
 */
class LedgerFile {
public:
    explicit LedgerFile(std::filesystem::path path);

    core::Status append_candles(const std::vector<core::PriceCandle>& candles);
    // Rows sorted by open_time with duplicates removed; empty when the file does not exist.
    core::Expected<std::vector<core::PriceCandle>> load_candles() const;
    core::Expected<std::optional<int64_t>> last_open_time() const;

    core::Status append_predictions(const std::vector<PredictionRow>& rows);
    core::Expected<std::vector<PredictionRow>> load_predictions() const;

    bool exists() const;
    const std::filesystem::path& path() const { return path_; }

private:
    core::Status append_lines(const char* header, const std::vector<std::string>& lines);
    core::Expected<std::vector<std::string>> read_lines() const;

    std::filesystem::path path_;
};

} // namespace candlecast::persist
