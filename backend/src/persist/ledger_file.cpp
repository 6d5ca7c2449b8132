#include "persist/ledger_file.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace candlecast::persist {

namespace {

constexpr const char* kCandleHeader = "open_time,open,high,low,close,volume";
constexpr const char* kPredictionHeader = "open_time,pred";

bool parse_double(const std::string& text, double* out) {
    if (text.empty()) return false;
    char* end = nullptr;
    *out = std::strtod(text.c_str(), &end);
    return end && *end == '\0';
}

std::string format_prediction(const inference::Prediction& values) {
    std::string out = "\"[";
    char buf[64];
    for (size_t i = 0; i < values.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%s%.10g", i == 0 ? "" : ", ", values[i]);
        out += buf;
    }
    out += "]\"";
    return out;
}

} // namespace

std::filesystem::path candle_ledger_path(const std::string& data_path, const std::string& symbol) {
    return std::filesystem::path(data_path) / "prices" / (core::to_upper(symbol) + ".csv");
}

std::filesystem::path prediction_ledger_path(const std::string& data_path, const std::string& symbol,
                                             const std::string& model, const std::string& version) {
    return std::filesystem::path(data_path) / "predictions" / core::to_upper(symbol) / model / (version + ".csv");
}

LedgerFile::LedgerFile(std::filesystem::path path)
    : path_(std::move(path)) {}

bool LedgerFile::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

core::Status LedgerFile::append_lines(const char* header, const std::vector<std::string>& lines) {
    if (lines.empty()) return core::Status::ok();
    std::error_code ec;
    if (!path_.parent_path().empty()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return core::make_error(core::ErrorCode::Io, "cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }
    const bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;
    std::ofstream file(path_, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        return core::make_error(core::ErrorCode::Io, "cannot open " + path_.string());
    }
    if (fresh) file << header << '\n';
    for (const auto& line : lines) {
        file << line << '\n';
    }
    file.flush();
    if (!file) {
        return core::make_error(core::ErrorCode::Io, "write to " + path_.string() + " failed");
    }
    return core::Status::ok();
}

core::Expected<std::vector<std::string>> LedgerFile::read_lines() const {
    std::vector<std::string> lines;
    if (!exists()) return lines;
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return core::make_error(core::ErrorCode::Io, "cannot open " + path_.string());
    }
    std::string line;
    bool header = true;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (header) {
            header = false;
            if (line.rfind("open_time", 0) == 0) continue;
        }
        if (!line.empty()) lines.push_back(std::move(line));
    }
    return lines;
}

core::Status LedgerFile::append_candles(const std::vector<core::PriceCandle>& candles) {
    std::vector<std::string> lines;
    lines.reserve(candles.size());
    char buf[256];
    for (const auto& candle : candles) {
        std::snprintf(buf, sizeof(buf), "%s,%.10g,%.10g,%.10g,%.10g,%.10g",
                      core::format_ledger_time(candle.open_time_ms).c_str(),
                      candle.open, candle.high, candle.low, candle.close, candle.volume);
        lines.emplace_back(buf);
    }
    return append_lines(kCandleHeader, lines);
}

core::Expected<std::vector<core::PriceCandle>> LedgerFile::load_candles() const {
    auto lines = read_lines();
    if (!lines) return lines.error_info();
    std::vector<core::PriceCandle> candles;
    candles.reserve(lines.value().size());
    size_t malformed = 0;
    for (const auto& line : lines.value()) {
        auto fields = core::split(line, ',');
        core::PriceCandle candle{};
        if (fields.size() < 6 || !core::parse_iso8601(fields[0], &candle.open_time_ms) ||
            !parse_double(fields[1], &candle.open) || !parse_double(fields[2], &candle.high) ||
            !parse_double(fields[3], &candle.low) || !parse_double(fields[4], &candle.close) ||
            !parse_double(fields[5], &candle.volume)) {
            ++malformed;
            continue;
        }
        candles.push_back(candle);
    }
    if (malformed > 0) {
        audit::log_warn("Skipped " + std::to_string(malformed) + " malformed rows in " + path_.string());
    }
    std::stable_sort(candles.begin(), candles.end(), [](const core::PriceCandle& a, const core::PriceCandle& b) {
        return a.open_time_ms < b.open_time_ms;
    });
    // Keep the last occurrence of a repeated open_time.
    std::vector<core::PriceCandle> unique;
    unique.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!unique.empty() && unique.back().open_time_ms == candle.open_time_ms) {
            unique.back() = candle;
        } else {
            unique.push_back(candle);
        }
    }
    return unique;
}

core::Expected<std::optional<int64_t>> LedgerFile::last_open_time() const {
    auto candles = load_candles();
    if (!candles) return candles.error_info();
    if (candles.value().empty()) return std::optional<int64_t>();
    return std::optional<int64_t>(candles.value().back().open_time_ms);
}

core::Status LedgerFile::append_predictions(const std::vector<PredictionRow>& rows) {
    std::vector<std::string> lines;
    lines.reserve(rows.size());
    for (const auto& row : rows) {
        lines.push_back(core::format_ledger_time(row.open_time_ms) + "," + format_prediction(row.values));
    }
    return append_lines(kPredictionHeader, lines);
}

core::Expected<std::vector<PredictionRow>> LedgerFile::load_predictions() const {
    auto lines = read_lines();
    if (!lines) return lines.error_info();
    std::vector<PredictionRow> rows;
    for (const auto& line : lines.value()) {
        const size_t comma = line.find(',');
        if (comma == std::string::npos) continue;
        PredictionRow row;
        if (!core::parse_iso8601(line.substr(0, comma), &row.open_time_ms)) continue;
        std::string pred = line.substr(comma + 1);
        if (pred.size() >= 2 && pred.front() == '"' && pred.back() == '"') {
            pred = pred.substr(1, pred.size() - 2);
        }
        auto values = nlohmann::json::parse(pred, nullptr, false);
        if (values.is_number()) {
            row.values.push_back(values.get<double>());
        } else if (values.is_array()) {
            for (const auto& v : values) {
                if (v.is_number()) row.values.push_back(v.get<double>());
            }
        } else {
            continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace candlecast::persist
