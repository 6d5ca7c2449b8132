#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace candlecast::core {

bool validate_candle(const PriceCandle& candle) {
    const double values[] = {candle.open, candle.high, candle.low, candle.close, candle.volume};
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    if (candle.open_time_ms < 0) return false;
    if (candle.volume < 0.0) return false;
    if (candle.high < std::max({candle.open, candle.close, candle.low})) return false;
    if (candle.low > std::min({candle.open, candle.close, candle.high})) return false;
    return true;
}

namespace {

struct ControlStateName {
    ControlState state;
    const char* name;
};

constexpr ControlStateName kControlStateNames[] = {
    {ControlState::Pending, "pending"},
    {ControlState::Wait, "wait"},
    {ControlState::Start, "start"},
    {ControlState::Running, "running"},
    {ControlState::Pause, "pause"},
    {ControlState::Paused, "paused"},
    {ControlState::Delete, "delete"},
    {ControlState::Deleted, "deleted"},
    {ControlState::Error, "error"},
    {ControlState::Unknown, "unknown"},
};

} // namespace

const char* to_string(ControlState state) {
    for (const auto& entry : kControlStateNames) {
        if (entry.state == state) return entry.name;
    }
    return "unknown";
}

bool parse_control_state(std::string_view text, ControlState* out) {
    if (!out) return false;
    const std::string lowered = to_lower(text);
    for (const auto& entry : kControlStateNames) {
        if (lowered == entry.name) {
            *out = entry.state;
            return true;
        }
    }
    return false;
}

const char* to_string(TrainingState state) {
    switch (state) {
        case TrainingState::Pending: return "PENDING";
        case TrainingState::Running: return "RUNNING";
        case TrainingState::Success: return "SUCCESS";
        case TrainingState::Failed: return "FAILED";
    }
    return "PENDING";
}

bool parse_training_state(std::string_view text, TrainingState* out) {
    if (!out) return false;
    const std::string upper = to_upper(text);
    if (upper == "PENDING") *out = TrainingState::Pending;
    else if (upper == "RUNNING") *out = TrainingState::Running;
    else if (upper == "SUCCESS") *out = TrainingState::Success;
    else if (upper == "FAILED") *out = TrainingState::Failed;
    else return false;
    return true;
}

int version_number(std::string_view version) {
    if (version.size() < 2 || (version[0] != 'v' && version[0] != 'V')) return -1;
    int value = 0;
    for (size_t i = 1; i < version.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(version[i]))) return -1;
        value = value * 10 + (version[i] - '0');
        if (value > 1000000) return -1;
    }
    return value;
}

std::string prediction_column(const std::string& model, const std::string& version) {
    const int number = version_number(version);
    if (number < 0) return model + "_" + version;
    return model + "_" + std::to_string(number);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<std::string> split(std::string_view text, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t pos = text.find(delim, start);
        if (pos == std::string_view::npos) pos = text.size();
        std::string part(text.substr(start, pos - start));
        if (!part.empty()) parts.push_back(std::move(part));
        start = pos + 1;
    }
    return parts;
}

} // namespace candlecast::core
