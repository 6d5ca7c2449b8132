#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace candlecast::core {

// One closed one-minute candle. The symbol travels with the enclosing batch.
struct PriceCandle {
    int64_t open_time_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

static_assert(sizeof(PriceCandle) == 48, "PriceCandle must be 48 bytes.");
static_assert(std::is_trivially_copyable<PriceCandle>::value, "PriceCandle is sent as raw bytes.");

struct CandleBatch {
    std::string symbol;
    std::vector<PriceCandle> candles;
};

// high >= max(open, close, low), low <= min(open, close, high), volume >= 0.
bool validate_candle(const PriceCandle& candle);

enum class ControlState {
    Pending,
    Wait,
    Start,
    Running,
    Pause,
    Paused,
    Delete,
    Deleted,
    Error,
    Unknown
};

const char* to_string(ControlState state);
bool parse_control_state(std::string_view text, ControlState* out);

// DELETED or UNKNOWN: the process is gone or never registered.
inline bool is_stopped(ControlState state) {
    return state == ControlState::Deleted || state == ControlState::Unknown;
}

/**
 * @brief Identity of a pipeline process in the control plane.
 * Producers use the fixed key ("ALL", "producer", "main").
 */
struct EntityKey {
    std::string symbol;
    std::string model;
    std::string version;

    static EntityKey producer() { return EntityKey{"ALL", "producer", "main"}; }
    static EntityKey consumer(std::string symbol, std::string model, std::string version) {
        return EntityKey{std::move(symbol), std::move(model), std::move(version)};
    }

    bool is_producer() const { return model == "producer"; }
    std::string id() const { return symbol + "_" + model + "_" + version; }

    bool operator==(const EntityKey& other) const {
        return symbol == other.symbol && model == other.model && version == other.version;
    }
    bool operator!=(const EntityKey& other) const { return !(*this == other); }
    bool operator<(const EntityKey& other) const { return id() < other.id(); }
};

enum class TrainingState {
    Pending,
    Running,
    Success,
    Failed
};

const char* to_string(TrainingState state);
bool parse_training_state(std::string_view text, TrainingState* out);

inline bool is_terminal(TrainingState state) {
    return state == TrainingState::Success || state == TrainingState::Failed;
}

// "v3" -> 3. Returns -1 when the label is not of the form v<N>.
int version_number(std::string_view version);

// Column holding a model version's prediction, e.g. ("lightgbm", "v1") -> "lightgbm_1".
std::string prediction_column(const std::string& model, const std::string& version);

std::string to_lower(std::string_view text);
std::string to_upper(std::string_view text);
std::vector<std::string> split(std::string_view text, char delim);

} // namespace candlecast::core
