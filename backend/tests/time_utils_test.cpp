#include "core/time_utils.hpp"
#include "core/types.hpp"

#include <cassert>
#include <string>

int main() {
    using namespace candlecast::core;

    const int64_t ts = 1700000000000LL; // 2023-11-14 22:13:20 UTC
    assert(format_iso8601(ts) == "2023-11-14T22:13:20+00:00");
    assert(format_ledger_time(ts) == "2023-11-14 22:13:20+00:00");
    assert(format_file_stamp(ts) == "20231114_221320");

    int64_t parsed = 0;
    assert(parse_iso8601("2023-11-14T22:13:20+00:00", &parsed) && parsed == ts);
    assert(parse_iso8601("2023-11-14 22:13:20", &parsed) && parsed == ts);
    assert(parse_iso8601("2023-11-14T22:13:20.250Z", &parsed) && parsed == ts + 250);
    assert(parse_iso8601("1700000000000", &parsed) && parsed == ts);
    assert(!parse_iso8601("2023-13-14T22:13:20", &parsed));
    assert(!parse_iso8601("2023-11-14T22:13:20+02:00", &parsed));
    assert(!parse_iso8601("", &parsed));

    assert(next_minute_boundary(ts) == ts + 40000);
    assert(next_minute_boundary(ts + 40000) == ts + 40000 + kMillisPerMinute);

    std::string utc = to_utc(1700000000123456789ULL);
    assert(utc == "2023-11-14 22:13:20.123456789+00");

    // Candle validation
    PriceCandle good{ts, 100.0, 110.0, 95.0, 105.0, 12.5};
    assert(validate_candle(good));
    PriceCandle inverted = good;
    inverted.high = 90.0;
    assert(!validate_candle(inverted));
    PriceCandle negative_volume = good;
    negative_volume.volume = -1.0;
    assert(!validate_candle(negative_volume));

    // Names and columns
    assert(version_number("v3") == 3);
    assert(version_number("3") == -1);
    assert(prediction_column("lightgbm", "v1") == "lightgbm_1");
    ControlState state = ControlState::Unknown;
    assert(parse_control_state("RUNNING", &state) && state == ControlState::Running);
    assert(!parse_control_state("BOGUS", &state));
    TrainingState training = TrainingState::Pending;
    assert(parse_training_state("success", &training) && training == TrainingState::Success);
    assert(is_terminal(TrainingState::Failed) && !is_terminal(TrainingState::Running));

    EntityKey producer = EntityKey::producer();
    assert(producer.id() == "ALL_producer_main");
    assert(producer.is_producer());
    assert(EntityKey::consumer("BTCUSDT", "lightgbm", "v1").id() == "BTCUSDT_lightgbm_v1");
    assert(split("a,,b,c", ',').size() == 3);

    return 0;
}
