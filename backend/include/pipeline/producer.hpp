#pragma once

#include "bus/message_bus.hpp"
#include "control/control_plane.hpp"
#include "core/retry.hpp"
#include "core/time_utils.hpp"
#include "marketdata/market_data_source.hpp"
#include "persist/candle_repository.hpp"
#include "persist/ledger_file.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace candlecast::pipeline {

struct ProducerOptions {
    std::string symbol = "BTCUSDT";
    size_t publish_chunk = 1000;
    int64_t initial_lookback_ms = core::kMillisPerDay;
    size_t max_initial_sync_rows = 100000;
    std::chrono::milliseconds idle_sleep{60000};
    std::chrono::milliseconds pause_sleep{10000};
    std::chrono::milliseconds error_sleep{10000};
    core::Sleeper sleeper = core::sleep_for_ms;
    std::function<int64_t()> clock = core::unix_now_ms;
};

enum class CycleOutcome {
    Published,
    NoData,
    Paused,
    Stopped,
    FetchFailed,
    PublishFailed,
    PersistFailed
};

const char* to_string(CycleOutcome outcome);

/**
 * @class Producer
 * @brief Keeps the price ledger current and publishes new candles.
 * Each cycle fetches everything after last_time, persists it to the store
 * (fatal on failure), appends it to the local ledger (best effort), then
 * publishes it in chunks. last_time advances only after every chunk is out.
 */
class Producer {
public:
    Producer(ProducerOptions options,
             control::ControlPlane& control,
             marketdata::MarketDataSource& source,
             persist::CandleRepository& repository,
             persist::LedgerFile& ledger,
             bus::MessageBus& bus);

    // Syncs the store from the ledger, recovers last_time and reports RUNNING.
    core::Status start();

    CycleOutcome run_cycle();

    // Cycles until DELETE or request_stop(); returns the process exit code.
    int run();

    void request_stop() { stop_requested_.store(true); }
    std::optional<int64_t> last_time() const { return last_time_; }
    const std::string& topic() const { return options_.symbol; }

private:
    core::Status publish(const core::CandleBatch& batch);
    void sleep_to_next_minute();

    ProducerOptions options_;
    control::ControlPlane& control_;
    marketdata::MarketDataSource& source_;
    persist::CandleRepository& repository_;
    persist::LedgerFile& ledger_;
    bus::MessageBus& bus_;
    std::optional<int64_t> last_time_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace candlecast::pipeline
