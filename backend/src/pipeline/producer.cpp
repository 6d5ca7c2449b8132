#include "pipeline/producer.hpp"

#include "audit/logger.hpp"
#include "codec/candle_batch_codec.hpp"
#include "core/time_utils.hpp"

#include <algorithm>

namespace candlecast::pipeline {

const char* to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Published: return "published";
        case CycleOutcome::NoData: return "no_data";
        case CycleOutcome::Paused: return "paused";
        case CycleOutcome::Stopped: return "stopped";
        case CycleOutcome::FetchFailed: return "fetch_failed";
        case CycleOutcome::PublishFailed: return "publish_failed";
        case CycleOutcome::PersistFailed: return "persist_failed";
    }
    return "unknown";
}

Producer::Producer(ProducerOptions options,
                   control::ControlPlane& control,
                   marketdata::MarketDataSource& source,
                   persist::CandleRepository& repository,
                   persist::LedgerFile& ledger,
                   bus::MessageBus& bus)
    : options_(std::move(options)),
      control_(control),
      source_(source),
      repository_(repository),
      ledger_(ledger),
      bus_(bus) {
    options_.symbol = core::to_upper(options_.symbol);
    if (options_.publish_chunk == 0) options_.publish_chunk = 1000;
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
    if (!options_.clock) options_.clock = core::unix_now_ms;
}

core::Status Producer::start() {
    auto rows = ledger_.load_candles();
    if (!rows) {
        audit::log_warn("Cannot read ledger " + ledger_.path().string() + ": " + rows.message());
    } else if (!rows.value().empty()) {
        last_time_ = rows.value().back().open_time_ms;
        audit::log_info("Found existing ledger, last time " + core::format_iso8601(*last_time_));
        auto synced = repository_.sync_from_ledger(options_.symbol, rows.value(), options_.max_initial_sync_rows);
        if (!synced) {
            audit::log_error("Initial store sync failed: " + synced.message());
            return synced.error_info();
        }
        if (synced.value() > 0) {
            audit::log_info("Synced " + std::to_string(synced.value()) + " ledger rows to the store");
        }
    }
    return control_.write(core::EntityKey::producer(), core::ControlState::Running);
}

core::Status Producer::publish(const core::CandleBatch& batch) {
    std::vector<std::vector<uint8_t>> frames;
    CandlecastStatus status = codec::encode_candle_chunks(batch, options_.publish_chunk, &frames);
    if (status != CANDLECAST_OK) {
        return core::make_error(core::to_error(status), std::string("encode failed: ") + candlecast_status_name(status));
    }
    for (size_t i = 0; i < frames.size(); ++i) {
        status = bus_.publish(topic(), frames[i].data(), frames[i].size());
        if (status != CANDLECAST_OK) {
            return core::make_error(core::to_error(status), "publish of chunk " + std::to_string(i + 1) + "/" +
                                                                std::to_string(frames.size()) + " to " + topic() +
                                                                " failed: " + candlecast_status_name(status));
        }
    }
    audit::log_info("Published " + std::to_string(batch.candles.size()) + " candles in " +
                    std::to_string(frames.size()) + " messages to " + topic());
    return core::Status::ok();
}

CycleOutcome Producer::run_cycle() {
    const core::EntityKey self = core::EntityKey::producer();
    const core::ControlState state = control_.current(self);
    if (state == core::ControlState::Delete) {
        audit::log_info("Received delete command, shutting down");
        core::Status written = control_.write(self, core::ControlState::Deleted);
        if (!written) audit::log_error("Failed to report DELETED: " + written.message());
        return CycleOutcome::Stopped;
    }
    if (state == core::ControlState::Pause || state == core::ControlState::Paused) {
        if (state == core::ControlState::Pause) {
            core::Status written = control_.write(self, core::ControlState::Paused);
            if (!written) audit::log_warn("Failed to report PAUSED: " + written.message());
        }
        return CycleOutcome::Paused;
    }
    if (state == core::ControlState::Start) {
        core::Status written = control_.write(self, core::ControlState::Running);
        if (!written) audit::log_warn("Failed to report RUNNING: " + written.message());
    }

    const int64_t after = last_time_ ? *last_time_ : options_.clock() - options_.initial_lookback_ms;
    auto fetched = source_.fetch_since(options_.symbol, after);
    if (!fetched) {
        audit::log_error("Fetch for " + options_.symbol + " failed: " + fetched.message());
        return CycleOutcome::FetchFailed;
    }

    core::CandleBatch batch;
    batch.symbol = options_.symbol;
    size_t invalid = 0;
    for (const auto& candle : fetched.value()) {
        if (candle.open_time_ms <= after) continue;
        if (!core::validate_candle(candle)) {
            ++invalid;
            continue;
        }
        batch.candles.push_back(candle);
    }
    if (invalid > 0) {
        audit::log_warn("Dropped " + std::to_string(invalid) + " candles failing OHLCV invariants");
    }
    std::sort(batch.candles.begin(), batch.candles.end(),
              [](const core::PriceCandle& a, const core::PriceCandle& b) { return a.open_time_ms < b.open_time_ms; });
    if (batch.candles.empty()) {
        audit::log_info("No new data available, waiting");
        return CycleOutcome::NoData;
    }

    core::Status stored = repository_.bulk_insert(options_.symbol, batch.candles);
    if (!stored) {
        audit::log_error("Store update failed, stopping producer: " + stored.message());
        return CycleOutcome::PersistFailed;
    }

    core::Status appended = ledger_.append_candles(batch.candles);
    if (!appended) {
        audit::log_error("Ledger append failed: " + appended.message());
    }

    core::Status published = publish(batch);
    if (!published) {
        audit::log_error(published.message());
        return CycleOutcome::PublishFailed;
    }
    last_time_ = batch.candles.back().open_time_ms;
    return CycleOutcome::Published;
}

void Producer::sleep_to_next_minute() {
    const int64_t now = options_.clock();
    const int64_t wait = core::next_minute_boundary(now) - now;
    if (wait > 0) options_.sleeper(std::chrono::milliseconds(wait));
}

int Producer::run() {
    while (!stop_requested_.load()) {
        switch (run_cycle()) {
            case CycleOutcome::Stopped:
                audit::log_info("Producer stopped");
                return 0;
            case CycleOutcome::PersistFailed: {
                core::Status written = control_.write(core::EntityKey::producer(), core::ControlState::Error,
                                                      std::string("store update failed"));
                if (!written) audit::log_error("Failed to report ERROR: " + written.message());
                return 1;
            }
            case CycleOutcome::Published:
                sleep_to_next_minute();
                break;
            case CycleOutcome::NoData:
                options_.sleeper(options_.idle_sleep);
                break;
            case CycleOutcome::Paused:
                options_.sleeper(options_.pause_sleep);
                break;
            case CycleOutcome::FetchFailed:
            case CycleOutcome::PublishFailed:
                options_.sleeper(options_.error_sleep);
                break;
        }
    }
    audit::log_info("Producer interrupted, reporting DELETED");
    core::Status written = control_.write(core::EntityKey::producer(), core::ControlState::Deleted);
    if (!written) audit::log_error("Failed to report DELETED: " + written.message());
    return 0;
}

} // namespace candlecast::pipeline
