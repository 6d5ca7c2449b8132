#include "pipeline/consumer.hpp"

#include "audit/logger.hpp"
#include "codec/candle_batch_codec.hpp"
#include "core/time_utils.hpp"
#include "pipeline/feature_builder.hpp"

#include <algorithm>
#include <cstdlib>
#include <unordered_map>

namespace candlecast::pipeline {

namespace {

void exit_now(int code) {
    audit::Logger::instance().flush();
    std::_Exit(code);
}

bool by_open_time(const core::PriceCandle& a, const core::PriceCandle& b) {
    return a.open_time_ms < b.open_time_ms;
}

} // namespace

Consumer::Consumer(ConsumerOptions options,
                   control::ControlPlane& control,
                   inference::InferenceProvider& provider,
                   persist::CandleRepository& repository)
    : options_(std::move(options)),
      control_(control),
      provider_(provider),
      repository_(repository),
      predictions_(persist::prediction_ledger_path(options_.data_path, options_.entity.symbol,
                                                   options_.entity.model, options_.entity.version)) {
    if (options_.seq_len == 0) options_.seq_len = 30;
    if (options_.reconcile_chunk == 0) options_.reconcile_chunk = 5000;
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
    if (!options_.exit_process) options_.exit_process = exit_now;
}

Consumer::~Consumer() {
    stop_monitor();
}

StartupOutcome Consumer::startup(const std::atomic<bool>* cancel) {
    const core::EntityKey& self = options_.entity;
    // A START or DELETE posted before this process came up is honoured, not overwritten.
    const core::ControlState pending = control_.current(self);
    if (pending == core::ControlState::Delete) {
        audit::log_info("Received delete command before start");
        core::Status deleted = control_.write(self, core::ControlState::Deleted);
        if (!deleted) audit::log_error("Failed to report DELETED: " + deleted.message());
        return StartupOutcome::Deleted;
    }
    if (pending == core::ControlState::Start) {
        audit::log_info("Start command already pending");
    } else {
        core::Status waiting = control_.write(self, core::ControlState::Wait);
        if (!waiting) return StartupOutcome::Failed;
        audit::log_info("Waiting for start command");
    }
    while (pending != core::ControlState::Start) {
        control::WaitResult result = control_.wait_for(
            self,
            [](core::ControlState s) { return s == core::ControlState::Start || s == core::ControlState::Delete; },
            options_.start_poll, options_.start_poll, cancel);
        if (result.cancelled) {
            core::Status deleted = control_.write(self, core::ControlState::Deleted);
            if (!deleted) audit::log_error("Failed to report DELETED: " + deleted.message());
            return StartupOutcome::Deleted;
        }
        if (!result.satisfied) continue;
        if (result.state == core::ControlState::Delete) {
            audit::log_info("Received delete command before start");
            core::Status deleted = control_.write(self, core::ControlState::Deleted);
            if (!deleted) audit::log_error("Failed to report DELETED: " + deleted.message());
            return StartupOutcome::Deleted;
        }
        break;
    }

    core::Status written = control_.write(self, core::ControlState::Running);
    if (!written) return StartupOutcome::Failed;

    auto available = provider_.is_model_available(self.model, self.version);
    if (!available || !available.value()) {
        const std::string reason = available ? std::string("Model not available")
                                             : "Availability check failed: " + available.message();
        audit::log_error(self.model + " " + self.version + ": " + reason);
        core::Status failed = control_.write(self, core::ControlState::Error, reason);
        if (!failed) audit::log_error("Failed to report ERROR: " + failed.message());
        return StartupOutcome::Failed;
    }
    return StartupOutcome::Ready;
}

core::Expected<size_t> Consumer::reconcile() {
    const core::EntityKey& self = options_.entity;
    audit::log_info("Starting historical reconciliation for " + self.id());

    auto missing = repository_.missing_prediction_times(self.symbol, self.model, self.version);
    if (!missing) return missing.error_info();
    if (missing.value().empty()) {
        audit::log_info("No missing predictions found");
        return size_t{0};
    }
    audit::log_info("Found " + std::to_string(missing.value().size()) + " missing predictions");

    persist::LedgerFile prices(persist::candle_ledger_path(options_.data_path, self.symbol));
    auto ledger = prices.load_candles();
    if (!ledger) return ledger.error_info();
    if (ledger.value().empty()) {
        audit::log_warn("Price ledger " + prices.path().string() + " is empty, nothing to reconcile");
        return size_t{0};
    }
    const auto& candles = ledger.value();
    std::unordered_map<int64_t, size_t> position;
    position.reserve(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) position[candles[i].open_time_ms] = i;

    std::vector<size_t> targets;
    size_t short_history = 0;
    for (int64_t t : missing.value()) {
        auto it = position.find(t);
        if (it == position.end()) continue;
        if (it->second + 1 < options_.seq_len) {
            ++short_history;
            continue;
        }
        targets.push_back(it->second);
    }
    if (short_history > 0) {
        audit::log_warn("Skipped " + std::to_string(short_history) + " timestamps without " +
                        std::to_string(options_.seq_len) + " candles of history");
    }

    std::vector<persist::ScoredCandle> scored;
    for (size_t offset = 0; offset < targets.size(); offset += options_.reconcile_chunk) {
        const size_t end = std::min(targets.size(), offset + options_.reconcile_chunk);
        std::vector<inference::FeatureVector> rows;
        rows.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            const size_t last = targets[i];
            std::vector<core::PriceCandle> window(candles.begin() + static_cast<std::ptrdiff_t>(last + 1 - options_.seq_len),
                                                  candles.begin() + static_cast<std::ptrdiff_t>(last + 1));
            rows.push_back(build_features(window, options_.seq_len));
        }
        auto predictions = provider_.predict(self.model, self.version, rows);
        if (!predictions) {
            audit::log_error("Reconciliation batch " + std::to_string(offset / options_.reconcile_chunk + 1) +
                             " failed: " + predictions.message());
            continue;
        }
        for (size_t i = offset; i < end; ++i) {
            scored.push_back(persist::ScoredCandle{candles[targets[i]], std::move(predictions.value()[i - offset])});
        }
    }
    if (scored.empty()) {
        audit::log_warn("No predictions generated during historical reconciliation");
        return size_t{0};
    }

    core::Status status = repository_.upsert_predictions(self.symbol, self.model, self.version, scored);
    if (!status) {
        audit::log_error("Reconciliation upsert failed: " + status.message());
        return status.error_info();
    }
    record_predictions(scored);
    audit::log_info("Historical reconciliation completed with " + std::to_string(scored.size()) + " predictions");
    return scored.size();
}

void Consumer::record_predictions(const std::vector<persist::ScoredCandle>& scored) {
    std::vector<persist::PredictionRow> rows;
    rows.reserve(scored.size());
    for (const auto& s : scored) {
        rows.push_back(persist::PredictionRow{s.candle.open_time_ms, s.prediction});
    }
    core::Status status = predictions_.append_predictions(rows);
    if (!status) {
        audit::log_error("Writing predictions to " + predictions_.path().string() + " failed: " + status.message());
    }
}

bool Consumer::accepting() {
    const core::ControlState state = control_.current(options_.entity);
    if (state == core::ControlState::Running) return true;
    if (state == core::ControlState::Start) {
        audit::log_info("Resuming after pause");
        core::Status written = control_.write(options_.entity, core::ControlState::Running);
        if (!written) audit::log_warn("Failed to report RUNNING: " + written.message());
        return true;
    }
    return false;
}

core::Status Consumer::handle_batch(const core::CandleBatch& batch) {
    if (batch.candles.empty() || !accepting()) return core::Status::ok();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::PriceCandle> incoming = batch.candles;
    std::sort(incoming.begin(), incoming.end(), by_open_time);
    for (const auto& candle : incoming) {
        if (cursor_ && candle.open_time_ms <= *cursor_) continue;
        if (!window_.empty() && candle.open_time_ms <= window_.back().open_time_ms) continue;
        window_.push_back(candle);
    }
    while (window_.size() > options_.seq_len) window_.pop_front();
    if (window_.size() < options_.seq_len) return core::Status::ok();

    const core::PriceCandle newest = window_.back();
    if (cursor_ && newest.open_time_ms <= *cursor_) return core::Status::ok();

    const std::vector<core::PriceCandle> window(window_.begin(), window_.end());
    auto predictions = provider_.predict(options_.entity.model, options_.entity.version,
                                         {build_features(window, options_.seq_len)});
    if (!predictions) {
        audit::log_error("Prediction for " + core::format_iso8601(newest.open_time_ms) + " failed: " +
                         predictions.message());
        return predictions.error_info();
    }
    if (predictions.value().empty()) {
        return core::make_error(core::ErrorCode::Proto, "empty prediction response");
    }

    const std::vector<persist::ScoredCandle> scored{{newest, predictions.value().front()}};
    core::Status status = repository_.upsert_predictions(options_.entity.symbol, options_.entity.model,
                                                         options_.entity.version, scored);
    if (!status) {
        audit::log_error("Upsert for " + core::format_iso8601(newest.open_time_ms) + " failed: " + status.message());
        return status;
    }
    record_predictions(scored);
    cursor_ = newest.open_time_ms;
    audit::log_info("Processed prediction for " + core::format_iso8601(newest.open_time_ms));
    return core::Status::ok();
}

void Consumer::on_message(const void* data, size_t size) {
    core::CandleBatch batch;
    CandlecastStatus status = codec::decode_candle_batch(data, size, &batch);
    if (status != CANDLECAST_OK) {
        audit::log_warn(std::string("Dropping undecodable message: ") + candlecast_status_name(status));
        return;
    }
    core::Status handled = handle_batch(batch);
    if (!handled) {
        audit::log_warn("Batch for " + batch.symbol + " not scored: " + handled.message());
    }
}

void Consumer::start_monitor() {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_running_) return;
    monitor_running_ = true;
    monitor_ = std::thread(&Consumer::monitor_loop, this);
}

void Consumer::stop_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_running_ = false;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
        monitor_.join();
    }
}

void Consumer::monitor_loop() {
    const core::EntityKey& self = options_.entity;
    for (;;) {
        const core::ControlState state = control_.current(self);
        if (state == core::ControlState::Delete) {
            audit::log_info("Received delete command, shutting down");
            core::Status written = control_.write(self, core::ControlState::Deleted);
            if (!written) audit::log_error("Failed to report DELETED: " + written.message());
            stopped_.store(true);
            options_.exit_process(0);
            return;
        }
        if (state == core::ControlState::Pause) {
            audit::log_info("Consumer paused");
            core::Status written = control_.write(self, core::ControlState::Paused);
            if (!written) audit::log_warn("Failed to report PAUSED: " + written.message());
        }
        std::unique_lock<std::mutex> lock(monitor_mutex_);
        if (monitor_cv_.wait_for(lock, options_.monitor_poll, [&] { return !monitor_running_; })) return;
    }
}

int Consumer::run(bus::MessageBus& bus, const std::atomic<bool>& stop) {
    const core::EntityKey& self = options_.entity;
    switch (startup(&stop)) {
        case StartupOutcome::Deleted: return 0;
        case StartupOutcome::Failed: return 1;
        case StartupOutcome::Ready: break;
    }

    auto reconciled = reconcile();
    if (!reconciled) {
        audit::log_error("Historical reconciliation failed: " + reconciled.message());
    }

    start_monitor();
    bus.subscribe(self.symbol, [this](const void* data, size_t size) { on_message(data, size); });
    audit::log_info("Consuming topic " + self.symbol);

    while (!stop.load() && !stopped_.load()) {
        options_.sleeper(options_.idle_poll);
    }
    bus.shutdown();
    stop_monitor();
    if (!stopped_.load()) {
        audit::log_info("Consumer interrupted, reporting DELETED");
        core::Status written = control_.write(self, core::ControlState::Deleted);
        if (!written) audit::log_error("Failed to report DELETED: " + written.message());
    }
    return 0;
}

std::optional<int64_t> Consumer::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

size_t Consumer::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

} // namespace candlecast::pipeline
