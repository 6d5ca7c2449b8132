#pragma once

#include "bus/message_bus.hpp"
#include "control/control_plane.hpp"
#include "core/retry.hpp"
#include "core/types.hpp"
#include "inference/inference_provider.hpp"
#include "persist/candle_repository.hpp"
#include "persist/ledger_file.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace candlecast::pipeline {

struct ConsumerOptions {
    core::EntityKey entity;
    size_t seq_len = 30;
    size_t reconcile_chunk = 5000;
    std::string data_path = "data";
    std::chrono::milliseconds start_poll{5000};
    std::chrono::milliseconds monitor_poll{5000};
    std::chrono::milliseconds idle_poll{1000};
    core::Sleeper sleeper = core::sleep_for_ms;
    // Called by the monitor thread after DELETED has been written.
    std::function<void(int)> exit_process;
};

enum class StartupOutcome {
    Ready,
    Deleted,
    Failed
};

/**
 * @class Consumer
 * @brief Inference worker for one (symbol, model, version).
 * Lifecycle: WAIT until START, RUNNING, availability check, historical
 * reconciliation, then streaming. A monitor thread acknowledges PAUSE and
 * terminates the process on DELETE.
 */
class Consumer {
public:
    Consumer(ConsumerOptions options,
             control::ControlPlane& control,
             inference::InferenceProvider& provider,
             persist::CandleRepository& repository);
    ~Consumer();

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    // Steps up to and including the availability check.
    StartupOutcome startup(const std::atomic<bool>* cancel = nullptr);

    // Backfills predictions missing from the store; returns how many were written.
    core::Expected<size_t> reconcile();

    // Streaming step for one decoded batch. Ignored unless RUNNING.
    core::Status handle_batch(const core::CandleBatch& batch);
    void on_message(const void* data, size_t size);

    void start_monitor();
    void stop_monitor();

    // Full lifecycle against a bus already connected; returns the process exit code.
    int run(bus::MessageBus& bus, const std::atomic<bool>& stop);

    std::optional<int64_t> cursor() const;
    size_t buffered() const;
    bool stopped() const { return stopped_.load(); }

private:
    bool accepting();
    void monitor_loop();
    void record_predictions(const std::vector<persist::ScoredCandle>& scored);

    ConsumerOptions options_;
    control::ControlPlane& control_;
    inference::InferenceProvider& provider_;
    persist::CandleRepository& repository_;
    persist::LedgerFile predictions_;

    mutable std::mutex mutex_;
    std::deque<core::PriceCandle> window_;
    std::optional<int64_t> cursor_;

    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_running_ = false;
    std::thread monitor_;
    std::atomic<bool> stopped_{false};
};

} // namespace candlecast::pipeline
