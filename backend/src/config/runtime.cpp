#include "config/runtime.hpp"

#include "control/file_control_plane.hpp"
#include "control/store_control_plane.hpp"
#include "store/pg_document_store.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace candlecast::config {

namespace {

std::atomic<bool> g_stop{false};
std::atomic<StopCallback> g_on_signal{nullptr};

void handle_stop_signal(int) {
    g_stop.store(true);
    if (StopCallback callback = g_on_signal.load()) callback();
}

} // namespace

const std::atomic<bool>& install_stop_signals(StopCallback on_signal) {
    g_on_signal.store(on_signal);
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);
    return g_stop;
}

core::Sleeper interruptible_sleeper(const std::atomic<bool>& stop) {
    return [&stop](std::chrono::milliseconds delay) {
        constexpr std::chrono::milliseconds kSlice{200};
        while (delay.count() > 0 && !stop.load()) {
            const auto step = std::min(delay, kSlice);
            std::this_thread::sleep_for(step);
            delay -= step;
        }
    };
}

store::BatchWriterOptions writer_options(const PipelineSettings& settings) {
    store::BatchWriterOptions options;
    options.quota_backoff = std::chrono::seconds(settings.quota_backoff_s);
    return options;
}

core::Expected<std::unique_ptr<store::DocumentStore>> open_document_store(const PipelineSettings& settings) {
    if (settings.pg_dsn.empty()) {
        return core::make_error(core::ErrorCode::Invalid, "CANDLECAST_PG_DSN is not set");
    }
    auto connected = store::PgDocumentStore::connect(settings.pg_dsn, settings.store_batch_limit);
    if (!connected) return connected.error_info();
    return std::unique_ptr<store::DocumentStore>(std::move(connected.value()));
}

core::Expected<std::unique_ptr<control::ControlPlane>> open_control_plane(const PipelineSettings& settings,
                                                                         store::DocumentStore* documents) {
    if (settings.control_backend == ControlBackend::File) {
        return std::unique_ptr<control::ControlPlane>(std::make_unique<control::FileControlPlane>(settings.state_dir));
    }
    if (!documents) {
        return core::make_error(core::ErrorCode::Invalid, "store control backend needs a document store");
    }
    return std::unique_ptr<control::ControlPlane>(std::make_unique<control::StoreControlPlane>(*documents));
}

} // namespace candlecast::config
