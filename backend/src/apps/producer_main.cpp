#include <atomic>
#include <string>

#include "audit/logger.hpp"
#include "bus/message_bus.hpp"
#include "config/arg_parser.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "marketdata/market_data_source.hpp"
#include "persist/candle_repository.hpp"
#include "persist/ledger_file.hpp"
#include "pipeline/producer.hpp"

namespace {

std::atomic<candlecast::pipeline::Producer*> g_producer{nullptr};

void stop_producer() {
    if (auto* producer = g_producer.load()) producer->request_stop();
}

void report_error(candlecast::control::ControlPlane& control, const std::string& message) {
    using namespace candlecast;
    core::Status written = control.write(core::EntityKey::producer(), core::ControlState::Error, message);
    if (!written) audit::log_error("Failed to report ERROR: " + written.message());
}

} // namespace

int main(int argc, char** argv) {
    using namespace candlecast;

    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    audit::Logger::instance().configure("producer", config::log_path_for(settings, "producer"));
    config::ArgParser args(argc, argv);
    const std::string symbol = core::to_upper(args.get("symbol", settings.symbols.front()));
    const std::atomic<bool>& stop = config::install_stop_signals(stop_producer);
    audit::Logger::instance().log(audit::LogLevel::INFO, "Producer booting for " + symbol);

    // 2. Store + Control Plane
    auto documents = config::open_document_store(settings);
    if (!documents) {
        audit::log_error("Document store unavailable: " + documents.message());
        audit::Logger::instance().flush();
        return 1;
    }
    auto control = config::open_control_plane(settings, documents.value().get());
    if (!control) {
        audit::log_error("Control plane unavailable: " + control.message());
        audit::Logger::instance().flush();
        return 1;
    }
    control.value()->set_sleeper(config::interruptible_sleeper(stop));

    // 3. Market Data + Persistence
    marketdata::BinanceKlineOptions source_options;
    source_options.base_url = settings.market_data_url;
    source_options.sleeper = config::interruptible_sleeper(stop);
    marketdata::BinanceKlineSource source(source_options);

    persist::CandleRepositoryOptions repository_options;
    repository_options.upsert_threshold = settings.upsert_threshold;
    repository_options.retention_days = settings.retention_days;
    repository_options.writer = config::writer_options(settings);
    persist::CandleRepository repository(*documents.value(), repository_options);
    persist::LedgerFile ledger(persist::candle_ledger_path(settings.data_path, symbol));

    // 4. Stream Bus
    bus::PgStreamBusConfig bus_config;
    bus_config.consumer_group = "producer";
    bus_config.trim_every = settings.stream_trim_every;
    bus_config.retention = std::chrono::hours(settings.stream_retention_h);
    auto bus = bus::create_pg_stream_bus(bus_config);
    if (bus->connect(settings.pg_dsn, true) != CANDLECAST_OK) {
        audit::log_error("Stream bus unavailable");
        report_error(*control.value(), "stream bus unavailable");
        audit::Logger::instance().flush();
        return 1;
    }

    // 5. Run
    pipeline::ProducerOptions options;
    options.symbol = symbol;
    options.publish_chunk = settings.publish_chunk;
    options.max_initial_sync_rows = settings.max_initial_sync_rows;
    options.pause_sleep = std::chrono::seconds(settings.pause_sleep_s);
    options.sleeper = config::interruptible_sleeper(stop);
    pipeline::Producer producer(options, *control.value(), source, repository, ledger, *bus);

    core::Status started = producer.start();
    if (!started) {
        audit::log_error("Producer startup failed: " + started.message());
        report_error(*control.value(), started.message());
        audit::Logger::instance().flush();
        return 1;
    }

    g_producer.store(&producer);
    if (stop.load()) producer.request_stop();
    const int code = producer.run();
    g_producer.store(nullptr);

    bus->shutdown();
    audit::log_info("Producer exiting with code " + std::to_string(code));
    audit::Logger::instance().flush();
    return code;
}
