#include <atomic>
#include <string>

#include "audit/logger.hpp"
#include "bus/message_bus.hpp"
#include "config/arg_parser.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "inference/inference_provider.hpp"
#include "persist/candle_repository.hpp"
#include "pipeline/consumer.hpp"

int main(int argc, char** argv) {
    using namespace candlecast;

    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    config::ArgParser args(argc, argv);
    const auto missing = args.missing({"crypto", "model", "version"});
    if (!missing.empty()) {
        audit::log_error("Usage: candlecast_consumer --crypto SYM --model NAME --version VER (missing --" +
                         missing.front() + ")");
        audit::Logger::instance().flush();
        return 2;
    }
    const core::EntityKey entity = core::EntityKey::consumer(core::to_upper(args.get("crypto")), args.get("model"),
                                                             args.get("version"));
    audit::Logger::instance().configure(entity.id(), config::log_path_for(settings, entity.id()));
    const std::atomic<bool>& stop = config::install_stop_signals();
    audit::Logger::instance().log(audit::LogLevel::INFO, "Consumer booting for " + entity.id());

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

    // 3. Inference + Persistence
    inference::HttpInferenceOptions inference_options;
    inference_options.base_url = settings.inference_url;
    inference_options.chunk_size = settings.inference_chunk;
    inference_options.predict_timeout = std::chrono::seconds(settings.predict_timeout_s);
    inference_options.availability_timeout = std::chrono::seconds(settings.availability_timeout_s);
    inference::HttpInferenceProvider provider(inference_options);

    persist::CandleRepositoryOptions repository_options;
    repository_options.upsert_threshold = settings.upsert_threshold;
    repository_options.retention_days = settings.retention_days;
    repository_options.writer = config::writer_options(settings);
    persist::CandleRepository repository(*documents.value(), repository_options);

    // 4. Stream Bus
    bus::PgStreamBusConfig bus_config;
    bus_config.consumer_group = entity.model + "-" + entity.version + "-consumer";
    auto bus = bus::create_pg_stream_bus(bus_config);
    if (bus->connect(settings.pg_dsn, false) != CANDLECAST_OK) {
        audit::log_error("Stream bus unavailable");
        core::Status written = control.value()->write(entity, core::ControlState::Error,
                                                      std::string("stream bus unavailable"));
        if (!written) audit::log_error("Failed to report ERROR: " + written.message());
        audit::Logger::instance().flush();
        return 1;
    }

    // 5. Run
    pipeline::ConsumerOptions options;
    options.entity = entity;
    options.seq_len = settings.seq_len;
    options.reconcile_chunk = settings.inference_chunk;
    options.data_path = settings.data_path;
    options.start_poll = std::chrono::seconds(settings.startup_poll_s);
    options.monitor_poll = std::chrono::seconds(settings.monitor_poll_s);
    options.sleeper = config::interruptible_sleeper(stop);
    pipeline::Consumer consumer(options, *control.value(), provider, repository);

    const int code = consumer.run(*bus, stop);
    audit::log_info("Consumer exiting with code " + std::to_string(code));
    audit::Logger::instance().flush();
    return code;
}
