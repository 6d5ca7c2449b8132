#include <atomic>
#include <string>

#include "audit/logger.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "orchestrator/orchestrator.hpp"

int main() {
    using namespace candlecast;

    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    audit::Logger::instance().configure("consumer_start", config::log_path_for(settings, "consumer_start"));
    const std::atomic<bool>& stop = config::install_stop_signals();
    audit::Logger::instance().log(audit::LogLevel::INFO, "Starting producer and consumers");

    // 2. Control Plane
    std::unique_ptr<store::DocumentStore> documents;
    if (settings.control_backend == config::ControlBackend::Store) {
        auto opened = config::open_document_store(settings);
        if (!opened) {
            audit::log_error("Document store unavailable: " + opened.message());
            audit::Logger::instance().flush();
            return 1;
        }
        documents = std::move(opened.value());
    }
    auto control = config::open_control_plane(settings, documents.get());
    if (!control) {
        audit::log_error("Control plane unavailable: " + control.message());
        audit::Logger::instance().flush();
        return 1;
    }
    control.value()->set_sleeper(config::interruptible_sleeper(stop));

    // 3. Start
    orchestrator::OrchestratorOptions options;
    options.symbols = settings.symbols;
    options.models = settings.models;
    options.versions = settings.versions;
    options.jobs_dir = settings.jobs_dir;
    options.bin_dir = settings.bin_dir;
    options.producer_timeout = std::chrono::seconds(settings.startup_timeout_s);
    options.consumer_timeout = std::chrono::seconds(settings.startup_timeout_s);
    options.startup_poll = std::chrono::seconds(settings.startup_poll_s);
    orchestrator::Orchestrator orchestrator(options, *control.value());

    auto report = orchestrator.start_pipeline(&stop);
    if (!report) {
        audit::log_error("Pipeline startup aborted: " + report.message());
        audit::Logger::instance().flush();
        return 1;
    }
    audit::Logger::instance().flush();
    return report.value().failed.empty() ? 0 : 1;
}
