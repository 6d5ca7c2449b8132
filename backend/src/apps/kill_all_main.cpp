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
    audit::Logger::instance().configure("kill_all", config::log_path_for(settings, "kill_all"));
    const std::atomic<bool>& stop = config::install_stop_signals();
    audit::Logger::instance().log(audit::LogLevel::INFO, "Stopping all pipeline processes");

    // 2. Control Plane
    std::unique_ptr<store::DocumentStore> documents;
    if (settings.control_backend == config::ControlBackend::Store) {
        auto opened = config::open_document_store(settings);
        if (!opened) {
            audit::log_error("Document store unavailable, nothing to stop: " + opened.message());
            audit::Logger::instance().flush();
            return 0;
        }
        documents = std::move(opened.value());
    }
    auto control = config::open_control_plane(settings, documents.get());
    if (!control) {
        audit::log_error("Control plane unavailable, nothing to stop: " + control.message());
        audit::Logger::instance().flush();
        return 0;
    }
    control.value()->set_sleeper(config::interruptible_sleeper(stop));

    // 3. Broadcast DELETE and wait
    orchestrator::OrchestratorOptions options;
    options.symbols = settings.symbols;
    options.models = settings.models;
    options.versions = settings.versions;
    options.jobs_dir = settings.jobs_dir;
    options.bin_dir = settings.bin_dir;
    options.kill_entity_timeout = std::chrono::seconds(settings.kill_entity_timeout_s);
    options.kill_total_timeout = std::chrono::seconds(settings.kill_total_timeout_s);
    options.kill_poll = std::chrono::seconds(settings.kill_poll_s);
    orchestrator::Orchestrator orchestrator(options, *control.value());

    const orchestrator::KillReport report = orchestrator.kill_all(&stop);
    if (!report.timed_out.empty()) {
        audit::log_warn(std::to_string(report.timed_out.size()) + " processes did not confirm shutdown");
    }
    audit::Logger::instance().flush();
    return 0;
}
