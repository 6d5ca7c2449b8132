#include <atomic>
#include <string>

#include "audit/logger.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "jobs/job_dispatcher.hpp"

int main() {
    using namespace candlecast;

    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    audit::Logger::instance().configure("dispatcher", config::log_path_for(settings, "dispatcher"));
    const std::atomic<bool>& stop = config::install_stop_signals();
    audit::Logger::instance().log(audit::LogLevel::INFO, "Job dispatcher booting");

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

    // 3. Watch
    jobs::DispatcherOptions options;
    options.jobs_dir = settings.jobs_dir;
    options.bin_dir = settings.bin_dir;
    options.default_symbol = settings.symbols.front();
    options.workers = settings.dispatcher_workers;
    options.poll = std::chrono::milliseconds(settings.dispatcher_poll_ms);
    jobs::JobDispatcher dispatcher(options, *control.value());

    const int code = dispatcher.run(stop);
    const jobs::DispatcherStats stats = dispatcher.stats();
    audit::log_info("Dispatcher done: " + std::to_string(stats.launched) + " launched, " +
                    std::to_string(stats.duplicates) + " duplicates, " + std::to_string(stats.failures) +
                    " failures, " + std::to_string(stats.rejected) + " rejected");
    audit::Logger::instance().flush();
    return code;
}
