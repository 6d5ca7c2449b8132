#include <cstdlib>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "audit/logger.hpp"
#include "config/arg_parser.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "core/time_utils.hpp"
#include "status/status_store.hpp"

namespace {

using namespace candlecast;

int usage() {
    std::cerr << "usage: candlecast_training_status flush-init [--models a,b] [--coins X,Y]\n"
                 "       candlecast_training_status set --model M --coin C --state STATE [--error TEXT]\n"
                 "       candlecast_training_status status\n"
                 "       candlecast_training_status wait [--timeout SECONDS] [--poll SECONDS]\n"
                 "       candlecast_training_status log-event --dag D --task T --type E [--model M] [--run R]\n"
                 "                                            [--status S] [--message TEXT]\n"
                 "       candlecast_training_status cleanup-events\n";
    return 2;
}

int fail(const std::string& what, const std::string& message) {
    audit::log_error(what + " failed: " + message);
    audit::Logger::instance().flush();
    std::cerr << what << " failed: " << message << "\n";
    return 1;
}

nlohmann::json snapshot_json(const std::vector<status::TrainingJobStatus>& rows) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : rows) {
        out.push_back({{"model", row.model},
                       {"coin", row.coin},
                       {"state", core::to_string(row.state)},
                       {"error_message", row.error_message},
                       {"updated_at", core::format_iso8601(row.updated_at_ms)}});
    }
    return out;
}

std::vector<std::string> list_arg(const config::ArgParser& args, const std::string& name,
                                  const std::vector<std::string>& fallback) {
    const std::string value = args.get(name);
    return value.empty() ? fallback : core::split(value, ',');
}

uint32_t seconds_arg(const config::ArgParser& args, const std::string& name, uint32_t fallback) {
    const long parsed = std::strtol(args.get(name).c_str(), nullptr, 10);
    return parsed > 0 ? static_cast<uint32_t>(parsed) : fallback;
}

} // namespace

int main(int argc, char** argv) {
    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    audit::Logger::instance().configure("training_status", config::log_path_for(settings, "training_status"));
    // stdout carries the JSON result.
    audit::Logger::instance().set_console(false);
    config::ArgParser args(argc, argv);
    if (args.positional().empty()) return usage();
    const std::string command = args.positional().front();

    // 2. Store
    auto documents = config::open_document_store(settings);
    if (!documents) return fail("open document store", documents.message());
    status::StatusStoreOptions options;
    options.event_retention_days = settings.event_retention_days;
    options.writer = config::writer_options(settings);
    status::StatusStore store(*documents.value(), options);

    // 3. Command
    if (command == "flush-init") {
        core::Status flushed = store.flush();
        if (!flushed) return fail("flush", flushed.message());
        core::Status seeded = store.init_entries(list_arg(args, "models", settings.models),
                                                 list_arg(args, "coins", settings.symbols));
        if (!seeded) return fail("init", seeded.message());
        audit::log_info("Training status table reset");
        audit::Logger::instance().flush();
        return 0;
    }
    if (command == "set") {
        const auto missing = args.missing({"model", "coin", "state"});
        if (!missing.empty()) return usage();
        core::TrainingState state = core::TrainingState::Pending;
        if (!core::parse_training_state(core::to_upper(args.get("state")), &state)) return usage();
        std::optional<std::string> error;
        if (args.has("error")) error = args.get("error");
        core::Status written = store.set_state(args.get("model"), args.get("coin"), state, error);
        if (!written) return fail("set", written.message());
        audit::Logger::instance().flush();
        return 0;
    }
    if (command == "status") {
        auto snapshot = store.get_status();
        if (!snapshot) return fail("status", snapshot.message());
        std::cout << snapshot_json(snapshot.value()).dump(2) << std::endl;
        return 0;
    }
    if (command == "wait") {
        const auto timeout = std::chrono::seconds(seconds_arg(args, "timeout", 3600));
        const auto poll = std::chrono::seconds(seconds_arg(args, "poll", 30));
        auto snapshot = store.wait_until_terminal(timeout, poll);
        if (!snapshot) return fail("wait", snapshot.message());
        std::cout << snapshot_json(snapshot.value()).dump(2) << std::endl;
        for (const auto& row : snapshot.value()) {
            if (row.state == core::TrainingState::Failed) return 1;
        }
        return 0;
    }
    if (command == "log-event") {
        if (!args.missing({"dag", "task", "type"}).empty()) return usage();
        status::TrainingEvent event;
        event.dag_name = args.get("dag");
        event.task_name = args.get("task");
        event.event_type = args.get("type");
        event.model_name = args.get("model");
        event.run_id = args.get("run");
        event.status = args.get("status");
        event.message = args.get("message");
        core::Status logged = store.log_event(event);
        if (!logged) return fail("log-event", logged.message());
        audit::Logger::instance().flush();
        return 0;
    }
    if (command == "cleanup-events") {
        auto removed = store.cleanup_old_events();
        if (!removed) return fail("cleanup-events", removed.message());
        audit::log_info("Removed " + std::to_string(removed.value()) + " old training events");
        audit::Logger::instance().flush();
        return 0;
    }
    return usage();
}
