#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "audit/logger.hpp"
#include "config/arg_parser.hpp"
#include "config/runtime.hpp"
#include "config/settings.hpp"
#include "orchestrator/orchestrator.hpp"
#include "persist/candle_repository.hpp"
#include "persist/news_repository.hpp"
#include "registry/version_manager.hpp"

namespace {

using namespace candlecast;

int usage() {
    std::cerr << "usage: candlecast_versions init-baseline --type T --path FILE\n"
                 "       candlecast_versions register --type T --path FILE\n"
                 "       candlecast_versions rotate --type T --path FILE\n"
                 "       candlecast_versions rollback --type T --slot 1|2\n"
                 "       candlecast_versions list [--type T]\n"
                 "       candlecast_versions history\n";
    return 2;
}

int finish(const core::Status& status, const std::string& what) {
    if (!status) {
        audit::log_error(what + " failed: " + status.message());
        audit::Logger::instance().flush();
        std::cerr << what << " failed: " << status.message() << "\n";
        return 1;
    }
    audit::log_info(what + " done");
    audit::Logger::instance().flush();
    return 0;
}

nlohmann::json slots_json(const std::map<int, registry::SlotInfo>& slots) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [slot, info] : slots) out["v" + std::to_string(slot)] = registry::to_json(info);
    return out;
}

int rotate(const config::PipelineSettings& settings, registry::VersionManager& versions, const std::string& type,
           const std::string& path) {
    std::unique_ptr<store::DocumentStore> documents;
    if (!settings.pg_dsn.empty()) {
        auto opened = config::open_document_store(settings);
        if (!opened) {
            audit::log_warn("Document store unavailable, predictions will not be moved: " + opened.message());
        } else {
            documents = std::move(opened.value());
        }
    }
    auto control = config::open_control_plane(settings, documents.get());
    if (!control) return finish(control.error_info(), "rotate");

    std::unique_ptr<persist::CandleRepository> candles;
    std::unique_ptr<persist::NewsRepository> news;
    if (documents) {
        persist::CandleRepositoryOptions repository_options;
        repository_options.writer = config::writer_options(settings);
        candles = std::make_unique<persist::CandleRepository>(*documents, repository_options);
        news = std::make_unique<persist::NewsRepository>(*documents, config::writer_options(settings));
    }

    orchestrator::OrchestratorOptions options;
    options.symbols = settings.symbols;
    options.models = settings.models;
    options.versions = settings.versions;
    options.jobs_dir = settings.jobs_dir;
    options.bin_dir = settings.bin_dir;
    options.kill_entity_timeout = std::chrono::seconds(settings.kill_entity_timeout_s);
    options.kill_poll = std::chrono::seconds(settings.kill_poll_s);
    orchestrator::Orchestrator orchestrator(options, *control.value());
    return finish(orchestrator.rotate_model(type, path, versions, candles.get(), news.get()), "rotate " + type);
}

} // namespace

int main(int argc, char** argv) {
    // 1. System Init
    const config::PipelineSettings settings = config::load_settings_from_env();
    audit::Logger::instance().configure("versions", config::log_path_for(settings, "versions"));
    // stdout carries the JSON result.
    audit::Logger::instance().set_console(false);
    config::ArgParser args(argc, argv);
    if (args.positional().empty()) return usage();
    const std::string command = args.positional().front();

    // 2. Registry
    auto opened = registry::VersionManager::open(settings.models_dir);
    if (!opened) return finish(opened.error_info(), "Opening the model registry");
    registry::VersionManager& versions = opened.value();
    const std::string type = args.get("type");

    // 3. Command
    if (command == "list") {
        nlohmann::json out = nlohmann::json::object();
        if (!type.empty()) {
            out[type] = slots_json(versions.get_all_versions(type));
        } else {
            for (const auto& [model, slots] : versions.list_all_models()) out[model] = slots_json(slots);
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    if (command == "history") {
        std::cout << nlohmann::json(versions.version_history()).dump(2) << std::endl;
        return 0;
    }

    if (type.empty()) return usage();
    if (command == "rollback") {
        const long slot = std::strtol(args.get("slot", "0").c_str(), nullptr, 10);
        return finish(versions.rollback_to_version(type, static_cast<int>(slot)), "rollback " + type);
    }

    const std::string path = args.get("path");
    if (path.empty()) return usage();
    if (command == "init-baseline") return finish(versions.initialize_baseline(type, path), "init-baseline " + type);
    if (command == "register") {
        auto registered = versions.register_new_model(type, path);
        if (registered) std::cout << registry::to_json(registered.value()).dump(2) << std::endl;
        return finish(registered ? core::Status::ok() : core::Status(registered.error_info()), "register " + type);
    }
    if (command == "rotate") return rotate(settings, versions, type, path);
    return usage();
}
