#include "control/file_control_plane.hpp"
#include "jobs/job_descriptor.hpp"
#include "orchestrator/orchestrator.hpp"
#include "persist/candle_repository.hpp"
#include "persist/news_repository.hpp"
#include "registry/version_manager.hpp"
#include "store/memory_document_store.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using namespace candlecast;
using core::ControlState;
using core::EntityKey;
using std::chrono::milliseconds;

bool contains(const std::vector<EntityKey>& list, const EntityKey& entity) {
    return std::find(list.begin(), list.end(), entity) != list.end();
}

orchestrator::OrchestratorOptions fast_options(const fs::path& jobs_dir) {
    orchestrator::OrchestratorOptions options;
    options.symbols = {"BTCUSDT"};
    options.models = {"lightgbm"};
    options.versions = {"v1", "v2"};
    options.jobs_dir = jobs_dir.string();
    options.bin_dir = "bin";
    options.producer_timeout = milliseconds(200);
    options.consumer_timeout = milliseconds(200);
    options.startup_poll = milliseconds(10);
    options.kill_entity_timeout = milliseconds(200);
    options.kill_total_timeout = milliseconds(5000);
    options.kill_poll = milliseconds(10);
    return options;
}

// Stands in for running processes: acknowledges DELETE unless told to hang.
struct Processes {
    void acknowledge_deletes(control::ControlPlane& control) {
        auto records = control.list();
        assert(records);
        for (const auto& record : records.value()) {
            if (record.state != ControlState::Delete || hung.count(record.entity.id()) != 0) continue;
            assert(control.write(record.entity, ControlState::Deleted).is_ok());
        }
    }

    // Plays the dispatcher plus the launched processes for every job file present.
    void launch_jobs(control::ControlPlane& control, const fs::path& jobs_dir) {
        std::error_code ec;
        if (!fs::exists(jobs_dir, ec)) return;
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(jobs_dir)) {
            if (entry.path().extension() == ".sh") files.push_back(entry.path());
        }
        for (const auto& path : files) {
            auto job = jobs::read_job_file(path);
            assert(job);
            submitted.push_back(job.value());
            fs::remove(path);
            const EntityKey& entity = job.value().entity;
            if (broken.count(entity.id()) != 0) {
                assert(control.write(entity, ControlState::Error, std::string("Model not available")).is_ok());
            } else if (hung.count(entity.id()) == 0) {
                assert(control.write(entity, ControlState::Running).is_ok());
            }
        }
    }

    std::set<std::string> hung;
    std::set<std::string> broken;
    std::vector<jobs::JobDescriptor> submitted;
    int sleeps = 0;
};

void kill_all_stops_everything(const fs::path& root) {
    control::FileControlPlane control(root / "kill_state");
    Processes processes;
    control.set_sleeper([&](milliseconds) {
        ++processes.sleeps;
        processes.acknowledge_deletes(control);
    });
    orchestrator::Orchestrator orchestrator(fast_options(root / "kill_jobs"), control);

    const EntityKey v1 = EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
    const EntityKey v2 = EntityKey::consumer("BTCUSDT", "lightgbm", "v2");
    const EntityKey stray = EntityKey::consumer("ETHUSDT", "tst", "v1");
    assert(control.write(v1, ControlState::Running).is_ok());
    assert(control.write(v2, ControlState::Deleted).is_ok());
    assert(control.write(stray, ControlState::Paused).is_ok());
    assert(control.write(EntityKey::producer(), ControlState::Running).is_ok());
    processes.hung.insert(stray.id());

    const orchestrator::KillReport report = orchestrator.kill_all();
    assert(report.stopped.size() == 2);
    assert(contains(report.stopped, v1));
    assert(contains(report.stopped, EntityKey::producer()));
    assert(report.timed_out.size() == 1);
    assert(contains(report.timed_out, stray));
    assert(!contains(report.stopped, v2));
    assert(!report.interrupted);
    assert(report.cleaned);
    assert(control.list().value().empty());
}

void kill_all_interrupted_still_cleans(const fs::path& root) {
    control::FileControlPlane control(root / "interrupt_state");
    control.set_sleeper([](milliseconds) {});
    orchestrator::Orchestrator orchestrator(fast_options(root / "interrupt_jobs"), control);
    assert(control.write(EntityKey::consumer("BTCUSDT", "lightgbm", "v1"), ControlState::Running).is_ok());
    assert(control.write(EntityKey::producer(), ControlState::Running).is_ok());

    std::atomic<bool> cancel{true};
    const orchestrator::KillReport report = orchestrator.kill_all(&cancel);
    assert(report.interrupted);
    assert(report.stopped.empty());
    assert(report.cleaned);
    assert(control.list().value().empty());

    // An exhausted global budget leaves nothing confirmed but still cleans up.
    orchestrator::OrchestratorOptions options = fast_options(root / "interrupt_jobs");
    options.kill_total_timeout = milliseconds(0);
    orchestrator::Orchestrator impatient(options, control);
    assert(control.write(EntityKey::producer(), ControlState::Running).is_ok());
    const orchestrator::KillReport rushed = impatient.kill_all();
    assert(rushed.timed_out.size() == 1);
    assert(rushed.cleaned);

    // Nothing running is a clean no-op.
    const orchestrator::KillReport idle = impatient.kill_all();
    assert(idle.stopped.empty() && idle.timed_out.empty() && idle.cleaned);
}

void start_pipeline_brings_consumers_up(const fs::path& root) {
    const fs::path jobs_dir = root / "start_jobs";
    control::FileControlPlane control(root / "start_state");
    Processes processes;
    control.set_sleeper([&](milliseconds) { processes.launch_jobs(control, jobs_dir); });
    orchestrator::Orchestrator orchestrator(fast_options(jobs_dir), control);

    const EntityKey v1 = EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
    const EntityKey v2 = EntityKey::consumer("BTCUSDT", "lightgbm", "v2");
    assert(control.write(EntityKey::consumer("XRPUSDT", "tst", "v1"), ControlState::Error).is_ok());
    processes.broken.insert(v2.id());

    auto started = orchestrator.start_pipeline();
    assert(started);
    const orchestrator::StartReport& report = started.value();
    assert(report.producer_ready);
    assert(report.running.size() == 1 && report.running[0] == v1);
    assert(report.failed.size() == 1 && report.failed[0] == v2);

    assert(processes.submitted.size() == 3);
    assert(processes.submitted[0].kind == jobs::JobKind::Producer);
    assert(processes.submitted[0].symbol == "BTCUSDT");
    assert(control.current(EntityKey::consumer("XRPUSDT", "tst", "v1")) == ControlState::Unknown);
    assert(control.current(EntityKey::producer()) == ControlState::Running);
    assert(control.current(v2) == ControlState::Error);
}

void start_pipeline_needs_the_producer(const fs::path& root) {
    {
        const fs::path jobs_dir = root / "broken_jobs";
        control::FileControlPlane control(root / "broken_state");
        Processes processes;
        processes.broken.insert(EntityKey::producer().id());
        control.set_sleeper([&](milliseconds) { processes.launch_jobs(control, jobs_dir); });
        orchestrator::Orchestrator orchestrator(fast_options(jobs_dir), control);
        auto started = orchestrator.start_pipeline();
        assert(!started);
        assert(started.error() == core::ErrorCode::Unavailable);
        assert(processes.submitted.size() == 1);
    }
    {
        const fs::path jobs_dir = root / "silent_jobs";
        control::FileControlPlane control(root / "silent_state");
        control.set_sleeper([](milliseconds) {});
        orchestrator::Orchestrator orchestrator(fast_options(jobs_dir), control);
        auto started = orchestrator.start_pipeline();
        assert(!started);
        assert(started.error() == core::ErrorCode::Timeout);
        // The producer job is still waiting for a dispatcher.
        assert(fs::exists(jobs_dir / "ALL_producer_main.sh"));
        assert(orchestrator.configured_consumers().size() == 2);
    }
}

void rotation(const fs::path& root) {
    const fs::path jobs_dir = root / "rotate_jobs";
    control::FileControlPlane control(root / "rotate_state");
    Processes processes;
    control.set_sleeper([&](milliseconds) { processes.acknowledge_deletes(control); });
    orchestrator::OrchestratorOptions options = fast_options(jobs_dir);
    options.versions = {"v1", "v2", "v3"};
    orchestrator::Orchestrator orchestrator(options, control);

    fs::create_directories(root / "artifacts");
    std::ofstream(root / "artifacts" / "base.txt") << "base";
    std::ofstream(root / "artifacts" / "first.txt") << "first";
    std::ofstream(root / "artifacts" / "second.txt") << "second";
    auto opened = registry::VersionManager::open(root / "models");
    assert(opened);
    registry::VersionManager& versions = opened.value();
    assert(versions.initialize_baseline("lightgbm", root / "artifacts" / "base.txt").is_ok());
    assert(versions.register_new_model("lightgbm", root / "artifacts" / "first.txt"));

    store::MemoryDocumentStore documents;
    persist::CandleRepositoryOptions repository_options;
    repository_options.writer.sleeper = [](milliseconds) {};
    persist::CandleRepository candles(documents, repository_options);
    const core::PriceCandle candle{1700000040000LL, 10.0, 11.0, 9.0, 10.5, 2.0};
    assert(candles.bulk_insert("BTCUSDT", {candle}).is_ok());
    assert(candles.upsert_predictions("BTCUSDT", "lightgbm", "v3", {{candle, {0.1, 0.2, 0.7}}}).is_ok());

    const EntityKey v2 = EntityKey::consumer("BTCUSDT", "lightgbm", "v2");
    const EntityKey v3 = EntityKey::consumer("BTCUSDT", "lightgbm", "v3");
    const EntityKey v1 = EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
    assert(control.write(v1, ControlState::Running).is_ok());
    assert(control.write(v2, ControlState::Running).is_ok());
    assert(control.write(v3, ControlState::Running).is_ok());

    assert(orchestrator.rotate_model("lightgbm", root / "artifacts" / "second.txt", versions, &candles).is_ok());
    assert(versions.get_model_path("lightgbm", 3).value() ==
           (versions.slot_dir("lightgbm", 3) / "second.txt").string());
    assert(fs::exists(versions.slot_dir("lightgbm", 2) / "first.txt"));

    auto doc = documents.get("btcusdt", persist::CandleRepository::document_id(candle.open_time_ms));
    assert(doc && doc.value());
    assert(doc.value()->at("lightgbm_2")[2] == 0.7);
    assert(doc.value()->at("lightgbm_3").is_null());

    // Slot 1 is untouched; slots 2 and 3 are queued to restart.
    assert(control.current(v1) == ControlState::Running);
    assert(control.current(v2) == ControlState::Start);
    assert(control.current(v3) == ControlState::Start);
    assert(fs::exists(jobs_dir / "BTCUSDT_lightgbm_v2.sh"));
    assert(fs::exists(jobs_dir / "BTCUSDT_lightgbm_v3.sh"));
    assert(!fs::exists(jobs_dir / "BTCUSDT_lightgbm_v1.sh"));

    // A failed registration still restarts the consumers.
    fs::remove_all(jobs_dir);
    assert(control.write(v3, ControlState::Running).is_ok());
    core::Status failed = orchestrator.rotate_model("lightgbm", root / "artifacts" / "missing.txt", versions, nullptr);
    assert(failed.error() == core::ErrorCode::NotFound);
    assert(control.current(v3) == ControlState::Start);
    assert(fs::exists(jobs_dir / "BTCUSDT_lightgbm_v3.sh"));
    assert(versions.get_model_path("lightgbm", 3).value() ==
           (versions.slot_dir("lightgbm", 3) / "second.txt").string());

    // finbert scores live on news articles: trl_2 is cleared, then trl_3 moves into it.
    persist::NewsRepository news(documents, repository_options.writer);
    persist::NewsArticle fresh{"https://news.example/fresh", "Fresh", 1700000040000LL, std::nullopt, std::nullopt};
    persist::NewsArticle stale{"https://news.example/stale", "Stale", 1700000040000LL, std::nullopt, std::nullopt};
    assert(news.upsert_predictions("v3", {{fresh, {0.2, 0.8}}}).is_ok());
    assert(news.upsert_predictions("v2", {{stale, {0.6, 0.4}}}).is_ok());
    assert(versions.initialize_baseline("finbert", root / "artifacts" / "base.txt").is_ok());
    assert(orchestrator.rotate_model("finbert", root / "artifacts" / "first.txt", versions, &candles, &news).is_ok());
    auto fresh_doc = documents.get("trl", fresh.link);
    assert(fresh_doc.value()->at("trl_2")[1] == 0.8);
    assert(fresh_doc.value()->at("trl_3").is_null());
    auto stale_doc = documents.get("trl", stale.link);
    assert(stale_doc.value()->at("trl_2").is_null());
    assert(fs::exists(jobs_dir / "BTCUSDT_finbert_v3.sh"));
}

} // namespace

int main() {
    const fs::path root = fs::temp_directory_path() / ("candlecast_orchestrator_" + std::to_string(::getpid()));
    fs::remove_all(root);

    kill_all_stops_everything(root);
    kill_all_interrupted_still_cleans(root);
    start_pipeline_brings_consumers_up(root);
    start_pipeline_needs_the_producer(root);
    rotation(root);

    fs::remove_all(root);
    return 0;
}
