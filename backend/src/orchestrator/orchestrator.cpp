#include "orchestrator/orchestrator.hpp"

#include "audit/logger.hpp"
#include "jobs/job_descriptor.hpp"

#include <algorithm>
#include <set>

namespace candlecast::orchestrator {

using core::ControlState;
using core::EntityKey;

namespace {

// Model whose predictions are stored per article rather than per candle.
constexpr const char* kNewsModel = "finbert";

} // namespace

Orchestrator::Orchestrator(OrchestratorOptions options, control::ControlPlane& control)
    : options_(std::move(options)), control_(control) {}

std::vector<EntityKey> Orchestrator::configured_consumers() const {
    std::vector<EntityKey> out;
    out.reserve(options_.symbols.size() * options_.models.size() * options_.versions.size());
    for (const auto& symbol : options_.symbols) {
        for (const auto& model : options_.models) {
            for (const auto& version : options_.versions) {
                out.push_back(EntityKey::consumer(symbol, model, version));
            }
        }
    }
    return out;
}

core::Status Orchestrator::submit_producer(const std::string& symbol) {
    return jobs::write_job_file(options_.jobs_dir, jobs::make_producer_job(symbol, options_.bin_dir));
}

core::Status Orchestrator::submit_consumer(const EntityKey& entity) {
    return jobs::write_job_file(options_.jobs_dir, jobs::make_consumer_job(entity, options_.bin_dir));
}

core::Expected<StartReport> Orchestrator::start_pipeline(const std::atomic<bool>* cancel) {
    StartReport report;

    // 1. Clean slate
    core::Status cleared = control_.delete_all();
    if (!cleared) {
        audit::log_warn("Could not clear control state: " + cleared.message());
    }

    // 2. Producer
    const EntityKey producer = EntityKey::producer();
    const std::string symbol = options_.symbols.empty() ? std::string("BTCUSDT") : options_.symbols.front();
    core::Status submitted = submit_producer(symbol);
    if (!submitted) {
        return core::make_error(submitted.error(), "cannot submit producer job: " + submitted.message());
    }
    audit::log_info("Waiting for the producer to start...");
    control::WaitResult producer_wait = control_.wait_for(
        producer,
        [](ControlState s) { return s == ControlState::Running || s == ControlState::Error; },
        options_.producer_timeout, options_.startup_poll, cancel);
    if (producer_wait.state == ControlState::Error) {
        return core::make_error(core::ErrorCode::Unavailable, "producer reported ERROR");
    }
    if (!producer_wait.satisfied) {
        return core::make_error(core::ErrorCode::Timeout,
                                std::string("producer did not start, last state ") + core::to_string(producer_wait.state));
    }
    report.producer_ready = true;
    audit::log_info("Producer is RUNNING");

    // 3. Consumers
    const std::vector<EntityKey> consumers = configured_consumers();
    std::vector<EntityKey> pending;
    for (const auto& entity : consumers) {
        core::Status started = control_.write(entity, ControlState::Start);
        if (!started) {
            audit::log_error("Could not write START for " + entity.id() + ": " + started.message());
            report.failed.push_back(entity);
            continue;
        }
        core::Status job = submit_consumer(entity);
        if (!job) {
            audit::log_error("Could not submit job for " + entity.id() + ": " + job.message());
            report.failed.push_back(entity);
            continue;
        }
        pending.push_back(entity);
    }

    // 4. Readiness
    for (const auto& entity : pending) {
        control::WaitResult wait = control_.wait_for(
            entity,
            [](ControlState s) {
                return s == ControlState::Running || s == ControlState::Error || s == ControlState::Deleted;
            },
            options_.consumer_timeout, options_.startup_poll, cancel);
        if (wait.state == ControlState::Running) {
            audit::log_info("Consumer " + entity.id() + " is RUNNING");
            report.running.push_back(entity);
        } else {
            audit::log_error("Consumer " + entity.id() + " failed to start (" + core::to_string(wait.state) + ")");
            report.failed.push_back(entity);
        }
    }

    audit::log_info("Startup finished: " + std::to_string(report.running.size()) + " running, " +
                    std::to_string(report.failed.size()) + " failed");
    return report;
}

void Orchestrator::send_delete(const EntityKey& entity, std::vector<EntityKey>& targets) {
    const ControlState state = control_.current(entity);
    if (core::is_stopped(state)) return;
    core::Status sent = control_.write(entity, ControlState::Delete);
    if (!sent) {
        audit::log_error("Could not send DELETE to " + entity.id() + ": " + sent.message());
        return;
    }
    audit::log_audit("DELETE sent to " + entity.id() + " (was " + core::to_string(state) + ")");
    targets.push_back(entity);
}

bool Orchestrator::wait_until_stopped(const EntityKey& entity, std::chrono::milliseconds timeout,
                                      const std::atomic<bool>* cancel) {
    control::WaitResult wait = control_.wait_for(
        entity, [](ControlState s) { return core::is_stopped(s); }, timeout, options_.kill_poll, cancel);
    return wait.satisfied;
}

KillReport Orchestrator::kill_all(const std::atomic<bool>* cancel) {
    using clock = std::chrono::steady_clock;
    KillReport report;

    std::set<EntityKey> consumers;
    for (const auto& entity : configured_consumers()) consumers.insert(entity);
    auto recorded = control_.list();
    if (recorded) {
        for (const auto& record : recorded.value()) {
            if (!record.entity.is_producer()) consumers.insert(record.entity);
        }
    } else {
        audit::log_warn("Could not list recorded entities: " + recorded.message());
    }

    std::vector<EntityKey> targets;
    for (const auto& entity : consumers) send_delete(entity, targets);
    send_delete(EntityKey::producer(), targets);

    const auto deadline = clock::now() + options_.kill_total_timeout;
    for (const auto& entity : targets) {
        if (cancel && cancel->load()) {
            report.interrupted = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            audit::log_warn("Shutdown budget exhausted before " + entity.id());
            report.timed_out.push_back(entity);
            continue;
        }
        if (wait_until_stopped(entity, std::min(options_.kill_entity_timeout, remaining), cancel)) {
            report.stopped.push_back(entity);
        } else {
            if (cancel && cancel->load()) report.interrupted = true;
            audit::log_warn(entity.id() + " did not confirm shutdown (" + core::to_string(control_.current(entity)) +
                            ")");
            report.timed_out.push_back(entity);
        }
    }
    if (report.interrupted) audit::log_warn("Shutdown wait interrupted, cleaning up");

    core::Status cleaned = control_.delete_all();
    report.cleaned = cleaned.is_ok();
    if (!cleaned) {
        audit::log_error("Final control-state cleanup failed: " + cleaned.message());
    }
    audit::log_info("Shutdown finished: " + std::to_string(report.stopped.size()) + " stopped, " +
                    std::to_string(report.timed_out.size()) + " unconfirmed");
    return report;
}

core::Status Orchestrator::rotate_model(const std::string& model_type, const std::filesystem::path& artifact,
                                        registry::VersionManager& versions, persist::CandleRepository* candles,
                                        persist::NewsRepository* news) {
    const std::string previous = "v" + std::to_string(registry::kPreviousSlot);
    const std::string latest = "v" + std::to_string(registry::kLatestSlot);

    std::vector<EntityKey> affected;
    for (const auto& symbol : options_.symbols) {
        affected.push_back(EntityKey::consumer(symbol, model_type, previous));
        affected.push_back(EntityKey::consumer(symbol, model_type, latest));
    }

    std::vector<EntityKey> targets;
    for (const auto& entity : affected) send_delete(entity, targets);
    for (const auto& entity : targets) {
        if (!wait_until_stopped(entity, options_.kill_entity_timeout, nullptr)) {
            audit::log_warn(entity.id() + " did not stop before rotation");
        }
    }

    auto registered = versions.register_new_model(model_type, artifact);
    if (!registered) {
        audit::log_error("Rotation of " + model_type + " failed: " + registered.message());
    } else if (candles) {
        for (const auto& symbol : options_.symbols) {
            auto moved = candles->shift_predictions(symbol, model_type, latest, previous);
            if (!moved) {
                audit::log_warn("Could not move " + latest + " predictions for " + symbol + ": " + moved.message());
            } else {
                audit::log_info("Moved " + std::to_string(moved.value()) + " " + model_type + " predictions " + latest +
                                " -> " + previous + " for " + symbol);
            }
        }
    }

    if (registered && news && model_type == kNewsModel) {
        auto cleared = news->reset_version(previous);
        auto moved = cleared ? news->shift_predictions(latest, previous) : cleared;
        if (!moved) {
            audit::log_warn("Could not move " + latest + " news predictions: " + moved.message());
        } else {
            audit::log_info("Moved " + std::to_string(moved.value()) + " news predictions " + latest + " -> " + previous);
        }
    }

    // Consumers come back either way so a failed rotation leaves the old slots serving.
    for (const auto& entity : affected) {
        core::Status started = control_.write(entity, ControlState::Start);
        if (started) started = submit_consumer(entity);
        if (!started) audit::log_error("Could not restart " + entity.id() + ": " + started.message());
    }
    if (!registered) return registered.error_info();
    audit::log_audit("rotated " + model_type + " to " + registered.value().path);
    return core::Status::ok();
}

} // namespace candlecast::orchestrator
