#pragma once

#include "control/control_plane.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "persist/candle_repository.hpp"
#include "persist/news_repository.hpp"
#include "registry/version_manager.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace candlecast::orchestrator {

struct OrchestratorOptions {
    std::vector<std::string> symbols{"BTCUSDT"};
    std::vector<std::string> models{"lightgbm", "tst"};
    std::vector<std::string> versions{"v1", "v2", "v3"};
    std::string jobs_dir = "jobs";
    std::string bin_dir = ".";

    std::chrono::milliseconds producer_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds consumer_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds startup_poll{std::chrono::seconds(5)};
    std::chrono::milliseconds kill_entity_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds kill_total_timeout{std::chrono::seconds(600)};
    std::chrono::milliseconds kill_poll{std::chrono::seconds(5)};
};

struct StartReport {
    bool producer_ready = false;
    std::vector<core::EntityKey> running;
    std::vector<core::EntityKey> failed;
};

struct KillReport {
    std::vector<core::EntityKey> stopped;
    std::vector<core::EntityKey> timed_out;
    bool interrupted = false;
    bool cleaned = false;
};

/**
 * @class Orchestrator
 * @brief Brings the streaming pipeline up and down through the control plane
 * and the job directory. Never talks to processes directly.
 */
class Orchestrator {
public:
    Orchestrator(OrchestratorOptions options, control::ControlPlane& control);

    std::vector<core::EntityKey> configured_consumers() const;

    /**
     * @brief consumer-start: clear all control records, launch the producer and
     * wait for RUNNING, then START and launch every configured consumer.
     * Fails only when the producer does not come up; consumer failures are
     * reported in the StartReport.
     */
    core::Expected<StartReport> start_pipeline(const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief kill-all: DELETE every configured and recorded consumer, then the
     * producer, and wait for each to stop. delete_all runs even when the wait
     * is interrupted or times out.
     */
    KillReport kill_all(const std::atomic<bool>* cancel = nullptr);

    // Stops the slot-2/slot-3 consumers of a model, registers the artifact,
    // moves slot-3 predictions into the slot-2 column and restarts them.
    // finbert predictions live in the news collection (trl_3 -> trl_2).
    core::Status rotate_model(const std::string& model_type, const std::filesystem::path& artifact,
                              registry::VersionManager& versions, persist::CandleRepository* candles = nullptr,
                              persist::NewsRepository* news = nullptr);

    // Writes the job file that the dispatcher turns into a process.
    core::Status submit_producer(const std::string& symbol);
    core::Status submit_consumer(const core::EntityKey& entity);

private:
    bool wait_until_stopped(const core::EntityKey& entity, std::chrono::milliseconds timeout,
                            const std::atomic<bool>* cancel);
    void send_delete(const core::EntityKey& entity, std::vector<core::EntityKey>& targets);

    OrchestratorOptions options_;
    control::ControlPlane& control_;
};

} // namespace candlecast::orchestrator
