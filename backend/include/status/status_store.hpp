#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "store/batch_writer.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace candlecast::status {

struct TrainingJobStatus {
    std::string model;
    std::string coin;
    core::TrainingState state = core::TrainingState::Pending;
    std::string error_message;
    int64_t updated_at_ms = 0;

    std::string id() const { return model + "_" + coin; }
};

struct TrainingEvent {
    std::string dag_name;
    std::string task_name;
    std::string model_name;
    std::string run_id;
    std::string event_type;
    std::string status;
    std::string message;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t created_at_ms = 0;
};

struct StatusStoreOptions {
    std::string status_collection = "batch_status";
    std::string events_collection = "batch_events";
    uint32_t event_retention_days = 365;
    // Aggregate row seeded next to the per-model rows.
    std::string aggregate_model = "trl";
    std::string aggregate_coin = "ALL";
    store::BatchWriterOptions writer;
};

/**
 * @class StatusStore
 * @brief Training job lifecycle table polled by the external workflow engine.
 * One row per (model, coin); a run starts with flush() + init_entries().
 */
class StatusStore {
public:
    explicit StatusStore(store::DocumentStore& documents, StatusStoreOptions options = {});

    core::Status flush();
    core::Status init_entries(const std::vector<std::string>& models, const std::vector<std::string>& coins);
    core::Status set_state(const std::string& model, const std::string& coin, core::TrainingState state,
                           std::optional<std::string> error = std::nullopt);
    core::Expected<std::vector<TrainingJobStatus>> get_status();

    // True when every row is SUCCESS or FAILED (vacuously true when empty).
    static bool all_terminal(const std::vector<TrainingJobStatus>& snapshot);

    // Polls get_status() until all rows are terminal; ErrorCode::Timeout otherwise.
    core::Expected<std::vector<TrainingJobStatus>> wait_until_terminal(std::chrono::milliseconds timeout,
                                                                       std::chrono::milliseconds poll,
                                                                       const core::Sleeper& sleeper = core::sleep_for_ms);

    core::Status log_event(TrainingEvent event);
    core::Expected<std::vector<TrainingEvent>> get_events(size_t limit = 100);
    core::Expected<size_t> cleanup_old_events();

private:
    store::DocumentStore& documents_;
    StatusStoreOptions options_;
    store::BatchWriter writer_;
    uint64_t event_seq_ = 0;
};

} // namespace candlecast::status
