#include "status/status_store.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

namespace candlecast::status {

namespace {

std::string field_text(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    return (it != body.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

nlohmann::json status_json(const std::string& model, const std::string& coin, core::TrainingState state,
                           const std::string& error, int64_t now_ms) {
    return nlohmann::json{
        {"model", model},
        {"coin", coin},
        {"state", core::to_string(state)},
        {"error_message", error},
        {"updated_at", core::format_iso8601(now_ms)},
        {"updated_at_ms", now_ms},
    };
}

} // namespace

StatusStore::StatusStore(store::DocumentStore& documents, StatusStoreOptions options)
    : documents_(documents), options_(std::move(options)), writer_(documents, options_.writer) {}

core::Status StatusStore::flush() {
    auto deleted = writer_.delete_matching(options_.status_collection, store::Query{});
    if (!deleted) return deleted.error_info();
    audit::log_info("Flushed " + std::to_string(deleted.value()) + " training status rows");
    return core::Status::ok();
}

core::Status StatusStore::init_entries(const std::vector<std::string>& models, const std::vector<std::string>& coins) {
    const int64_t now = core::unix_now_ms();
    std::vector<store::WriteOp> ops;
    ops.reserve(models.size() * coins.size() + 1);
    for (const auto& model : models) {
        for (const auto& coin : coins) {
            ops.push_back(store::WriteOp::merge(model + "_" + coin,
                                                status_json(model, coin, core::TrainingState::Pending, "", now)));
        }
    }
    ops.push_back(store::WriteOp::merge(options_.aggregate_model + "_" + options_.aggregate_coin,
                                        status_json(options_.aggregate_model, options_.aggregate_coin,
                                                    core::TrainingState::Pending, "", now)));
    core::Status status = writer_.write(options_.status_collection, ops);
    if (status) {
        audit::log_info("Initialised " + std::to_string(ops.size()) + " training status rows");
    }
    return status;
}

core::Status StatusStore::set_state(const std::string& model, const std::string& coin, core::TrainingState state,
                                    std::optional<std::string> error) {
    const int64_t now = core::unix_now_ms();
    nlohmann::json fields = status_json(model, coin, state, error.value_or(""), now);
    if (!error) fields.erase("error_message");
    core::Status status = documents_.commit(options_.status_collection, {store::WriteOp::merge(model + "_" + coin, fields)});
    if (status) {
        audit::log_audit("training " + model + "_" + coin + " -> " + core::to_string(state));
    } else {
        audit::log_error("Failed to set training state for " + model + "_" + coin + ": " + status.message());
    }
    return status;
}

core::Expected<std::vector<TrainingJobStatus>> StatusStore::get_status() {
    store::Query query;
    query.order_by = "model";
    auto docs = documents_.scan(options_.status_collection, query);
    if (!docs) return docs.error_info();
    std::vector<TrainingJobStatus> rows;
    rows.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        TrainingJobStatus row;
        row.model = field_text(doc.body, "model");
        row.coin = field_text(doc.body, "coin");
        if (!core::parse_training_state(field_text(doc.body, "state"), &row.state)) {
            audit::log_warn("Training status " + doc.id + " has unknown state, treating as PENDING");
        }
        row.error_message = field_text(doc.body, "error_message");
        auto ms = doc.body.find("updated_at_ms");
        if (ms != doc.body.end() && ms->is_number_integer()) row.updated_at_ms = ms->get<int64_t>();
        rows.push_back(std::move(row));
    }
    return rows;
}

bool StatusStore::all_terminal(const std::vector<TrainingJobStatus>& snapshot) {
    for (const auto& row : snapshot) {
        if (!core::is_terminal(row.state)) return false;
    }
    return true;
}

core::Expected<std::vector<TrainingJobStatus>> StatusStore::wait_until_terminal(std::chrono::milliseconds timeout,
                                                                                std::chrono::milliseconds poll,
                                                                                const core::Sleeper& sleeper) {
    if (poll.count() <= 0) poll = std::chrono::milliseconds(1);
    const int64_t max_polls = timeout.count() / poll.count() + 1;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (int64_t polls = 0;; ++polls) {
        auto snapshot = get_status();
        if (snapshot && all_terminal(snapshot.value())) return snapshot;
        if (!snapshot) {
            audit::log_warn("Training status poll failed: " + snapshot.message());
        }
        if (polls >= max_polls || std::chrono::steady_clock::now() >= deadline) {
            return core::make_error(core::ErrorCode::Timeout, "training jobs did not finish in time");
        }
        sleeper(poll);
    }
}

core::Status StatusStore::log_event(TrainingEvent event) {
    if (event.created_at_ms == 0) event.created_at_ms = core::unix_now_ms();
    const std::string id = std::to_string(event.created_at_ms) + "_" + std::to_string(event_seq_++) + "_" +
                           event.dag_name + "_" + event.task_name;
    nlohmann::json body{
        {"dag_name", event.dag_name},
        {"task_name", event.task_name},
        {"model_name", event.model_name},
        {"run_id", event.run_id},
        {"event_type", event.event_type},
        {"status", event.status},
        {"message", event.message},
        {"metadata", event.metadata},
        {"created_at", core::format_iso8601(event.created_at_ms)},
        {"created_at_ms", event.created_at_ms},
    };
    core::Status status = documents_.commit(options_.events_collection, {store::WriteOp::merge(id, body)});
    if (!status) {
        audit::log_warn("Failed to record training event " + event.event_type + ": " + status.message());
    }
    return status;
}

core::Expected<std::vector<TrainingEvent>> StatusStore::get_events(size_t limit) {
    store::Query query;
    query.order_by = "created_at_ms";
    query.descending = true;
    query.limit = limit;
    auto docs = documents_.scan(options_.events_collection, query);
    if (!docs) return docs.error_info();
    std::vector<TrainingEvent> events;
    for (const auto& doc : docs.value()) {
        TrainingEvent event;
        event.dag_name = field_text(doc.body, "dag_name");
        event.task_name = field_text(doc.body, "task_name");
        event.model_name = field_text(doc.body, "model_name");
        event.run_id = field_text(doc.body, "run_id");
        event.event_type = field_text(doc.body, "event_type");
        event.status = field_text(doc.body, "status");
        event.message = field_text(doc.body, "message");
        if (doc.body.contains("metadata")) event.metadata = doc.body.at("metadata");
        auto ms = doc.body.find("created_at_ms");
        if (ms != doc.body.end() && ms->is_number_integer()) event.created_at_ms = ms->get<int64_t>();
        events.push_back(std::move(event));
    }
    return events;
}

core::Expected<size_t> StatusStore::cleanup_old_events() {
    const int64_t cutoff = core::unix_now_ms() - static_cast<int64_t>(options_.event_retention_days) * core::kMillisPerDay;
    store::Query query;
    query.filters.push_back(store::Filter{"created_at_ms", store::FilterOp::Lt, cutoff});
    auto deleted = writer_.delete_matching(options_.events_collection, query);
    if (deleted) {
        audit::log_info("Removed " + std::to_string(deleted.value()) + " training events older than " +
                        std::to_string(options_.event_retention_days) + " days");
    }
    return deleted;
}

} // namespace candlecast::status
