#include "control/store_control_plane.hpp"

#include "audit/logger.hpp"

namespace candlecast::control {

StoreControlPlane::StoreControlPlane(store::DocumentStore& documents, std::string collection)
    : store_(documents), writer_(documents), collection_(std::move(collection)) {}

core::Expected<std::optional<ControlRecord>> StoreControlPlane::load(const core::EntityKey& entity) {
    auto doc = store_.get(collection_, entity.id());
    if (!doc) return doc.error_info();
    if (!doc.value()) return std::optional<ControlRecord>{};
    auto record = record_from_json(*doc.value());
    if (!record) return record.error_info();
    return std::optional<ControlRecord>(std::move(record.value()));
}

core::Status StoreControlPlane::save(const ControlRecord& record) {
    return store_.commit(collection_, {store::WriteOp::merge(record.entity.id(), to_json(record))});
}

core::Status StoreControlPlane::remove(const core::EntityKey& entity) {
    return store_.commit(collection_, {store::WriteOp::remove(entity.id())});
}

core::Expected<std::vector<ControlRecord>> StoreControlPlane::list() {
    auto docs = store_.scan(collection_, store::Query{});
    if (!docs) return docs.error_info();
    std::vector<ControlRecord> records;
    for (const auto& doc : docs.value()) {
        auto record = record_from_json(doc.body);
        if (!record) {
            audit::log_warn("Skipping malformed control record " + doc.id);
            continue;
        }
        records.push_back(std::move(record.value()));
    }
    return records;
}

core::Status StoreControlPlane::delete_all() {
    auto deleted = writer_.delete_matching(collection_, store::Query{});
    if (!deleted) return deleted.error_info();
    audit::log_info("Deleted " + std::to_string(deleted.value()) + " control records");
    return core::Status::ok();
}

} // namespace candlecast::control
