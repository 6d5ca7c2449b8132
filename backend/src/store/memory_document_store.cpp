#include "store/memory_document_store.hpp"

#include <algorithm>

namespace candlecast::store {

MemoryDocumentStore::MemoryDocumentStore(size_t max_batch_ops)
    : max_batch_ops_(max_batch_ops == 0 ? 1 : max_batch_ops) {}

size_t MemoryDocumentStore::max_batch_ops() const {
    return max_batch_ops_;
}

core::Status MemoryDocumentStore::commit(const std::string& collection, const std::vector<WriteOp>& ops) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ops.size() > max_batch_ops_) {
        return core::make_error(core::ErrorCode::Range,
                                "batch of " + std::to_string(ops.size()) + " exceeds limit " +
                                    std::to_string(max_batch_ops_));
    }
    if (fail_remaining_ > 0) {
        --fail_remaining_;
        ++failed_commits_;
        if (fail_error_ == core::ErrorCode::Quota) {
            return core::make_error(core::ErrorCode::Quota, "429 resource exhausted: write quota exceeded");
        }
        return core::make_error(fail_error_, "injected commit failure");
    }

    auto& docs = collections_[collection];
    for (const auto& op : ops) {
        switch (op.kind) {
            case WriteKind::Merge: {
                Json& body = docs[op.id];
                if (!body.is_object()) body = Json::object();
                for (auto it = op.fields.begin(); it != op.fields.end(); ++it) {
                    body[it.key()] = it.value();
                }
                break;
            }
            case WriteKind::Update: {
                auto it = docs.find(op.id);
                if (it == docs.end()) break;
                for (auto field = op.fields.begin(); field != op.fields.end(); ++field) {
                    it->second[field.key()] = field.value();
                }
                break;
            }
            case WriteKind::Delete:
                docs.erase(op.id);
                break;
        }
    }
    commit_sizes_.push_back(ops.size());
    return core::Status::ok();
}

core::Expected<std::optional<Json>> MemoryDocumentStore::get(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_error_ != core::ErrorCode::Ok) return core::make_error(read_error_, "injected read failure");
    auto coll = collections_.find(collection);
    if (coll == collections_.end()) return std::optional<Json>{};
    auto it = coll->second.find(id);
    if (it == coll->second.end()) return std::optional<Json>{};
    return std::optional<Json>(it->second);
}

core::Expected<std::vector<std::string>> MemoryDocumentStore::existing_ids(const std::string& collection,
                                                                           const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_error_ != core::ErrorCode::Ok) return core::make_error(read_error_, "injected read failure");
    std::vector<std::string> out;
    auto coll = collections_.find(collection);
    if (coll == collections_.end()) return out;
    for (const auto& id : ids) {
        if (coll->second.count(id)) out.push_back(id);
    }
    return out;
}

core::Expected<std::vector<StoredDocument>> MemoryDocumentStore::scan(const std::string& collection,
                                                                      const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_error_ != core::ErrorCode::Ok) return core::make_error(read_error_, "injected read failure");
    std::vector<StoredDocument> out;
    auto coll = collections_.find(collection);
    if (coll == collections_.end()) return out;

    for (const auto& [id, body] : coll->second) {
        bool keep = true;
        for (const auto& filter : query.filters) {
            if (!matches_filter(body, filter)) {
                keep = false;
                break;
            }
        }
        if (keep) out.push_back(StoredDocument{id, body});
    }

    if (!query.order_by.empty()) {
        const std::string& field = query.order_by;
        std::stable_sort(out.begin(), out.end(), [&](const StoredDocument& a, const StoredDocument& b) {
            const bool has_a = a.body.contains(field);
            const bool has_b = b.body.contains(field);
            if (has_a != has_b) return has_a;
            if (!has_a) return false;
            return query.descending ? (b.body.at(field) < a.body.at(field)) : (a.body.at(field) < b.body.at(field));
        });
    }
    if (query.limit > 0 && out.size() > query.limit) {
        out.resize(query.limit);
    }
    return out;
}

void MemoryDocumentStore::fail_next_commits(size_t count, core::ErrorCode error) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_remaining_ = count;
    fail_error_ = error;
}

void MemoryDocumentStore::fail_reads(core::ErrorCode error) {
    std::lock_guard<std::mutex> lock(mutex_);
    read_error_ = error;
}

std::vector<size_t> MemoryDocumentStore::commit_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commit_sizes_;
}

size_t MemoryDocumentStore::failed_commits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_commits_;
}

size_t MemoryDocumentStore::document_count(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto coll = collections_.find(collection);
    return coll == collections_.end() ? 0 : coll->second.size();
}

} // namespace candlecast::store
