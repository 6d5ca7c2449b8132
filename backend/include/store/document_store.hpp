#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace candlecast::store {

using Json = nlohmann::json;

enum class WriteKind {
    Merge = 0,   // create, or overwrite only the given fields
    Update = 1,  // overwrite the given fields if the document exists, skip otherwise
    Delete = 2
};

struct WriteOp {
    WriteKind kind = WriteKind::Merge;
    std::string id;
    Json fields = Json::object();

    static WriteOp merge(std::string id, Json fields) { return WriteOp{WriteKind::Merge, std::move(id), std::move(fields)}; }
    static WriteOp update(std::string id, Json fields) { return WriteOp{WriteKind::Update, std::move(id), std::move(fields)}; }
    static WriteOp remove(std::string id) { return WriteOp{WriteKind::Delete, std::move(id), Json::object()}; }
};

enum class FilterOp { Lt, Le, Gt, Ge, Eq, Missing, Present };

struct Filter {
    std::string field;
    FilterOp op = FilterOp::Eq;
    Json value;
};

struct Query {
    std::vector<Filter> filters;
    std::string order_by;
    bool descending = false;
    size_t limit = 0; // 0 = unlimited
};

struct StoredDocument {
    std::string id;
    Json body;
};

/**
 * @class DocumentStore
 * @brief Collections of JSON documents addressed by deterministic ids.
 * A commit applies at most max_batch_ops() operations; callers chunk larger
 * write sets (see BatchWriter). Nothing spans more than one commit.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual size_t max_batch_ops() const = 0;

    /**
     * @brief Apply a batch of writes to one collection.
     * @return ErrorCode::Quota when the backend refuses for capacity reasons,
     *         ErrorCode::Range when the batch exceeds max_batch_ops().
     */
    virtual core::Status commit(const std::string& collection, const std::vector<WriteOp>& ops) = 0;

    // Empty optional when the document does not exist.
    virtual core::Expected<std::optional<Json>> get(const std::string& collection, const std::string& id) = 0;

    // Subset of ids that exist, in input order.
    virtual core::Expected<std::vector<std::string>> existing_ids(const std::string& collection,
                                                                  const std::vector<std::string>& ids) = 0;

    virtual core::Expected<std::vector<StoredDocument>> scan(const std::string& collection, const Query& query) = 0;
};

// Field-level comparison used by both the memory store and tests.
bool matches_filter(const Json& body, const Filter& filter);

} // namespace candlecast::store
