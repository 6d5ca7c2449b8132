#pragma once

#include "store/document_store.hpp"

#include <memory>
#include <mutex>
#include <set>

struct pg_conn;

namespace candlecast::store {

/**
 * @class PgDocumentStore
 * @brief DocumentStore on PostgreSQL: one table per collection with
 * (id TEXT PRIMARY KEY, body JSONB). Merge writes use jsonb concatenation
 * so fields not named in the write are preserved.
 */
class PgDocumentStore final : public DocumentStore {
public:
    static core::Expected<std::unique_ptr<PgDocumentStore>> connect(const std::string& dsn,
                                                                    size_t max_batch_ops = 500);
    ~PgDocumentStore() override;

    PgDocumentStore(const PgDocumentStore&) = delete;
    PgDocumentStore& operator=(const PgDocumentStore&) = delete;

    size_t max_batch_ops() const override;
    core::Status commit(const std::string& collection, const std::vector<WriteOp>& ops) override;
    core::Expected<std::optional<Json>> get(const std::string& collection, const std::string& id) override;
    core::Expected<std::vector<std::string>> existing_ids(const std::string& collection,
                                                          const std::vector<std::string>& ids) override;
    core::Expected<std::vector<StoredDocument>> scan(const std::string& collection, const Query& query) override;

    // Lowercase alphanumerics and underscores, prefixed "doc_".
    static std::string table_name(const std::string& collection);

private:
    PgDocumentStore(std::string dsn, pg_conn* conn, size_t max_batch_ops);

    core::Status ensure_connected();
    core::Status ensure_table(const std::string& table);
    core::Status exec(const std::string& sql);

    std::string dsn_;
    pg_conn* conn_ = nullptr;
    size_t max_batch_ops_;
    std::set<std::string> known_tables_;
    std::mutex mutex_;
};

} // namespace candlecast::store
