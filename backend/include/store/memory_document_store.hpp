#pragma once

#include "store/document_store.hpp"

#include <map>
#include <mutex>

namespace candlecast::store {

/**
 * @class MemoryDocumentStore
 * @brief Thread-safe in-process DocumentStore.
 * Records every commit and can be told to refuse upcoming commits, which is
 * how quota handling is exercised without a live database.
 */
class MemoryDocumentStore final : public DocumentStore {
public:
    explicit MemoryDocumentStore(size_t max_batch_ops = 500);

    size_t max_batch_ops() const override;
    core::Status commit(const std::string& collection, const std::vector<WriteOp>& ops) override;
    core::Expected<std::optional<Json>> get(const std::string& collection, const std::string& id) override;
    core::Expected<std::vector<std::string>> existing_ids(const std::string& collection,
                                                          const std::vector<std::string>& ids) override;
    core::Expected<std::vector<StoredDocument>> scan(const std::string& collection, const Query& query) override;

    // The next count commits fail with error (and apply nothing).
    void fail_next_commits(size_t count, core::ErrorCode error = core::ErrorCode::Quota);
    // Every read fails with error until cleared with ErrorCode::Ok.
    void fail_reads(core::ErrorCode error);

    std::vector<size_t> commit_sizes() const;
    size_t failed_commits() const;
    size_t document_count(const std::string& collection) const;

private:
    size_t max_batch_ops_;
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, Json>> collections_;
    std::vector<size_t> commit_sizes_;
    size_t fail_remaining_ = 0;
    core::ErrorCode fail_error_ = core::ErrorCode::Quota;
    core::ErrorCode read_error_ = core::ErrorCode::Ok;
    size_t failed_commits_ = 0;
};

} // namespace candlecast::store
