#pragma once

#include "core/retry.hpp"
#include "store/document_store.hpp"

#include <chrono>
#include <cstdint>

namespace candlecast::store {

struct BatchWriterOptions {
    std::chrono::milliseconds quota_backoff{60000};
    core::Sleeper sleeper = core::sleep_for_ms;
};

struct BatchWriteStats {
    uint64_t commits = 0;
    uint64_t quota_retries = 0;
    uint64_t ops = 0;
};

/**
 * @class BatchWriter
 * @brief Splits write sets into store-sized commits.
 * A chunk refused with ErrorCode::Quota is retried exactly once after
 * quota_backoff; any other failure, or a second refusal, is returned and
 * later chunks are not attempted.
 */
class BatchWriter {
public:
    explicit BatchWriter(DocumentStore& store, BatchWriterOptions options = {});

    core::Status write(const std::string& collection, const std::vector<WriteOp>& ops);

    // Delete every document matched by query, in chunks.
    core::Expected<size_t> delete_matching(const std::string& collection, const Query& query);

    const BatchWriteStats& stats() const { return stats_; }
    DocumentStore& store() { return store_; }

private:
    core::Status commit_chunk(const std::string& collection, const std::vector<WriteOp>& chunk);

    DocumentStore& store_;
    BatchWriterOptions options_;
    BatchWriteStats stats_;
};

} // namespace candlecast::store
