#include "store/batch_writer.hpp"

#include "audit/logger.hpp"

#include <algorithm>

namespace candlecast::store {

BatchWriter::BatchWriter(DocumentStore& store, BatchWriterOptions options)
    : store_(store), options_(std::move(options)) {
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
}

core::Status BatchWriter::write(const std::string& collection, const std::vector<WriteOp>& ops) {
    const size_t limit = std::max<size_t>(1, store_.max_batch_ops());
    std::vector<WriteOp> chunk;
    chunk.reserve(std::min(limit, ops.size()));
    for (size_t offset = 0; offset < ops.size(); offset += limit) {
        const size_t end = std::min(ops.size(), offset + limit);
        chunk.assign(ops.begin() + static_cast<std::ptrdiff_t>(offset), ops.begin() + static_cast<std::ptrdiff_t>(end));
        core::Status status = commit_chunk(collection, chunk);
        if (!status) return status;
    }
    return core::Status::ok();
}

core::Status BatchWriter::commit_chunk(const std::string& collection, const std::vector<WriteOp>& chunk) {
    core::Status status = store_.commit(collection, chunk);
    if (!status && status.error() == core::ErrorCode::Quota) {
        audit::log_warn("Store quota exceeded on " + collection + ", retrying chunk of " +
                        std::to_string(chunk.size()) + " after " +
                        std::to_string(options_.quota_backoff.count()) + " ms");
        ++stats_.quota_retries;
        options_.sleeper(options_.quota_backoff);
        status = store_.commit(collection, chunk);
    }
    if (!status) {
        audit::log_error("Commit to " + collection + " failed: " + status.message());
        return status;
    }
    ++stats_.commits;
    stats_.ops += chunk.size();
    return status;
}

core::Expected<size_t> BatchWriter::delete_matching(const std::string& collection, const Query& query) {
    auto docs = store_.scan(collection, query);
    if (!docs) return docs.error_info();
    std::vector<WriteOp> ops;
    ops.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        ops.push_back(WriteOp::remove(doc.id));
    }
    core::Status status = write(collection, ops);
    if (!status) return status.error_info();
    return ops.size();
}

} // namespace candlecast::store
