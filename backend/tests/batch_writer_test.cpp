#include "store/batch_writer.hpp"
#include "store/memory_document_store.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

namespace {

std::vector<candlecast::store::WriteOp> make_ops(size_t count) {
    std::vector<candlecast::store::WriteOp> ops;
    for (size_t i = 0; i < count; ++i) {
        ops.push_back(candlecast::store::WriteOp::merge("doc-" + std::to_string(i),
                                                        {{"n", static_cast<int>(i)}, {"group", i % 2}}));
    }
    return ops;
}

} // namespace

int main() {
    using namespace candlecast;

    std::vector<std::chrono::milliseconds> sleeps;
    store::BatchWriterOptions options;
    options.quota_backoff = std::chrono::milliseconds(60000);
    options.sleeper = [&](std::chrono::milliseconds delay) { sleeps.push_back(delay); };

    // 1,234 records at 500 per commit.
    {
        store::MemoryDocumentStore documents(500);
        store::BatchWriter writer(documents, options);
        assert(writer.write("btcusdt", make_ops(1234)).is_ok());
        const std::vector<size_t> sizes = documents.commit_sizes();
        assert(sizes.size() == 3);
        assert(sizes[0] == 500 && sizes[1] == 500 && sizes[2] == 234);
        assert(documents.document_count("btcusdt") == 1234);
        assert(writer.stats().commits == 3);
        assert(writer.stats().ops == 1234);
        assert(sleeps.empty());
    }

    // One quota refusal: one backoff, exactly one retry, nothing lost.
    {
        store::MemoryDocumentStore documents(500);
        store::BatchWriter writer(documents, options);
        documents.fail_next_commits(1);
        assert(writer.write("btcusdt", make_ops(1234)).is_ok());
        assert(documents.failed_commits() == 1);
        assert(documents.commit_sizes().size() == 3);
        assert(documents.document_count("btcusdt") == 1234);
        assert(writer.stats().quota_retries == 1);
        assert(sleeps.size() == 1 && sleeps[0] == std::chrono::milliseconds(60000));
    }

    // Two refusals of the same chunk give up and leave later chunks unwritten.
    {
        sleeps.clear();
        store::MemoryDocumentStore documents(500);
        store::BatchWriter writer(documents, options);
        documents.fail_next_commits(2);
        core::Status status = writer.write("btcusdt", make_ops(1234));
        assert(!status);
        assert(status.error() == core::ErrorCode::Quota);
        assert(documents.document_count("btcusdt") == 0);
        assert(sleeps.size() == 1);
    }

    // Non-quota failures are not retried.
    {
        sleeps.clear();
        store::MemoryDocumentStore documents(500);
        store::BatchWriter writer(documents, options);
        documents.fail_next_commits(1, core::ErrorCode::Io);
        assert(writer.write("btcusdt", make_ops(10)).error() == core::ErrorCode::Io);
        assert(sleeps.empty());
    }

    // Chunked delete by query, and Update skipping absent documents.
    {
        store::MemoryDocumentStore documents(100);
        store::BatchWriter writer(documents, options);
        assert(writer.write("btcusdt", make_ops(250)).is_ok());
        store::Query query;
        query.filters.push_back(store::Filter{"group", store::FilterOp::Eq, 1});
        auto removed = writer.delete_matching("btcusdt", query);
        assert(removed && removed.value() == 125);
        assert(documents.document_count("btcusdt") == 125);

        std::vector<store::WriteOp> updates;
        updates.push_back(store::WriteOp::update("doc-0", {{"pred", 0.5}}));
        updates.push_back(store::WriteOp::update("doc-1", {{"pred", 0.5}}));
        assert(writer.write("btcusdt", updates).is_ok());
        auto doc0 = documents.get("btcusdt", "doc-0");
        assert(doc0 && doc0.value() && doc0.value()->at("pred") == 0.5);
        auto doc1 = documents.get("btcusdt", "doc-1");
        assert(doc1 && !doc1.value());
    }

    return 0;
}
