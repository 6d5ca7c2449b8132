#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "inference/inference_provider.hpp"
#include "store/batch_writer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace candlecast::persist {

struct ScoredCandle {
    core::PriceCandle candle;
    inference::Prediction prediction;
};

struct CandleRepositoryOptions {
    size_t upsert_threshold = 100;
    uint32_t retention_days = 180;
    store::BatchWriterOptions writer;
};

/**
 * @class CandleRepository
 * @brief Per-symbol candle collection with sparse prediction columns.
 * Documents are keyed by the ISO-8601 open time, so every write is an
 * idempotent upsert. Bulk inserts are followed by retention trimming.
 */
class CandleRepository {
public:
    explicit CandleRepository(store::DocumentStore& documents, CandleRepositoryOptions options = {});

    static std::string collection_for(const std::string& symbol);
    static std::string document_id(int64_t open_time_ms);
    static store::Json candle_fields(const core::PriceCandle& candle);

    core::Status bulk_insert(const std::string& symbol, const std::vector<core::PriceCandle>& candles);

    /**
     * @brief Attach one model version's predictions to their candles.
     * Below upsert_threshold every key is read first and existing documents
     * are updated; at or above it a blind field update pass runs first and
     * existence is checked in bulk afterwards. Keys with no document are
     * inserted as full rows either way.
     */
    core::Status upsert_predictions(const std::string& symbol, const std::string& model, const std::string& version,
                                    const std::vector<ScoredCandle>& scored);

    // Deletes documents older than latest open_time - retention_days.
    core::Expected<size_t> trim_retention(const std::string& symbol);

    core::Expected<std::optional<int64_t>> last_open_time(const std::string& symbol);

    // Open times, ascending, whose document lacks the version's prediction column.
    core::Expected<std::vector<int64_t>> missing_prediction_times(const std::string& symbol, const std::string& model,
                                                                  const std::string& version);

    // Moves a prediction column to another version's column (used on slot rotation).
    core::Expected<size_t> shift_predictions(const std::string& symbol, const std::string& model,
                                             const std::string& from_version, const std::string& to_version);

    // Inserts ledger rows newer than the store's latest candle, at most max_rows of the newest.
    core::Expected<size_t> sync_from_ledger(const std::string& symbol, const std::vector<core::PriceCandle>& ledger,
                                            size_t max_rows);

    const store::BatchWriteStats& stats() const { return writer_.stats(); }

private:
    core::Status insert_rows(const std::string& symbol, const std::vector<store::WriteOp>& rows);

    store::DocumentStore& documents_;
    CandleRepositoryOptions options_;
    store::BatchWriter writer_;
};

} // namespace candlecast::persist
