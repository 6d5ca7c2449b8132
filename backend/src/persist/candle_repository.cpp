#include "persist/candle_repository.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <set>

namespace candlecast::persist {

namespace {

constexpr const char* kOpenTimeMs = "open_time_ms";

store::Json prediction_json(const inference::Prediction& prediction) {
    store::Json values = store::Json::array();
    for (double v : prediction) values.push_back(v);
    return values;
}

} // namespace

CandleRepository::CandleRepository(store::DocumentStore& documents, CandleRepositoryOptions options)
    : documents_(documents), options_(std::move(options)), writer_(documents, options_.writer) {}

std::string CandleRepository::collection_for(const std::string& symbol) {
    return core::to_lower(symbol);
}

std::string CandleRepository::document_id(int64_t open_time_ms) {
    return core::format_iso8601(open_time_ms);
}

store::Json CandleRepository::candle_fields(const core::PriceCandle& candle) {
    return store::Json{
        {"open_time", core::format_iso8601(candle.open_time_ms)},
        {kOpenTimeMs, candle.open_time_ms},
        {"open", candle.open},
        {"high", candle.high},
        {"low", candle.low},
        {"close", candle.close},
        {"volume", candle.volume},
    };
}

core::Status CandleRepository::insert_rows(const std::string& symbol, const std::vector<store::WriteOp>& rows) {
    if (rows.empty()) return core::Status::ok();
    const std::string collection = collection_for(symbol);
    core::Status status = writer_.write(collection, rows);
    if (!status) return status;
    auto trimmed = trim_retention(symbol);
    if (!trimmed) {
        audit::log_warn("Retention trim on " + collection + " failed: " + trimmed.message());
    }
    return core::Status::ok();
}

core::Status CandleRepository::bulk_insert(const std::string& symbol, const std::vector<core::PriceCandle>& candles) {
    std::vector<store::WriteOp> ops;
    ops.reserve(candles.size());
    for (const auto& candle : candles) {
        ops.push_back(store::WriteOp::merge(document_id(candle.open_time_ms), candle_fields(candle)));
    }
    core::Status status = insert_rows(symbol, ops);
    if (status && !ops.empty()) {
        audit::log_info("Inserted " + std::to_string(ops.size()) + " candles into " + collection_for(symbol));
    }
    return status;
}

core::Status CandleRepository::upsert_predictions(const std::string& symbol, const std::string& model,
                                                  const std::string& version, const std::vector<ScoredCandle>& scored) {
    if (scored.empty()) return core::Status::ok();
    const std::string collection = collection_for(symbol);
    const std::string column = core::prediction_column(model, version);

    std::vector<std::string> ids;
    ids.reserve(scored.size());
    for (const auto& row : scored) ids.push_back(document_id(row.candle.open_time_ms));

    std::set<std::string> existing;
    if (scored.size() < options_.upsert_threshold) {
        std::vector<store::WriteOp> updates;
        for (size_t i = 0; i < scored.size(); ++i) {
            auto doc = documents_.get(collection, ids[i]);
            if (!doc) return doc.error_info();
            if (doc.value().has_value()) {
                existing.insert(ids[i]);
                updates.push_back(store::WriteOp::update(ids[i], store::Json{{column, prediction_json(scored[i].prediction)}}));
            }
        }
        core::Status status = writer_.write(collection, updates);
        if (!status) return status;
    } else {
        std::vector<store::WriteOp> updates;
        updates.reserve(scored.size());
        for (size_t i = 0; i < scored.size(); ++i) {
            updates.push_back(store::WriteOp::update(ids[i], store::Json{{column, prediction_json(scored[i].prediction)}}));
        }
        core::Status status = writer_.write(collection, updates);
        if (!status) {
            audit::log_warn("Bulk prediction update on " + collection + "." + column +
                            " incomplete, falling back to existence check: " + status.message());
        }
        auto found = documents_.existing_ids(collection, ids);
        if (!found) return found.error_info();
        existing.insert(found.value().begin(), found.value().end());
        if (!status) {
            // Re-apply to the documents the failed pass may have skipped.
            std::vector<store::WriteOp> retry;
            for (size_t i = 0; i < scored.size(); ++i) {
                if (existing.count(ids[i]) != 0) retry.push_back(updates[i]);
            }
            core::Status again = writer_.write(collection, retry);
            if (!again) return again;
        }
    }

    std::vector<store::WriteOp> inserts;
    for (size_t i = 0; i < scored.size(); ++i) {
        if (existing.count(ids[i]) != 0) continue;
        store::Json fields = candle_fields(scored[i].candle);
        fields[column] = prediction_json(scored[i].prediction);
        inserts.push_back(store::WriteOp::merge(ids[i], std::move(fields)));
    }
    core::Status status = insert_rows(symbol, inserts);
    if (!status) return status;
    audit::log_info("Upserted " + std::to_string(scored.size()) + " predictions into " + collection + "." + column +
                    " (" + std::to_string(inserts.size()) + " new rows)");
    return core::Status::ok();
}

core::Expected<size_t> CandleRepository::trim_retention(const std::string& symbol) {
    auto latest = last_open_time(symbol);
    if (!latest) return latest.error_info();
    if (!latest.value()) return size_t{0};
    const int64_t cutoff = *latest.value() - static_cast<int64_t>(options_.retention_days) * core::kMillisPerDay;
    store::Query query;
    query.filters.push_back(store::Filter{kOpenTimeMs, store::FilterOp::Lt, cutoff});
    auto deleted = writer_.delete_matching(collection_for(symbol), query);
    if (deleted && deleted.value() > 0) {
        audit::log_info("Trimmed " + std::to_string(deleted.value()) + " rows older than " +
                        core::format_iso8601(cutoff) + " from " + collection_for(symbol));
    }
    return deleted;
}

core::Expected<std::optional<int64_t>> CandleRepository::last_open_time(const std::string& symbol) {
    store::Query query;
    query.filters.push_back(store::Filter{kOpenTimeMs, store::FilterOp::Present, nullptr});
    query.order_by = kOpenTimeMs;
    query.descending = true;
    query.limit = 1;
    auto docs = documents_.scan(collection_for(symbol), query);
    if (!docs) return docs.error_info();
    if (docs.value().empty()) return std::optional<int64_t>();
    const auto& body = docs.value().front().body;
    return std::optional<int64_t>(body.at(kOpenTimeMs).get<int64_t>());
}

core::Expected<std::vector<int64_t>> CandleRepository::missing_prediction_times(const std::string& symbol,
                                                                                const std::string& model,
                                                                                const std::string& version) {
    store::Query query;
    query.filters.push_back(store::Filter{kOpenTimeMs, store::FilterOp::Present, nullptr});
    query.filters.push_back(store::Filter{core::prediction_column(model, version), store::FilterOp::Missing, nullptr});
    query.order_by = kOpenTimeMs;
    auto docs = documents_.scan(collection_for(symbol), query);
    if (!docs) return docs.error_info();
    std::vector<int64_t> times;
    times.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        times.push_back(doc.body.at(kOpenTimeMs).get<int64_t>());
    }
    return times;
}

core::Expected<size_t> CandleRepository::shift_predictions(const std::string& symbol, const std::string& model,
                                                           const std::string& from_version,
                                                           const std::string& to_version) {
    const std::string collection = collection_for(symbol);
    const std::string from = core::prediction_column(model, from_version);
    const std::string to = core::prediction_column(model, to_version);
    store::Query query;
    query.filters.push_back(store::Filter{from, store::FilterOp::Present, nullptr});
    auto docs = documents_.scan(collection, query);
    if (!docs) return docs.error_info();
    std::vector<store::WriteOp> ops;
    ops.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        ops.push_back(store::WriteOp::update(doc.id, store::Json{{to, doc.body.at(from)}, {from, nullptr}}));
    }
    core::Status status = writer_.write(collection, ops);
    if (!status) return status.error_info();
    audit::log_info("Shifted " + std::to_string(ops.size()) + " predictions " + collection + "." + from + " -> " + to);
    return ops.size();
}

core::Expected<size_t> CandleRepository::sync_from_ledger(const std::string& symbol,
                                                          const std::vector<core::PriceCandle>& ledger,
                                                          size_t max_rows) {
    auto latest = last_open_time(symbol);
    if (!latest) return latest.error_info();
    std::vector<core::PriceCandle> rows;
    for (const auto& candle : ledger) {
        if (!latest.value() || candle.open_time_ms > *latest.value()) rows.push_back(candle);
    }
    if (max_rows > 0 && rows.size() > max_rows) {
        audit::log_warn("Ledger sync for " + symbol + " limited to the newest " + std::to_string(max_rows) + " of " +
                        std::to_string(rows.size()) + " rows");
        rows.erase(rows.begin(), rows.end() - static_cast<std::ptrdiff_t>(max_rows));
    }
    if (rows.empty()) return size_t{0};
    core::Status status = bulk_insert(symbol, rows);
    if (!status) return status.error_info();
    return rows.size();
}

} // namespace candlecast::persist
