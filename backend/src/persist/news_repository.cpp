#include "persist/news_repository.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"

#include <set>

namespace candlecast::persist {

namespace {

constexpr const char* kPublishedMs = "date_ms";

store::Json prediction_json(const inference::Prediction& prediction) {
    store::Json values = store::Json::array();
    for (double v : prediction) values.push_back(v);
    return values;
}

core::Status check_links(const std::vector<ScoredArticle>& rows) {
    for (const auto& row : rows) {
        if (row.article.link.empty()) {
            return core::make_error(core::ErrorCode::Invalid, "news article without a link");
        }
    }
    return core::Status::ok();
}

} // namespace

NewsRepository::NewsRepository(store::DocumentStore& documents, store::BatchWriterOptions writer)
    : documents_(documents), writer_(documents, std::move(writer)) {}

std::string NewsRepository::column_for(const std::string& version) {
    return core::prediction_column(kCollection, version);
}

store::Json NewsRepository::article_fields(const NewsArticle& article) {
    store::Json fields{{"link", article.link}, {"title", article.title}};
    if (article.published_ms) {
        fields["date"] = core::format_iso8601(*article.published_ms);
        fields[kPublishedMs] = *article.published_ms;
    } else {
        fields["date"] = nullptr;
    }
    fields["price_change"] = article.price_change ? store::Json(*article.price_change) : store::Json(nullptr);
    fields["label"] = article.label ? store::Json(*article.label) : store::Json(nullptr);
    return fields;
}

core::Expected<size_t> NewsRepository::insert_if_absent(const std::vector<ScoredArticle>& rows) {
    core::Status valid = check_links(rows);
    if (!valid) return valid.error_info();
    if (rows.empty()) return size_t{0};

    std::vector<std::string> links;
    links.reserve(rows.size());
    for (const auto& row : rows) links.push_back(row.article.link);
    auto found = documents_.existing_ids(kCollection, links);
    if (!found) return found.error_info();

    std::set<std::string> seen(found.value().begin(), found.value().end());
    std::vector<store::WriteOp> inserts;
    for (const auto& row : rows) {
        if (!seen.insert(row.article.link).second) continue;
        store::Json fields = article_fields(row.article);
        fields["pred"] = prediction_json(row.prediction);
        inserts.push_back(store::WriteOp::merge(row.article.link, std::move(fields)));
    }
    core::Status status = writer_.write(kCollection, inserts);
    if (!status) return status.error_info();
    audit::log_info("Inserted " + std::to_string(inserts.size()) + " new articles into " + kCollection + ", skipped " +
                    std::to_string(rows.size() - inserts.size()) + " known links");
    return inserts.size();
}

core::Status NewsRepository::upsert_predictions(const std::string& version, const std::vector<ScoredArticle>& rows) {
    core::Status valid = check_links(rows);
    if (!valid) return valid;
    const std::string column = column_for(version);
    std::vector<store::WriteOp> ops;
    ops.reserve(rows.size());
    for (const auto& row : rows) {
        store::Json fields = article_fields(row.article);
        fields[column] = prediction_json(row.prediction);
        ops.push_back(store::WriteOp::merge(row.article.link, std::move(fields)));
    }
    core::Status status = writer_.write(kCollection, ops);
    if (!status) return status;
    audit::log_info("Upserted " + std::to_string(ops.size()) + " articles into " + kCollection + "." + column);
    return core::Status::ok();
}

core::Expected<size_t> NewsRepository::reset_version(const std::string& version) {
    const std::string column = column_for(version);
    store::Query query;
    query.filters.push_back(store::Filter{column, store::FilterOp::Present, nullptr});
    auto docs = documents_.scan(kCollection, query);
    if (!docs) return docs.error_info();
    std::vector<store::WriteOp> ops;
    ops.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        ops.push_back(store::WriteOp::update(doc.id, store::Json{{column, nullptr}}));
    }
    core::Status status = writer_.write(kCollection, ops);
    if (!status) return status.error_info();
    audit::log_info("Cleared " + std::to_string(ops.size()) + " values of " + kCollection + "." + column);
    return ops.size();
}

core::Expected<size_t> NewsRepository::shift_predictions(const std::string& from_version,
                                                         const std::string& to_version) {
    const std::string from = column_for(from_version);
    const std::string to = column_for(to_version);
    store::Query query;
    query.filters.push_back(store::Filter{from, store::FilterOp::Present, nullptr});
    auto docs = documents_.scan(kCollection, query);
    if (!docs) return docs.error_info();
    std::vector<store::WriteOp> ops;
    ops.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        ops.push_back(store::WriteOp::update(doc.id, store::Json{{to, doc.body.at(from)}, {from, nullptr}}));
    }
    core::Status status = writer_.write(kCollection, ops);
    if (!status) return status.error_info();
    audit::log_info("Shifted " + std::to_string(ops.size()) + " predictions " + kCollection + "." + from + " -> " + to);
    return ops.size();
}

core::Expected<std::optional<int64_t>> NewsRepository::last_published() {
    store::Query query;
    query.filters.push_back(store::Filter{kPublishedMs, store::FilterOp::Present, nullptr});
    query.order_by = kPublishedMs;
    query.descending = true;
    query.limit = 1;
    auto docs = documents_.scan(kCollection, query);
    if (!docs) return docs.error_info();
    if (docs.value().empty()) return std::optional<int64_t>();
    return std::optional<int64_t>(docs.value().front().body.at(kPublishedMs).get<int64_t>());
}

} // namespace candlecast::persist
