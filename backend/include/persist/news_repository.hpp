#pragma once

#include "core/error.hpp"
#include "inference/inference_provider.hpp"
#include "store/batch_writer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace candlecast::persist {

struct NewsArticle {
    std::string link;
    std::string title;
    std::optional<int64_t> published_ms;
    std::optional<double> price_change;
    std::optional<int> label;
};

struct ScoredArticle {
    NewsArticle article;
    inference::Prediction prediction;
};

/**
 * @class NewsRepository
 * @brief The `trl` collection: news articles keyed by their link, with one
 * `trl_{n}` sentiment column per tracked model version.
 */
class NewsRepository {
public:
    static constexpr const char* kCollection = "trl";

    explicit NewsRepository(store::DocumentStore& documents, store::BatchWriterOptions writer = {});

    static std::string column_for(const std::string& version);
    static store::Json article_fields(const NewsArticle& article);

    // Inserts articles whose link is not stored yet; the prediction goes to `pred`.
    core::Expected<size_t> insert_if_absent(const std::vector<ScoredArticle>& rows);

    // Merge-writes the article fields and the version's column, creating missing documents.
    core::Status upsert_predictions(const std::string& version, const std::vector<ScoredArticle>& rows);

    // Nulls the version's column on every document that has it.
    core::Expected<size_t> reset_version(const std::string& version);

    core::Expected<size_t> shift_predictions(const std::string& from_version, const std::string& to_version);

    core::Expected<std::optional<int64_t>> last_published();

private:
    store::DocumentStore& documents_;
    store::BatchWriter writer_;
};

} // namespace candlecast::persist
