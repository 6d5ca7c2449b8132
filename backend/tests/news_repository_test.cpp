#include "persist/news_repository.hpp"
#include "store/memory_document_store.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace {

using namespace candlecast;

constexpr int64_t kDay = 1700000040000LL;
constexpr const char* kLink = "https://news.example/btc-etf";

persist::ScoredArticle article(const std::string& link, int64_t published_ms, double positive) {
    persist::NewsArticle a;
    a.link = link;
    a.title = "Headline for " + link;
    a.published_ms = published_ms;
    return persist::ScoredArticle{a, {1.0 - positive, positive}};
}

store::BatchWriterOptions quiet() {
    store::BatchWriterOptions options;
    options.sleeper = [](std::chrono::milliseconds) {};
    return options;
}

void insert_is_keyed_by_link() {
    store::MemoryDocumentStore documents(500);
    persist::NewsRepository news(documents, quiet());

    auto first = news.insert_if_absent({article(kLink, kDay, 0.7), article("https://news.example/eth", kDay + 1, 0.4)});
    assert(first && first.value() == 2);
    assert(documents.document_count("trl") == 2);

    // Known links are skipped, including repeats inside one batch; stored rows keep their values.
    auto second = news.insert_if_absent({article(kLink, kDay, 0.1), article("https://news.example/sol", kDay + 2, 0.9),
                                         article("https://news.example/sol", kDay + 2, 0.2)});
    assert(second && second.value() == 1);
    assert(documents.document_count("trl") == 3);

    auto stored = documents.get("trl", kLink);
    assert(stored && stored.value());
    assert(stored.value()->at("pred")[1] == 0.7);
    assert(stored.value()->at("title") == std::string("Headline for ") + kLink);
    assert(stored.value()->at("label").is_null());
    assert(stored.value()->at("price_change").is_null());
    auto sol = documents.get("trl", "https://news.example/sol");
    assert(sol.value()->at("pred")[1] == 0.9);

    auto latest = news.last_published();
    assert(latest && latest.value() && *latest.value() == kDay + 2);

    auto invalid = news.insert_if_absent({article("", kDay, 0.5)});
    assert(!invalid && invalid.error() == core::ErrorCode::Invalid);
}

void version_columns_rotate() {
    store::MemoryDocumentStore documents(2);
    persist::NewsRepository news(documents, quiet());

    std::vector<persist::ScoredArticle> rows{article(kLink, kDay, 0.8), article("https://news.example/a", kDay, 0.6),
                                             article("https://news.example/b", kDay, 0.3)};
    rows[0].article.label = 1;
    rows[0].article.price_change = 0.025;
    assert(news.upsert_predictions("v3", rows).is_ok());
    auto labelled = documents.get("trl", kLink);
    assert(labelled.value()->at("label") == 1);
    assert(labelled.value()->at("price_change") == 0.025);

    assert(news.upsert_predictions("v2", {article(kLink, kDay, 0.1), article("https://news.example/old", kDay, 0.2)})
               .is_ok());
    assert(documents.document_count("trl") == 4);
    auto both = documents.get("trl", kLink);
    assert(both.value()->at("trl_3")[1] == 0.8);
    assert(both.value()->at("trl_2")[1] == 0.1);

    // Clear the previous slot, then move the latest into it.
    auto cleared = news.reset_version("v2");
    assert(cleared && cleared.value() == 2);
    auto moved = news.shift_predictions("v3", "v2");
    assert(moved && moved.value() == 3);

    auto old = documents.get("trl", "https://news.example/old");
    assert(old.value()->at("trl_2").is_null());
    auto shifted = documents.get("trl", kLink);
    assert(shifted.value()->at("trl_2")[1] == 0.8);
    assert(shifted.value()->at("trl_3").is_null());

    auto nothing_left = news.shift_predictions("v3", "v2");
    assert(nothing_left && nothing_left.value() == 0);
}

} // namespace

int main() {
    insert_is_keyed_by_link();
    version_columns_rotate();
    return 0;
}
