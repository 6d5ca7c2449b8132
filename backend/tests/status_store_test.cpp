#include "core/time_utils.hpp"
#include "status/status_store.hpp"
#include "store/memory_document_store.hpp"

#include <cassert>
#include <chrono>
#include <string>

int main() {
    using namespace candlecast;
    using core::TrainingState;

    store::MemoryDocumentStore documents(500);
    status::StatusStoreOptions options;
    options.writer.sleeper = [](std::chrono::milliseconds) {};
    status::StatusStore store(documents, options);

    // Fresh run: 2 models x 2 coins plus the aggregate row.
    assert(store.flush().is_ok());
    assert(store.init_entries({"lightgbm", "tst"}, {"BTCUSDT", "ETHUSDT"}).is_ok());
    auto snapshot = store.get_status();
    assert(snapshot && snapshot.value().size() == 5);
    for (const auto& row : snapshot.value()) assert(row.state == TrainingState::Pending);
    assert(!status::StatusStore::all_terminal(snapshot.value()));
    assert(status::StatusStore::all_terminal({}));

    // A second run starts from a clean table.
    assert(store.set_state("lightgbm", "BTCUSDT", TrainingState::Running).is_ok());
    assert(store.flush().is_ok());
    assert(documents.document_count("batch_status") == 0);
    assert(store.init_entries({"lightgbm"}, {"BTCUSDT"}).is_ok());
    snapshot = store.get_status();
    assert(snapshot && snapshot.value().size() == 2);

    assert(store.set_state("lightgbm", "BTCUSDT", TrainingState::Failed, std::string("OOM")).is_ok());
    assert(store.set_state("lightgbm", "BTCUSDT", TrainingState::Failed).is_ok());
    snapshot = store.get_status();
    bool found = false;
    for (const auto& row : snapshot.value()) {
        if (row.id() == "lightgbm_BTCUSDT") {
            found = true;
            assert(row.state == TrainingState::Failed);
            assert(row.error_message == "OOM");
            assert(row.updated_at_ms > 0);
        }
    }
    assert(found);

    // wait_until_terminal: the aggregate row finishes on the second poll.
    int polls = 0;
    auto finished = store.wait_until_terminal(std::chrono::seconds(60), std::chrono::seconds(10),
                                              [&](std::chrono::milliseconds) {
                                                  ++polls;
                                                  core::Status done = store.set_state("trl", "ALL", TrainingState::Success);
                                                  assert(done.is_ok());
                                              });
    assert(finished && finished.value().size() == 2);
    assert(polls == 1);

    assert(store.set_state("trl", "ALL", TrainingState::Running).is_ok());
    polls = 0;
    auto timed_out = store.wait_until_terminal(std::chrono::seconds(30), std::chrono::seconds(10),
                                               [&](std::chrono::milliseconds) { ++polls; });
    assert(!timed_out && timed_out.error() == core::ErrorCode::Timeout);
    assert(polls == 4);

    // Events: newest first, old ones cleaned up.
    status::TrainingEvent old_event;
    old_event.dag_name = "train";
    old_event.task_name = "fit";
    old_event.event_type = "started";
    old_event.created_at_ms = core::unix_now_ms() - 400 * core::kMillisPerDay;
    assert(store.log_event(old_event).is_ok());
    status::TrainingEvent recent = old_event;
    recent.event_type = "finished";
    recent.status = "SUCCESS";
    recent.metadata = {{"epochs", 12}};
    recent.created_at_ms = 0;
    assert(store.log_event(recent).is_ok());

    auto events = store.get_events(10);
    assert(events && events.value().size() == 2);
    assert(events.value()[0].event_type == "finished");
    assert(events.value()[0].metadata.at("epochs") == 12);
    auto removed = store.cleanup_old_events();
    assert(removed && removed.value() == 1);
    events = store.get_events(10);
    assert(events && events.value().size() == 1);

    // Commit failures surface to the caller.
    documents.fail_next_commits(1, core::ErrorCode::Unavailable);
    assert(store.set_state("tst", "BTCUSDT", TrainingState::Running).error() == core::ErrorCode::Unavailable);

    return 0;
}
