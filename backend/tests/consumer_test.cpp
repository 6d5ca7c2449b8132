#include "codec/candle_batch_codec.hpp"
#include "control/file_control_plane.hpp"
#include "control/store_control_plane.hpp"
#include "persist/candle_repository.hpp"
#include "persist/ledger_file.hpp"
#include "pipeline/consumer.hpp"
#include "store/memory_document_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

using namespace candlecast;
using core::ControlState;
using pipeline::StartupOutcome;

constexpr int64_t kBase = 1700000040000LL;

core::PriceCandle candle_at(int64_t minute) {
    const double close = 37000.0 + static_cast<double>(minute % 7);
    return core::PriceCandle{kBase + minute * 60000LL, close - 1.0, close + 2.0, close - 2.0, close, 1.5};
}

core::CandleBatch batch_of(int64_t first, int64_t count) {
    core::CandleBatch batch;
    batch.symbol = "BTCUSDT";
    for (int64_t m = first; m < first + count; ++m) batch.candles.push_back(candle_at(m));
    return batch;
}

class FakeInference final : public inference::InferenceProvider {
public:
    core::Expected<bool> is_model_available(const std::string&, const std::string&) override { return available; }

    core::Expected<std::vector<inference::Prediction>> predict(const std::string& model, const std::string& version,
                                                               const std::vector<inference::FeatureVector>& rows) override {
        ++calls;
        assert(model == "lightgbm" && version == "v1");
        if (fail || (fail_on_call != 0 && calls == fail_on_call)) {
            return core::make_error(core::ErrorCode::Io, "model server down");
        }
        std::vector<inference::Prediction> out;
        for (const auto& row : rows) {
            assert(row.size() == 30 * 5);
            out.push_back({0.2, 0.3, 0.5});
        }
        scored_rows += rows.size();
        return out;
    }

    bool available = true;
    bool fail = false;
    int fail_on_call = 0;
    int calls = 0;
    size_t scored_rows = 0;
};

class CapturingBus final : public bus::MessageBus {
public:
    CandlecastStatus connect(const std::string&, bool) override { return CANDLECAST_OK; }
    CandlecastStatus publish(const std::string&, const void*, size_t) override { return CANDLECAST_OK; }
    void subscribe(const std::string& topic, bus::MessageHandler callback) override {
        subscribed_topic = topic;
        handler = std::move(callback);
    }
    void shutdown() override { shut_down = true; }
    bool get_metrics(const std::string&, bus::TopicMetrics*) const override { return false; }

    std::string subscribed_topic;
    bus::MessageHandler handler;
    bool shut_down = false;
};

struct Fixture {
    explicit Fixture(const std::filesystem::path& data)
        : control(control_docs), repository(documents, quiet_repository()) {
        options.entity = core::EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
        options.seq_len = 30;
        options.data_path = data.string();
        options.sleeper = [](std::chrono::milliseconds) {};
        options.exit_process = [this](int code) { exit_code = code; };
        // Whoever launched the consumer answers WAIT with START.
        control.set_sleeper([this](std::chrono::milliseconds) {
            if (control.current(options.entity) == ControlState::Wait) {
                assert(control.write(options.entity, answer).is_ok());
            }
        });
    }

    static persist::CandleRepositoryOptions quiet_repository() {
        persist::CandleRepositoryOptions repo;
        repo.writer.sleeper = [](std::chrono::milliseconds) {};
        return repo;
    }

    store::MemoryDocumentStore documents;
    store::MemoryDocumentStore control_docs;
    control::StoreControlPlane control;
    persist::CandleRepository repository;
    FakeInference inference;
    pipeline::ConsumerOptions options;
    ControlState answer = ControlState::Start;
    std::atomic<int> exit_code{-1};
};

void streaming(const std::filesystem::path& data) {
    Fixture f(data / "streaming");
    pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);

    assert(consumer.startup() == StartupOutcome::Ready);
    assert(f.control.current(f.options.entity) == ControlState::Running);
    auto reconciled = consumer.reconcile();
    assert(reconciled && reconciled.value() == 0);

    // 29 candles are not enough history.
    assert(consumer.handle_batch(batch_of(0, 29)).is_ok());
    assert(f.inference.calls == 0);
    assert(consumer.buffered() == 29);
    assert(!consumer.cursor());

    assert(consumer.handle_batch(batch_of(29, 1)).is_ok());
    assert(f.inference.calls == 1);
    assert(consumer.cursor() && *consumer.cursor() == candle_at(29).open_time_ms);
    auto doc = f.documents.get("btcusdt", persist::CandleRepository::document_id(candle_at(29).open_time_ms));
    assert(doc && doc.value());
    assert(doc.value()->at("lightgbm_1").size() == 3);
    assert(doc.value()->at("lightgbm_1")[1] == 0.3);

    // A redelivered batch is ignored.
    assert(consumer.handle_batch(batch_of(29, 1)).is_ok());
    assert(consumer.handle_batch(batch_of(0, 30)).is_ok());
    assert(f.inference.calls == 1);

    assert(consumer.handle_batch(batch_of(30, 1)).is_ok());
    assert(f.inference.calls == 2);
    assert(consumer.buffered() == 30);

    // PAUSE drops batches until START.
    assert(f.control.write(f.options.entity, ControlState::Pause).is_ok());
    assert(consumer.handle_batch(batch_of(31, 1)).is_ok());
    assert(f.inference.calls == 2);
    assert(f.control.write(f.options.entity, ControlState::Start).is_ok());
    assert(consumer.handle_batch(batch_of(31, 1)).is_ok());
    assert(f.inference.calls == 3);
    assert(f.control.current(f.options.entity) == ControlState::Running);

    // A failed prediction leaves the cursor so the candle is scored on redelivery.
    f.inference.fail = true;
    assert(!consumer.handle_batch(batch_of(32, 1)).is_ok());
    assert(*consumer.cursor() == candle_at(31).open_time_ms);
    f.inference.fail = false;
    assert(consumer.handle_batch(batch_of(32, 1)).is_ok());
    assert(*consumer.cursor() == candle_at(32).open_time_ms);

    const uint8_t garbage[3] = {1, 2, 3};
    consumer.on_message(garbage, sizeof(garbage));
    std::vector<uint8_t> frame;
    assert(codec::encode_candle_batch(batch_of(33, 1), &frame) == CANDLECAST_OK);
    consumer.on_message(frame.data(), frame.size());
    assert(*consumer.cursor() == candle_at(33).open_time_ms);

    persist::LedgerFile ledger(persist::prediction_ledger_path(f.options.data_path, "BTCUSDT", "lightgbm", "v1"));
    auto rows = ledger.load_predictions();
    assert(rows && rows.value().size() == 5);
    assert(rows.value().back().values.size() == 3);
    assert(f.documents.document_count("btcusdt") == 5);
}

void startup_outcomes(const std::filesystem::path& data) {
    {
        Fixture f(data / "unavailable");
        f.inference.available = false;
        pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);
        assert(consumer.startup() == StartupOutcome::Failed);
        auto record = f.control.load(f.options.entity);
        assert(record && record.value());
        assert(record.value()->state == ControlState::Error);
        assert(record.value()->error_message == "Model not available");
    }
    {
        Fixture f(data / "deleted");
        f.answer = ControlState::Delete;
        pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);
        assert(consumer.startup() == StartupOutcome::Deleted);
        assert(f.control.current(f.options.entity) == ControlState::Deleted);
    }
    {
        Fixture f(data / "cancelled");
        f.answer = ControlState::Wait;
        std::atomic<bool> cancel{true};
        pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);
        assert(consumer.startup(&cancel) == StartupOutcome::Deleted);
        assert(f.control.current(f.options.entity) == ControlState::Deleted);
    }
}

void pending_commands_survive_launch(const std::filesystem::path& data) {
    const core::EntityKey entity = core::EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
    {
        // Orchestrator posts START, the dispatcher resets the entity, then the process boots.
        Fixture f(data / "pending_start");
        control::FileControlPlane plane(data / "pending_start_state");
        int pauses = 0;
        plane.set_sleeper([&](std::chrono::milliseconds) { ++pauses; });
        assert(plane.write(entity, ControlState::Start).is_ok());
        assert(plane.reset_for_launch(entity).is_ok());
        assert(plane.current(entity) == ControlState::Start);

        std::atomic<bool> cancel{false};
        pipeline::Consumer consumer(f.options, plane, f.inference, f.repository);
        assert(consumer.startup(&cancel) == StartupOutcome::Ready);
        assert(pauses == 0);
        assert(plane.current(entity) == ControlState::Running);
    }
    {
        Fixture f(data / "pending_delete");
        control::FileControlPlane plane(data / "pending_delete_state");
        int pauses = 0;
        plane.set_sleeper([&](std::chrono::milliseconds) { ++pauses; });
        assert(plane.write(entity, ControlState::Delete).is_ok());

        pipeline::Consumer consumer(f.options, plane, f.inference, f.repository);
        assert(consumer.startup() == StartupOutcome::Deleted);
        assert(pauses == 0);
        assert(plane.current(entity) == ControlState::Deleted);
    }
}

void reconciliation(const std::filesystem::path& data) {
    Fixture f(data / "reconcile");
    f.options.reconcile_chunk = 4;
    f.inference.fail_on_call = 2;

    std::vector<core::PriceCandle> history = batch_of(0, 40).candles;
    assert(f.repository.bulk_insert("BTCUSDT", history).is_ok());
    persist::LedgerFile prices(persist::candle_ledger_path(f.options.data_path, "BTCUSDT"));
    assert(prices.append_candles(history).is_ok());
    const std::vector<persist::ScoredCandle> existing{{candle_at(35), {0.9, 0.05, 0.05}}};
    assert(f.repository.upsert_predictions("BTCUSDT", "lightgbm", "v1", existing).is_ok());

    pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);
    // Minutes 29..39 have full history, minute 35 is already scored: 10 rows in chunks of 4,
    // and the second chunk fails.
    auto reconciled = consumer.reconcile();
    assert(reconciled && reconciled.value() == 6);
    assert(f.inference.calls == 3);

    auto missing = f.repository.missing_prediction_times("BTCUSDT", "lightgbm", "v1");
    assert(missing && missing.value().size() == 29 + 4);
    auto kept = f.documents.get("btcusdt", persist::CandleRepository::document_id(candle_at(35).open_time_ms));
    assert(kept.value()->at("lightgbm_1")[0] == 0.9);
}

void monitor_handles_pause_and_delete(const std::filesystem::path& data) {
    Fixture f(data / "monitor");
    f.options.monitor_poll = std::chrono::milliseconds(5);
    pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);
    assert(f.control.write(f.options.entity, ControlState::Running).is_ok());
    consumer.start_monitor();

    assert(f.control.write(f.options.entity, ControlState::Pause).is_ok());
    for (int i = 0; i < 400 && f.control.current(f.options.entity) != ControlState::Paused; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(f.control.current(f.options.entity) == ControlState::Paused);

    assert(f.control.write(f.options.entity, ControlState::Delete).is_ok());
    for (int i = 0; i < 400 && !consumer.stopped(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(consumer.stopped());
    consumer.stop_monitor();
    assert(f.exit_code.load() == 0);
    assert(f.control.current(f.options.entity) == ControlState::Deleted);
}

void run_until_stopped(const std::filesystem::path& data) {
    Fixture f(data / "run");
    CapturingBus bus;
    std::atomic<bool> stop{false};
    std::vector<uint8_t> frame;
    assert(codec::encode_candle_batch(batch_of(0, 30), &frame) == CANDLECAST_OK);
    f.options.sleeper = [&](std::chrono::milliseconds) {
        assert(bus.handler);
        bus.handler(frame.data(), frame.size());
        stop.store(true);
    };
    pipeline::Consumer consumer(f.options, f.control, f.inference, f.repository);

    assert(consumer.run(bus, stop) == 0);
    assert(bus.subscribed_topic == "BTCUSDT");
    assert(bus.shut_down);
    assert(consumer.cursor() && *consumer.cursor() == candle_at(29).open_time_ms);
    assert(f.control.current(f.options.entity) == ControlState::Deleted);
}

} // namespace

int main() {
    const std::filesystem::path data =
        std::filesystem::temp_directory_path() / ("candlecast_consumer_" + std::to_string(::getpid()));
    std::filesystem::remove_all(data);

    streaming(data);
    startup_outcomes(data);
    pending_commands_survive_launch(data);
    reconciliation(data);
    monitor_handles_pause_and_delete(data);
    run_until_stopped(data);

    std::filesystem::remove_all(data);
    return 0;
}
