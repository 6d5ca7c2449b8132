#include "codec/candle_batch_codec.hpp"
#include "control/store_control_plane.hpp"
#include "persist/candle_repository.hpp"
#include "persist/ledger_file.hpp"
#include "pipeline/producer.hpp"
#include "store/memory_document_store.hpp"

#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

using namespace candlecast;
using core::ControlState;
using pipeline::CycleOutcome;

constexpr int64_t kBase = 1700000040000LL;
constexpr int64_t kNow = kBase + 30 * 60000LL;

core::PriceCandle candle_at(int64_t minute) {
    const double close = 100.0 + static_cast<double>(minute);
    return core::PriceCandle{kBase + minute * 60000LL, close - 0.5, close + 1.0, close - 1.0, close, 3.0};
}

class FakeSource final : public marketdata::MarketDataSource {
public:
    core::Expected<std::vector<core::PriceCandle>> fetch_since(const std::string& symbol, int64_t after_ms) override {
        last_symbol = symbol;
        last_after = after_ms;
        if (fail) return core::make_error(core::ErrorCode::Io, "exchange unreachable");
        std::vector<core::PriceCandle> out;
        for (const auto& candle : candles) {
            if (candle.open_time_ms > after_ms) out.push_back(candle);
        }
        return out;
    }

    std::vector<core::PriceCandle> candles;
    std::string last_symbol;
    int64_t last_after = 0;
    bool fail = false;
};

class RecordingBus final : public bus::MessageBus {
public:
    CandlecastStatus connect(const std::string&, bool) override { return CANDLECAST_OK; }
    CandlecastStatus publish(const std::string& topic, const void* data, size_t size) override {
        if (fail) return CANDLECAST_ERR_IO;
        const auto* bytes = static_cast<const uint8_t*>(data);
        topics.push_back(topic);
        frames.emplace_back(bytes, bytes + size);
        return CANDLECAST_OK;
    }
    void subscribe(const std::string&, bus::MessageHandler) override {}
    void shutdown() override {}
    bool get_metrics(const std::string&, bus::TopicMetrics*) const override { return false; }

    std::vector<std::string> topics;
    std::vector<std::vector<uint8_t>> frames;
    bool fail = false;
};

core::CandleBatch decode(const std::vector<uint8_t>& frame) {
    core::CandleBatch batch;
    assert(codec::decode_candle_batch(frame.data(), frame.size(), &batch) == CANDLECAST_OK);
    return batch;
}

persist::CandleRepositoryOptions quiet_repository() {
    persist::CandleRepositoryOptions options;
    options.writer.sleeper = [](std::chrono::milliseconds) {};
    return options;
}

pipeline::ProducerOptions test_options(std::vector<std::chrono::milliseconds>* sleeps) {
    pipeline::ProducerOptions options;
    options.symbol = "btcusdt";
    options.publish_chunk = 2;
    options.clock = [] { return kNow; };
    options.sleeper = [sleeps](std::chrono::milliseconds delay) { sleeps->push_back(delay); };
    return options;
}

void cycles_publish_and_respect_control(const std::filesystem::path& dir) {
    store::MemoryDocumentStore documents;
    store::MemoryDocumentStore control_docs;
    control::StoreControlPlane control(control_docs);
    persist::CandleRepository repository(documents, quiet_repository());
    persist::LedgerFile ledger(persist::candle_ledger_path(dir.string(), "BTCUSDT"));
    FakeSource source;
    RecordingBus bus;
    std::vector<std::chrono::milliseconds> sleeps;

    pipeline::Producer producer(test_options(&sleeps), control, source, repository, ledger, bus);
    assert(producer.topic() == "BTCUSDT");
    assert(producer.start().is_ok());
    assert(!producer.last_time());
    assert(control.current(core::EntityKey::producer()) == ControlState::Running);

    // Three valid candles and one that breaks the OHLCV invariants.
    source.candles = {candle_at(0), candle_at(1), candle_at(2)};
    core::PriceCandle broken = candle_at(3);
    broken.high = broken.low - 5.0;
    source.candles.push_back(broken);

    assert(producer.run_cycle() == CycleOutcome::Published);
    assert(source.last_symbol == "BTCUSDT");
    assert(source.last_after == kNow - core::kMillisPerDay);
    assert(producer.last_time() && *producer.last_time() == candle_at(2).open_time_ms);
    assert(documents.document_count("btcusdt") == 3);
    assert(ledger.load_candles().value().size() == 3);
    assert(bus.frames.size() == 2);
    assert(bus.topics[0] == "BTCUSDT");
    assert(decode(bus.frames[0]).candles.size() == 2);
    const core::CandleBatch tail = decode(bus.frames[1]);
    assert(tail.symbol == "BTCUSDT");
    assert(tail.candles.size() == 1);
    assert(tail.candles[0].open_time_ms == candle_at(2).open_time_ms);

    // Nothing new after last_time.
    source.candles = {candle_at(1), candle_at(2)};
    assert(producer.run_cycle() == CycleOutcome::NoData);
    assert(source.last_after == candle_at(2).open_time_ms);

    source.fail = true;
    assert(producer.run_cycle() == CycleOutcome::FetchFailed);
    source.fail = false;

    // A publish failure keeps last_time so the range is fetched again.
    source.candles = {candle_at(3), candle_at(4)};
    bus.fail = true;
    assert(producer.run_cycle() == CycleOutcome::PublishFailed);
    assert(*producer.last_time() == candle_at(2).open_time_ms);
    assert(documents.document_count("btcusdt") == 5);
    bus.fail = false;
    assert(producer.run_cycle() == CycleOutcome::Published);
    assert(*producer.last_time() == candle_at(4).open_time_ms);
    assert(bus.frames.size() == 3);
    assert(documents.document_count("btcusdt") == 5);

    // Pause is acknowledged and START resumes.
    assert(control.write(core::EntityKey::producer(), ControlState::Pause).is_ok());
    assert(producer.run_cycle() == CycleOutcome::Paused);
    assert(control.current(core::EntityKey::producer()) == ControlState::Paused);
    assert(producer.run_cycle() == CycleOutcome::Paused);
    assert(control.write(core::EntityKey::producer(), ControlState::Start).is_ok());
    assert(producer.run_cycle() == CycleOutcome::NoData);
    assert(control.current(core::EntityKey::producer()) == ControlState::Running);

    // DELETE ends run() with DELETED.
    assert(control.write(core::EntityKey::producer(), ControlState::Delete).is_ok());
    assert(producer.run() == 0);
    assert(control.current(core::EntityKey::producer()) == ControlState::Deleted);
}

void start_recovers_from_ledger(const std::filesystem::path& dir) {
    persist::LedgerFile ledger(persist::candle_ledger_path(dir.string(), "ETHUSDT"));
    assert(ledger.append_candles({candle_at(0), candle_at(1), candle_at(2), candle_at(3)}).is_ok());

    store::MemoryDocumentStore documents;
    store::MemoryDocumentStore control_docs;
    control::StoreControlPlane control(control_docs);
    persist::CandleRepository repository(documents, quiet_repository());
    FakeSource source;
    RecordingBus bus;
    std::vector<std::chrono::milliseconds> sleeps;

    pipeline::ProducerOptions options = test_options(&sleeps);
    options.symbol = "ETHUSDT";
    pipeline::Producer producer(options, control, source, repository, ledger, bus);
    assert(producer.start().is_ok());
    assert(producer.last_time() && *producer.last_time() == candle_at(3).open_time_ms);
    assert(documents.document_count("ethusdt") == 4);

    source.candles = {candle_at(2), candle_at(3)};
    assert(producer.run_cycle() == CycleOutcome::NoData);
    assert(source.last_after == candle_at(3).open_time_ms);
}

void store_failure_is_fatal(const std::filesystem::path& dir) {
    store::MemoryDocumentStore documents;
    store::MemoryDocumentStore control_docs;
    control::StoreControlPlane control(control_docs);
    persist::CandleRepository repository(documents, quiet_repository());
    persist::LedgerFile ledger(persist::candle_ledger_path(dir.string(), "SOLUSDT"));
    FakeSource source;
    RecordingBus bus;
    std::vector<std::chrono::milliseconds> sleeps;

    pipeline::ProducerOptions options = test_options(&sleeps);
    options.symbol = "SOLUSDT";
    pipeline::Producer producer(options, control, source, repository, ledger, bus);
    assert(producer.start().is_ok());

    source.candles = {candle_at(0)};
    documents.fail_next_commits(1, core::ErrorCode::Io);
    assert(producer.run() == 1);
    assert(control.current(core::EntityKey::producer()) == ControlState::Error);
    assert(control.load(core::EntityKey::producer()).value()->error_message == "store update failed");
    assert(bus.frames.empty());
    assert(!ledger.exists());
}

void stop_request_reports_deleted(const std::filesystem::path& dir) {
    store::MemoryDocumentStore documents;
    store::MemoryDocumentStore control_docs;
    control::StoreControlPlane control(control_docs);
    persist::CandleRepository repository(documents, quiet_repository());
    persist::LedgerFile ledger(persist::candle_ledger_path(dir.string(), "BNBUSDT"));
    FakeSource source;
    RecordingBus bus;

    pipeline::Producer* self = nullptr;
    int sleeps = 0;
    pipeline::ProducerOptions options;
    options.symbol = "BNBUSDT";
    options.clock = [] { return kNow + 15000; };
    options.sleeper = [&](std::chrono::milliseconds delay) {
        ++sleeps;
        assert(delay == std::chrono::milliseconds(45000));
        self->request_stop();
    };
    pipeline::Producer producer(options, control, source, repository, ledger, bus);
    self = &producer;
    assert(producer.start().is_ok());

    source.candles = {candle_at(0)};
    assert(producer.run() == 0);
    assert(sleeps == 1);
    assert(bus.frames.size() == 1);
    assert(control.current(core::EntityKey::producer()) == ControlState::Deleted);
}

} // namespace

int main() {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("candlecast_producer_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    cycles_publish_and_respect_control(dir);
    start_recovers_from_ledger(dir);
    store_failure_is_fatal(dir);
    stop_request_reports_deleted(dir);

    std::filesystem::remove_all(dir);
    return 0;
}
