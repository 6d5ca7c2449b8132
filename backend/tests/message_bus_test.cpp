#include "bus/message_bus.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <thread>

int main() {
    using namespace candlecast;

    bus::InprocBusConfig config;
    config.queue_capacity = 2;
    config.policy = bus::BackpressurePolicy::DropNewest;
    config.consumer_threads = 0; // keep messages queued for test determinism

    auto queued = bus::create_inproc_bus(config);
    queued->connect("inproc://test", true);

    const char payload[4] = {'t', 'e', 's', 't'};
    assert(queued->publish("BTCUSDT", payload, sizeof(payload)) == CANDLECAST_OK);
    assert(queued->publish("BTCUSDT", payload, sizeof(payload)) == CANDLECAST_OK);
    assert(queued->publish("BTCUSDT", payload, sizeof(payload)) == CANDLECAST_ERR_TIMEOUT);
    assert(queued->publish("BTCUSDT", nullptr, 0) == CANDLECAST_ERR_INVALID);

    bus::TopicMetrics metrics{};
    assert(queued->get_metrics("BTCUSDT", &metrics));
    assert(metrics.queue_depth == 2);
    assert(metrics.drops == 1);
    assert(!queued->get_metrics("ETHUSDT", &metrics));
    queued->shutdown();
    assert(queued->publish("BTCUSDT", payload, sizeof(payload)) == CANDLECAST_ERR_INVALID);

    // Worker pool: every message reaches the handler exactly once.
    bus::InprocBusConfig pool_config;
    pool_config.queue_capacity = 16;
    pool_config.policy = bus::BackpressurePolicy::Block;
    pool_config.consumer_threads = 3;
    auto pool = bus::create_inproc_bus(pool_config);
    pool->connect("inproc://jobs", true);

    std::atomic<int> handled{0};
    std::atomic<int> bytes{0};
    pool->subscribe("jobs", [&](const void* data, size_t size) {
        assert(std::memcmp(data, payload, size) == 0);
        bytes.fetch_add(static_cast<int>(size));
        handled.fetch_add(1);
    });
    for (int i = 0; i < 50; ++i) {
        assert(pool->publish("jobs", payload, sizeof(payload)) == CANDLECAST_OK);
    }
    for (int i = 0; i < 500 && handled.load() < 50; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    assert(handled.load() == 50);
    assert(bytes.load() == 200);
    assert(pool->get_metrics("jobs", &metrics));
    assert(metrics.published == 50);
    pool->shutdown();

    return 0;
}
