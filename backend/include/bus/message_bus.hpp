#pragma once

#include "core/errors.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace candlecast::bus {

enum class BackpressurePolicy {
    DropNewest = 0,
    DropOldest = 1,
    Block = 2
};

struct InprocBusConfig {
    size_t queue_capacity = 4096;
    BackpressurePolicy policy = BackpressurePolicy::DropNewest;
    uint32_t block_timeout_ms = 0; // 0 = wait indefinitely
    uint32_t consumer_threads = 1;
};

struct PgStreamBusConfig {
    std::string consumer_group;
    std::chrono::milliseconds poll_interval{1000};
    size_t fetch_limit = 100;
    // Publisher side: every trim_every publishes to a topic (0 = never), rows read by
    // every consumer group of the topic or older than retention are deleted.
    uint32_t trim_every = 100;
    std::chrono::seconds retention{std::chrono::hours(24 * 7)};
};

struct TopicMetrics {
    uint64_t queue_depth = 0;
    uint64_t drops = 0;
    uint64_t backpressure_hits = 0;
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t publish_latency_ns_avg = 0;
    uint64_t publish_latency_ns_max = 0;
};

using MessageHandler = std::function<void(const void* data, size_t size)>;

/**
 * @class MessageBus
 * @brief Topic-based binary messaging between pipeline stages.
 */
class MessageBus {
public:
    virtual ~MessageBus() = default;

    /**
     * @brief Initialize the bus connection.
     * @param endpoint Backend address ("inproc://jobs" or a PostgreSQL DSN).
     * @param is_publisher True if this node will write data.
     */
    virtual CandlecastStatus connect(const std::string& endpoint, bool is_publisher) = 0;

    /**
     * @brief Publish a binary message to a topic.
     * @return CANDLECAST_ERR_TIMEOUT on backpressure drop, CANDLECAST_ERR_IO on backend failure.
     */
    virtual CandlecastStatus publish(const std::string& topic, const void* data, size_t size) = 0;

    /**
     * @brief Subscribe to a topic. Handlers run on bus-owned threads.
     */
    virtual void subscribe(const std::string& topic, MessageHandler callback) = 0;

    /**
     * @brief Stop delivery threads; queued messages still pending are dropped.
     */
    virtual void shutdown() = 0;

    /**
     * @brief Read metrics for a topic.
     * @return true if topic exists.
     */
    virtual bool get_metrics(const std::string& topic, TopicMetrics* out) const = 0;
};

/**
 * @brief Create an in-process MessageBus (thread-safe, single-process).
 * With consumer_threads > 1 it doubles as a worker pool.
 */
std::shared_ptr<MessageBus> create_inproc_bus(const InprocBusConfig& config);
std::shared_ptr<MessageBus> create_inproc_bus();

/**
 * @brief Create a cross-process stream bus backed by PostgreSQL tables.
 * Each topic is an append-only table; subscribers resume from the last
 * offset committed for their consumer group, or from the earliest message.
 */
std::shared_ptr<MessageBus> create_pg_stream_bus(const PgStreamBusConfig& config);

// Backing table of a stream topic ("BTCUSDT" -> "stream_btcusdt").
std::string stream_table_name(const std::string& topic);

} // namespace candlecast::bus
