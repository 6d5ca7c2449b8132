#include "bus/message_bus.hpp"

#include "core/time_utils.hpp"

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace candlecast::bus {

namespace {

struct TopicCounters {
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> drops{0};
    std::atomic<uint64_t> backpressure_hits{0};
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> publish_latency_ns_total{0};
    std::atomic<uint64_t> publish_latency_ns_max{0};
};

struct Topic {
    std::mutex mutex;
    std::condition_variable cv_data;
    std::condition_variable cv_space;
    std::deque<std::vector<uint8_t>> queue;
    std::vector<MessageHandler> handlers;
    std::vector<std::thread> workers;
    TopicCounters counters;
    bool open = true;
};

class InprocMessageBus final : public MessageBus {
public:
    explicit InprocMessageBus(InprocBusConfig config)
        : config_(config) {
        if (config_.queue_capacity == 0) config_.queue_capacity = 1;
    }

    ~InprocMessageBus() override {
        shutdown();
    }

    CandlecastStatus connect(const std::string& endpoint, bool is_publisher) override {
        endpoint_ = endpoint;
        is_publisher_ = is_publisher;
        return CANDLECAST_OK;
    }

    CandlecastStatus publish(const std::string& topic_name, const void* data, size_t size) override {
        if (!data || size == 0) return CANDLECAST_ERR_INVALID;

        const uint64_t start_ns = core::now_ns();
        Topic* topic = find_or_create(topic_name);
        if (!topic) return CANDLECAST_ERR_NOMEM;

        std::unique_lock<std::mutex> lock(topic->mutex);
        if (!topic->open) return CANDLECAST_ERR_INVALID;

        CandlecastStatus admitted = make_room(topic, lock);
        if (admitted != CANDLECAST_OK) {
            record_latency(topic, start_ns);
            return admitted;
        }

        std::vector<uint8_t> message(size);
        std::memcpy(message.data(), data, size);
        topic->queue.push_back(std::move(message));
        topic->counters.queue_depth.fetch_add(1, std::memory_order_relaxed);
        topic->counters.published.fetch_add(1, std::memory_order_relaxed);
        topic->cv_data.notify_one();
        record_latency(topic, start_ns);
        return CANDLECAST_OK;
    }

    void subscribe(const std::string& topic_name, MessageHandler callback) override {
        Topic* topic = find_or_create(topic_name);
        if (!topic) return;
        std::lock_guard<std::mutex> lock(topic->mutex);
        topic->handlers.push_back(std::move(callback));
        if (topic->open && topic->workers.empty()) {
            for (uint32_t i = 0; i < config_.consumer_threads; ++i) {
                topic->workers.emplace_back([this, topic] { drain(topic); });
            }
        }
    }

    void shutdown() override {
        std::vector<Topic*> topics;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (auto& entry : topics_) topics.push_back(entry.second.get());
        }
        for (Topic* topic : topics) {
            std::vector<std::thread> workers;
            {
                std::lock_guard<std::mutex> tlock(topic->mutex);
                topic->open = false;
                topic->cv_data.notify_all();
                topic->cv_space.notify_all();
                workers.swap(topic->workers);
            }
            for (auto& worker : workers) {
                if (worker.joinable()) worker.join();
            }
        }
    }

    bool get_metrics(const std::string& topic_name, TopicMetrics* out) const override {
        if (!out) return false;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = topics_.find(topic_name);
        if (it == topics_.end()) return false;
        const TopicCounters& c = it->second->counters;
        const uint64_t published = c.published.load(std::memory_order_relaxed);
        out->queue_depth = c.queue_depth.load(std::memory_order_relaxed);
        out->drops = c.drops.load(std::memory_order_relaxed);
        out->backpressure_hits = c.backpressure_hits.load(std::memory_order_relaxed);
        out->published = published;
        out->delivered = c.delivered.load(std::memory_order_relaxed);
        out->publish_latency_ns_avg = published == 0 ? 0 : c.publish_latency_ns_total.load(std::memory_order_relaxed) / published;
        out->publish_latency_ns_max = c.publish_latency_ns_max.load(std::memory_order_relaxed);
        return true;
    }

private:
    Topic* find_or_create(const std::string& name) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = topics_.find(name);
            if (it != topics_.end()) return it->second.get();
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = topics_[name];
        if (!slot) slot = std::make_unique<Topic>();
        return slot.get();
    }

    // Applies the backpressure policy when the queue is full. Called with topic->mutex held.
    CandlecastStatus make_room(Topic* topic, std::unique_lock<std::mutex>& lock) {
        if (topic->queue.size() < config_.queue_capacity) return CANDLECAST_OK;
        topic->counters.backpressure_hits.fetch_add(1, std::memory_order_relaxed);

        switch (config_.policy) {
            case BackpressurePolicy::DropNewest:
                topic->counters.drops.fetch_add(1, std::memory_order_relaxed);
                return CANDLECAST_ERR_TIMEOUT;
            case BackpressurePolicy::DropOldest:
                topic->queue.pop_front();
                topic->counters.drops.fetch_add(1, std::memory_order_relaxed);
                topic->counters.queue_depth.fetch_sub(1, std::memory_order_relaxed);
                return CANDLECAST_OK;
            case BackpressurePolicy::Block: {
                if (config_.consumer_threads == 0) {
                    topic->counters.drops.fetch_add(1, std::memory_order_relaxed);
                    return CANDLECAST_ERR_TIMEOUT;
                }
                auto has_room = [&] { return !topic->open || topic->queue.size() < config_.queue_capacity; };
                if (config_.block_timeout_ms == 0) {
                    topic->cv_space.wait(lock, has_room);
                } else {
                    topic->cv_space.wait_for(lock, std::chrono::milliseconds(config_.block_timeout_ms), has_room);
                }
                if (!topic->open || topic->queue.size() >= config_.queue_capacity) {
                    return CANDLECAST_ERR_TIMEOUT;
                }
                return CANDLECAST_OK;
            }
        }
        return CANDLECAST_ERR_INVALID;
    }

    void drain(Topic* topic) {
        for (;;) {
            std::vector<uint8_t> message;
            std::vector<MessageHandler> handlers;
            {
                std::unique_lock<std::mutex> lock(topic->mutex);
                topic->cv_data.wait(lock, [&] { return !topic->open || !topic->queue.empty(); });
                if (!topic->open) break;
                message = std::move(topic->queue.front());
                topic->queue.pop_front();
                topic->counters.queue_depth.fetch_sub(1, std::memory_order_relaxed);
                topic->cv_space.notify_one();
                handlers = topic->handlers;
            }
            for (auto& handler : handlers) {
                handler(message.data(), message.size());
            }
            topic->counters.delivered.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void record_latency(Topic* topic, uint64_t start_ns) {
        const uint64_t elapsed = core::now_ns() - start_ns;
        topic->counters.publish_latency_ns_total.fetch_add(elapsed, std::memory_order_relaxed);
        uint64_t prev = topic->counters.publish_latency_ns_max.load(std::memory_order_relaxed);
        while (elapsed > prev &&
               !topic->counters.publish_latency_ns_max.compare_exchange_weak(prev, elapsed, std::memory_order_relaxed)) {
        }
    }

    std::string endpoint_;
    bool is_publisher_ = false;
    InprocBusConfig config_;
    std::unordered_map<std::string, std::unique_ptr<Topic>> topics_;
    mutable std::shared_mutex mutex_;
};

} // namespace

std::shared_ptr<MessageBus> create_inproc_bus(const InprocBusConfig& config) {
    return std::make_shared<InprocMessageBus>(config);
}

std::shared_ptr<MessageBus> create_inproc_bus() {
    return std::make_shared<InprocMessageBus>(InprocBusConfig{});
}

} // namespace candlecast::bus
