#include "bus/message_bus.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <libpq-fe.h>

#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace candlecast::bus {

namespace {

bool command_ok(PGconn* conn, const std::string& sql) {
    PGresult* res = PQexec(conn, sql.c_str());
    const bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
    if (!ok) {
        audit::log_error("stream bus: " + std::string(PQerrorMessage(conn)));
    }
    if (res) PQclear(res);
    return ok;
}

bool ensure_schema(PGconn* conn, const std::string& table) {
    return command_ok(conn, "CREATE TABLE IF NOT EXISTS " + table +
                                " (msg_offset BIGSERIAL PRIMARY KEY, payload BYTEA NOT NULL, "
                                "published_at TIMESTAMPTZ NOT NULL DEFAULT now())") &&
           command_ok(conn, "CREATE TABLE IF NOT EXISTS stream_offsets (consumer_group TEXT NOT NULL, "
                            "topic TEXT NOT NULL, committed BIGINT NOT NULL, "
                            "PRIMARY KEY (consumer_group, topic))");
}

PGconn* open_connection(const std::string& dsn) {
    PGconn* conn = PQconnectdb(dsn.c_str());
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        audit::log_error("stream bus connection failed: " + std::string(conn ? PQerrorMessage(conn) : "out of memory"));
        if (conn) PQfinish(conn);
        return nullptr;
    }
    return conn;
}

struct Subscription {
    std::string topic;
    std::string table;
    MessageHandler handler;
    std::thread worker;
};

struct StreamCounters {
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> publish_latency_ns_total{0};
    std::atomic<uint64_t> publish_latency_ns_max{0};
};

class PgStreamBus final : public MessageBus {
public:
    explicit PgStreamBus(PgStreamBusConfig config)
        : config_(std::move(config)) {
        if (config_.fetch_limit == 0) config_.fetch_limit = 1;
    }

    ~PgStreamBus() override {
        shutdown();
        if (conn_) PQfinish(conn_);
    }

    CandlecastStatus connect(const std::string& endpoint, bool is_publisher) override {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        dsn_ = endpoint;
        is_publisher_ = is_publisher;
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        conn_ = open_connection(dsn_);
        return conn_ ? CANDLECAST_OK : CANDLECAST_ERR_UNAVAILABLE;
    }

    CandlecastStatus publish(const std::string& topic, const void* data, size_t size) override {
        if (!data || size == 0) return CANDLECAST_ERR_INVALID;
        const uint64_t start_ns = core::now_ns();
        std::lock_guard<std::mutex> lock(publish_mutex_);
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            if (conn_) PQreset(conn_);
            if (!conn_ || PQstatus(conn_) != CONNECTION_OK) return CANDLECAST_ERR_UNAVAILABLE;
            prepared_tables_.clear();
        }
        const std::string table = stream_table_name(topic);
        if (!prepared_tables_.count(table)) {
            if (!ensure_schema(conn_, table)) return CANDLECAST_ERR_IO;
            prepared_tables_.insert(table);
        }

        const std::string sql = "INSERT INTO " + table + " (payload) VALUES ($1)";
        const char* values[1] = {static_cast<const char*>(data)};
        const int lengths[1] = {static_cast<int>(size)};
        const int formats[1] = {1};
        PGresult* res = PQexecParams(conn_, sql.c_str(), 1, nullptr, values, lengths, formats, 0);
        const bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
        if (!ok) {
            audit::log_error("stream publish to " + topic + " failed: " + PQerrorMessage(conn_));
        }
        if (res) PQclear(res);
        if (!ok) return CANDLECAST_ERR_IO;

        StreamCounters& counters = counters_for(topic);
        const uint64_t published = counters.published.fetch_add(1, std::memory_order_relaxed) + 1;
        if (config_.trim_every > 0 && published % config_.trim_every == 0) trim(topic, table);
        const uint64_t elapsed = core::now_ns() - start_ns;
        counters.publish_latency_ns_total.fetch_add(elapsed, std::memory_order_relaxed);
        uint64_t prev = counters.publish_latency_ns_max.load(std::memory_order_relaxed);
        while (elapsed > prev &&
               !counters.publish_latency_ns_max.compare_exchange_weak(prev, elapsed, std::memory_order_relaxed)) {
        }
        return CANDLECAST_OK;
    }

    void subscribe(const std::string& topic, MessageHandler callback) override {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        if (stopping_) return;
        counters_for(topic);
        auto sub = std::make_unique<Subscription>();
        sub->topic = topic;
        sub->table = stream_table_name(topic);
        sub->handler = std::move(callback);
        Subscription* raw = sub.get();
        sub->worker = std::thread([this, raw] { poll_loop(raw); });
        subscriptions_.push_back(std::move(sub));
    }

    void shutdown() override {
        std::vector<std::unique_ptr<Subscription>> subs;
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            stopping_ = true;
            subs.swap(subscriptions_);
        }
        stop_cv_.notify_all();
        for (auto& sub : subs) {
            if (sub->worker.joinable()) sub->worker.join();
        }
    }

    bool get_metrics(const std::string& topic, TopicMetrics* out) const override {
        if (!out) return false;
        std::lock_guard<std::mutex> lock(counters_mutex_);
        auto it = counters_.find(topic);
        if (it == counters_.end()) return false;
        const StreamCounters& c = *it->second;
        *out = TopicMetrics{};
        out->published = c.published.load(std::memory_order_relaxed);
        out->delivered = c.delivered.load(std::memory_order_relaxed);
        out->publish_latency_ns_avg = out->published == 0 ? 0 : c.publish_latency_ns_total.load() / out->published;
        out->publish_latency_ns_max = c.publish_latency_ns_max.load(std::memory_order_relaxed);
        return true;
    }

private:
    StreamCounters& counters_for(const std::string& topic) {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        auto& slot = counters_[topic];
        if (!slot) slot = std::make_unique<StreamCounters>();
        return *slot;
    }

    // Caller holds publish_mutex_.
    void trim(const std::string& topic, const std::string& table) {
        const std::string max_age = std::to_string(config_.retention.count());
        const char* values[2] = {topic.c_str(), max_age.c_str()};
        const std::string sql = "DELETE FROM " + table +
                                " WHERE msg_offset <= (SELECT MIN(committed) FROM stream_offsets WHERE topic = $1)"
                                " OR published_at < now() - make_interval(secs => $2::double precision)";
        PGresult* res = PQexecParams(conn_, sql.c_str(), 2, nullptr, values, nullptr, nullptr, 0);
        if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
            audit::log_warn("stream trim on " + topic + " failed: " + PQerrorMessage(conn_));
        } else {
            const char* removed = PQcmdTuples(res);
            if (removed && *removed && std::string(removed) != "0") {
                audit::log_info("stream " + topic + " trimmed " + removed + " messages");
            }
        }
        if (res) PQclear(res);
    }

    bool wait_or_stop(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(subs_mutex_);
        return !stop_cv_.wait_for(lock, delay, [&] { return stopping_; });
    }

    bool stopping() {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        return stopping_;
    }

    int64_t load_committed(PGconn* conn, const std::string& topic) {
        const char* values[2] = {config_.consumer_group.c_str(), topic.c_str()};
        PGresult* res = PQexecParams(conn, "SELECT committed FROM stream_offsets WHERE consumer_group = $1 AND topic = $2",
                                     2, nullptr, values, nullptr, nullptr, 0);
        int64_t committed = 0;
        if (res && PQresultStatus(res) == PGRES_TUPLES_OK && PQntuples(res) == 1) {
            committed = std::strtoll(PQgetvalue(res, 0, 0), nullptr, 10);
        }
        if (res) PQclear(res);
        return committed;
    }

    bool commit_offset(PGconn* conn, const std::string& topic, int64_t offset) {
        const std::string text = std::to_string(offset);
        const char* values[3] = {config_.consumer_group.c_str(), topic.c_str(), text.c_str()};
        PGresult* res = PQexecParams(conn,
                                     "INSERT INTO stream_offsets (consumer_group, topic, committed) VALUES ($1, $2, $3) "
                                     "ON CONFLICT (consumer_group, topic) DO UPDATE SET committed = EXCLUDED.committed",
                                     3, nullptr, values, nullptr, nullptr, 0);
        const bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
        if (res) PQclear(res);
        return ok;
    }

    void poll_loop(Subscription* sub) {
        PGconn* conn = nullptr;
        int64_t cursor = -1;
        StreamCounters& counters = counters_for(sub->topic);

        while (!stopping()) {
            if (!conn || PQstatus(conn) != CONNECTION_OK) {
                if (conn) PQfinish(conn);
                conn = open_connection(dsn_);
                if (!conn || !ensure_schema(conn, sub->table)) {
                    if (!wait_or_stop(config_.poll_interval)) break;
                    continue;
                }
                cursor = load_committed(conn, sub->topic);
                audit::log_info("stream " + sub->topic + " resuming group " + config_.consumer_group +
                                " after offset " + std::to_string(cursor));
            }

            const std::string after = std::to_string(cursor);
            const std::string limit = std::to_string(config_.fetch_limit);
            const char* values[2] = {after.c_str(), limit.c_str()};
            const std::string sql = "SELECT msg_offset, payload FROM " + sub->table +
                                    " WHERE msg_offset > $1 ORDER BY msg_offset LIMIT $2";
            PGresult* res = PQexecParams(conn, sql.c_str(), 2, nullptr, values, nullptr, nullptr, 0);
            if (!res || PQresultStatus(res) != PGRES_TUPLES_OK) {
                audit::log_warn("stream poll on " + sub->topic + " failed: " + PQerrorMessage(conn));
                if (res) PQclear(res);
                if (!wait_or_stop(config_.poll_interval)) break;
                continue;
            }

            const int rows = PQntuples(res);
            for (int row = 0; row < rows && !stopping(); ++row) {
                const int64_t offset = std::strtoll(PQgetvalue(res, row, 0), nullptr, 10);
                size_t length = 0;
                unsigned char* bytes = PQunescapeBytea(
                    reinterpret_cast<const unsigned char*>(PQgetvalue(res, row, 1)), &length);
                if (bytes && length > 0) {
                    sub->handler(bytes, length);
                    counters.delivered.fetch_add(1, std::memory_order_relaxed);
                }
                if (bytes) PQfreemem(bytes);
                cursor = offset;
                if (!commit_offset(conn, sub->topic, cursor)) {
                    audit::log_warn("stream offset commit failed for " + sub->topic + " at " + std::to_string(cursor));
                }
            }
            PQclear(res);

            if (rows == 0 && !wait_or_stop(config_.poll_interval)) break;
        }
        if (conn) PQfinish(conn);
    }

    PgStreamBusConfig config_;
    std::string dsn_;
    bool is_publisher_ = false;

    PGconn* conn_ = nullptr;
    std::mutex publish_mutex_;
    std::set<std::string> prepared_tables_;

    std::mutex subs_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::vector<std::unique_ptr<Subscription>> subscriptions_;

    mutable std::mutex counters_mutex_;
    std::map<std::string, std::unique_ptr<StreamCounters>> counters_;
};

} // namespace

std::string stream_table_name(const std::string& topic) {
    std::string out = "stream_";
    for (char c : topic) {
        unsigned char u = static_cast<unsigned char>(c);
        out += std::isalnum(u) ? static_cast<char>(std::tolower(u)) : '_';
    }
    return out;
}

std::shared_ptr<MessageBus> create_pg_stream_bus(const PgStreamBusConfig& config) {
    return std::make_shared<PgStreamBus>(config);
}

} // namespace candlecast::bus
