#pragma once

#include "core/time_utils.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace candlecast::audit {

enum class LogLevel { INFO, WARN, ERR, AUDIT };

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARN: return "[WARN] ";
        case LogLevel::ERR: return "[ERR] ";
        case LogLevel::AUDIT: return "[AUDIT] ";
    }
    return "[LOG] ";
}

/**
 * @class Logger
 * @brief Process-wide asynchronous logger.
 * Entries are queued by callers and written by one worker thread to stdout
 * and, once configure() has been called, to the process log file.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    // Tag lines with component and append them to log_path (directories are created).
    void configure(const std::string& component, const std::string& log_path) {
        std::lock_guard<std::mutex> lock(mtx_);
        component_ = component;
        if (file_.is_open()) file_.close();
        if (log_path.empty()) return;
        std::error_code ec;
        std::filesystem::path path(log_path);
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file_.open(log_path, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "[LOG] cannot open " << log_path << (ec ? ": " + ec.message() : std::string()) << std::endl;
        }
    }

    void set_console(bool enabled) {
        console_.store(enabled, std::memory_order_relaxed);
    }

    void log(LogLevel level, const std::string& message) {
        LogEntry entry;
        entry.level = level;
        entry.timestamp_ns = candlecast::core::unix_now_ns();
        entry.message = message;

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.size() >= queue_capacity_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            queue_.push_back(std::move(entry));
        }
        cv_.notify_one();
    }

    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }
    void record(const std::string& message) { log(LogLevel::AUDIT, message); }

    // Blocks until every queued entry has been written.
    void flush() {
        std::unique_lock<std::mutex> lock(mtx_);
        idle_cv_.wait(lock, [&] { return queue_.empty() && !writing_; });
        if (file_.is_open()) file_.flush();
        std::cout.flush();
    }

    void set_queue_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_capacity_ = capacity;
    }

    uint64_t dropped_count() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct LogEntry {
        LogLevel level;
        uint64_t timestamp_ns;
        std::string message;
    };

    Logger() {
        worker_ = std::thread(&Logger::worker_loop, this);
    }

    ~Logger() {
        running_.store(false, std::memory_order_relaxed);
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        if (file_.is_open()) file_.close();
    }

    void worker_loop() {
        for (;;) {
            LogEntry entry;
            std::string component;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&] {
                    return !running_.load(std::memory_order_relaxed) || !queue_.empty();
                });
                if (!running_.load(std::memory_order_relaxed) && queue_.empty()) {
                    break;
                }
                entry = std::move(queue_.front());
                queue_.pop_front();
                component = component_;
                writing_ = true;
            }

            char ts_buf[64];
            candlecast::core::format_utc(entry.timestamp_ns, ts_buf, sizeof(ts_buf));
            std::string line = std::string(ts_buf) + " " + level_tag(entry.level);
            if (!component.empty()) line += "[" + component + "] ";
            line += entry.message;

            if (console_.load(std::memory_order_relaxed)) {
                std::cout << line << std::endl;
            }

            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (file_.is_open()) {
                    file_ << line << "\n";
                }
                writing_ = false;
                if (queue_.empty()) idle_cv_.notify_all();
            }
        }
    }

    std::ofstream file_;
    std::string component_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<LogEntry> queue_;
    size_t queue_capacity_ = 4096;
    bool writing_ = false;
    std::atomic<bool> console_{true};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

inline void log_info(const std::string& message) { Logger::instance().info(message); }
inline void log_warn(const std::string& message) { Logger::instance().warn(message); }
inline void log_error(const std::string& message) { Logger::instance().error(message); }
inline void log_audit(const std::string& message) { Logger::instance().record(message); }

} // namespace candlecast::audit
