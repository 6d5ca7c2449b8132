#pragma once

#include "core/error.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace candlecast::jobs {

/**
 * @class LaunchLedger
 * @brief Append-only record of launched job ids ("<job id>\t<UTC time>" lines).
 * A job id is recorded before its process is spawned, so a descriptor seen
 * again after a dispatcher crash is not launched twice. load() compacts the
 * file: repeated ids and entries older than max_age are dropped.
 */
class LaunchLedger {
public:
    explicit LaunchLedger(std::filesystem::path path,
                          std::chrono::milliseconds max_age = std::chrono::hours(24 * 7));

    core::Status load(int64_t now_ms = core::unix_now_ms());
    bool contains(const std::string& job_id) const;
    core::Status record(const std::string& job_id);
    size_t size() const;

    const std::filesystem::path& path() const { return path_; }

private:
    core::Status rewrite() const;

    std::filesystem::path path_;
    std::chrono::milliseconds max_age_;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> launched_at_;
};

} // namespace candlecast::jobs
