#include "jobs/launch_ledger.hpp"

#include "audit/logger.hpp"

#include <fstream>

namespace candlecast::jobs {

LaunchLedger::LaunchLedger(std::filesystem::path path, std::chrono::milliseconds max_age)
    : path_(std::move(path)), max_age_(max_age) {}

core::Status LaunchLedger::load(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    launched_at_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return core::Status::ok();
    std::ifstream file(path_);
    if (!file.is_open()) return core::make_error(core::ErrorCode::Io, "cannot open " + path_.string());

    const int64_t cutoff = now_ms - static_cast<int64_t>(max_age_.count());
    size_t lines = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        ++lines;
        const size_t tab = line.find('\t');
        const std::string id = line.substr(0, tab);
        if (id.empty()) continue;
        int64_t at = now_ms;
        if (tab != std::string::npos && !core::parse_iso8601(line.substr(tab + 1), &at)) at = now_ms;
        if (at < cutoff) continue;
        auto [it, inserted] = launched_at_.emplace(id, at);
        if (!inserted && at > it->second) it->second = at;
    }
    file.close();

    if (launched_at_.size() == lines) return core::Status::ok();
    core::Status written = rewrite();
    if (!written) return written;
    audit::log_info("Launch ledger compacted from " + std::to_string(lines) + " to " +
                    std::to_string(launched_at_.size()) + " entries");
    return core::Status::ok();
}

core::Status LaunchLedger::rewrite() const {
    std::filesystem::path staging = path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) return core::make_error(core::ErrorCode::Io, "cannot open " + staging.string());
        for (const auto& [id, at] : launched_at_) out << id << '\t' << core::format_ledger_time(at) << '\n';
        out.flush();
        if (!out) return core::make_error(core::ErrorCode::Io, "write to " + staging.string() + " failed");
    }
    std::error_code ec;
    std::filesystem::rename(staging, path_, ec);
    if (ec) return core::make_error(core::ErrorCode::Io, "replacing " + path_.string() + " failed: " + ec.message());
    return core::Status::ok();
}

bool LaunchLedger::contains(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launched_at_.count(job_id) != 0;
}

core::Status LaunchLedger::record(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!path_.parent_path().empty()) std::filesystem::create_directories(path_.parent_path(), ec);
    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) return core::make_error(core::ErrorCode::Io, "cannot open " + path_.string());
    const int64_t now_ms = core::unix_now_ms();
    file << job_id << '\t' << core::format_ledger_time(now_ms) << '\n';
    file.flush();
    if (!file) return core::make_error(core::ErrorCode::Io, "write to " + path_.string() + " failed");
    launched_at_[job_id] = now_ms;
    return core::Status::ok();
}

size_t LaunchLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launched_at_.size();
}

} // namespace candlecast::jobs
