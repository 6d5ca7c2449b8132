#include "jobs/job_dispatcher.hpp"

#include "audit/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace candlecast::jobs {

JobDispatcher::JobDispatcher(DispatcherOptions options, control::ControlPlane& control)
    : options_(std::move(options)),
      control_(control),
      ledger_(std::filesystem::path(options_.jobs_dir) / ".launched") {
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
    launchers_[JobKind::Producer] = make_process_launcher(options_.bin_dir);
    launchers_[JobKind::Consumer] = make_process_launcher(options_.bin_dir);
}

JobDispatcher::~JobDispatcher() {
    shutdown();
}

void JobDispatcher::set_launcher(JobKind kind, Launcher launcher) {
    launchers_[kind] = std::move(launcher);
}

core::Status JobDispatcher::start() {
    std::error_code ec;
    std::filesystem::create_directories(options_.jobs_dir, ec);
    if (ec) {
        return core::make_error(core::ErrorCode::Io, "cannot create " + options_.jobs_dir + ": " + ec.message());
    }
    core::Status loaded = ledger_.load();
    if (!loaded) return loaded;

    if (options_.workers > 0 && !queue_) {
        bus::InprocBusConfig config;
        config.queue_capacity = 1024;
        config.policy = bus::BackpressurePolicy::Block;
        config.consumer_threads = options_.workers;
        queue_ = bus::create_inproc_bus(config);
        CandlecastStatus connected = queue_->connect("inproc://jobs", true);
        if (connected != CANDLECAST_OK) {
            queue_.reset();
            return core::make_error(core::to_error(connected), "job queue unavailable");
        }
        queue_->subscribe(kJobTopic, [this](const void* data, size_t size) {
            auto job = decode_job(data, size);
            if (!job) {
                audit::log_error("Dropping undecodable job request: " + job.message());
                return;
            }
            handle(job.value());
        });
    }
    started_ = true;
    audit::log_info("Watching " + options_.jobs_dir + " with " + std::to_string(options_.workers) + " workers, " +
                    std::to_string(ledger_.size()) + " jobs in launch ledger");
    return core::Status::ok();
}

size_t JobDispatcher::scan_once() {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(options_.jobs_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        const std::string name = path.filename().string();
        if (name.empty() || name[0] == '.' || path.extension() != ".sh") continue;
        if (!it->is_regular_file(ec)) continue;
        files.push_back(path);
    }
    if (ec) {
        audit::log_warn("Scanning " + options_.jobs_dir + " failed: " + ec.message());
    }
    std::sort(files.begin(), files.end());

    size_t queued = 0;
    for (const auto& path : files) {
        const std::string name = path.filename().string();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_flight_.count(name) != 0 || rejected_.count(name) != 0) continue;
        }
        auto job = read_job_file(path);
        if (!job) {
            audit::log_warn("Ignoring job file " + name + ": " + job.message());
            std::lock_guard<std::mutex> lock(mutex_);
            rejected_.insert(name);
            ++stats_.rejected;
            continue;
        }
        if (job.value().kind == JobKind::Producer && job.value().symbol.empty()) {
            job.value().symbol = options_.default_symbol;
        }
        audit::log_info("New job file detected: " + name + " (" + to_string(job.value().kind) + ", id " +
                        job.value().job_id + ")");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.insert(name);
            ++stats_.queued;
        }
        ++queued;

        if (!queue_) {
            handle(job.value());
            continue;
        }
        const std::vector<uint8_t> frame = encode_job(job.value());
        CandlecastStatus status = queue_->publish(kJobTopic, frame.data(), frame.size());
        if (status != CANDLECAST_OK) {
            audit::log_warn("Job queue refused " + name + ": " + candlecast_status_name(status) + ", will retry");
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(name);
            --stats_.queued;
            --queued;
        }
    }
    return queued;
}

void JobDispatcher::handle(const JobDescriptor& job) {
    const std::string name = job.filename();
    if (ledger_.contains(job.job_id)) {
        audit::log_warn("Job " + job.job_id + " already launched, discarding " + name);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.duplicates;
        }
        finish(name);
        return;
    }

    if (job.kind == JobKind::Consumer) {
        core::Status reset = control_.reset_for_launch(job.entity);
        if (!reset) audit::log_warn("Could not reset state for " + job.entity.id() + ": " + reset.message());
    }

    core::Status recorded = ledger_.record(job.job_id);
    if (!recorded) {
        audit::log_error("Launch ledger write failed for " + job.job_id + ": " + recorded.message());
    }

    auto launcher = launchers_.find(job.kind);
    core::Expected<pid_t> pid = launcher == launchers_.end() || !launcher->second
                                    ? core::Expected<pid_t>(core::make_error(core::ErrorCode::Invalid, "no launcher"))
                                    : launcher->second(job);
    if (pid) {
        audit::log_audit("launched " + std::string(to_string(job.kind)) + " " + job.entity.id() + " pid " +
                         std::to_string(pid.value()) + " job " + job.job_id);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.launched;
    } else {
        audit::log_error("Error launching " + job.entity.id() + " from " + name + ": " + pid.message());
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failures;
    }
    finish(name);
}

void JobDispatcher::finish(const std::string& filename) {
    std::error_code ec;
    const std::filesystem::path path = std::filesystem::path(options_.jobs_dir) / filename;
    if (std::filesystem::remove(path, ec)) {
        audit::log_info("Removed job file " + path.string());
    } else if (ec) {
        audit::log_error("Error removing job file " + path.string() + ": " + ec.message());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(filename);
}

int JobDispatcher::run(const std::atomic<bool>& stop) {
    if (!started_) {
        core::Status status = start();
        if (!status) {
            audit::log_error("Dispatcher failed to start: " + status.message());
            return 1;
        }
    }
    const size_t drained = scan_once();
    if (drained > 0) audit::log_info("Queued " + std::to_string(drained) + " existing job files");
    while (!stop.load()) {
        options_.sleeper(options_.poll);
        scan_once();
    }
    audit::log_info("Job dispatcher stopping");
    shutdown();
    return 0;
}

void JobDispatcher::shutdown() {
    if (queue_) queue_->shutdown();
}

DispatcherStats JobDispatcher::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace candlecast::jobs
