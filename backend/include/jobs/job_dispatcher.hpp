#pragma once

#include "bus/message_bus.hpp"
#include "control/control_plane.hpp"
#include "core/retry.hpp"
#include "jobs/job_descriptor.hpp"
#include "jobs/launch_ledger.hpp"
#include "jobs/process_launcher.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace candlecast::jobs {

struct DispatcherOptions {
    std::string jobs_dir = "jobs";
    std::string bin_dir = ".";
    std::string default_symbol = "BTCUSDT";
    uint32_t workers = 2; // 0 = jobs run on the scanning thread
    std::chrono::milliseconds poll{500};
    core::Sleeper sleeper = core::sleep_for_ms;
};

struct DispatcherStats {
    uint64_t queued = 0;
    uint64_t launched = 0;
    uint64_t duplicates = 0;
    uint64_t failures = 0;
    uint64_t rejected = 0;
};

/**
 * @class JobDispatcher
 * @brief Turns job descriptor files into detached processes.
 * The scanner parses each *.sh file in jobs_dir into a JobDescriptor and
 * queues it on an in-process bus whose consumer threads form the worker
 * pool. A worker checks the launch ledger, resets the entity's control
 * record for consumers, records the job id, launches, then deletes the file.
 */
class JobDispatcher {
public:
    JobDispatcher(DispatcherOptions options, control::ControlPlane& control);
    ~JobDispatcher();

    JobDispatcher(const JobDispatcher&) = delete;
    JobDispatcher& operator=(const JobDispatcher&) = delete;

    void set_launcher(JobKind kind, Launcher launcher);

    core::Status start();
    // Queues every descriptor not already in flight; returns how many were queued.
    size_t scan_once();
    void handle(const JobDescriptor& job);
    // Drains existing descriptors, then polls until stop is set.
    int run(const std::atomic<bool>& stop);
    void shutdown();

    DispatcherStats stats() const;
    const LaunchLedger& ledger() const { return ledger_; }

    static constexpr const char* kJobTopic = "jobs";

private:
    void finish(const std::string& filename);

    DispatcherOptions options_;
    control::ControlPlane& control_;
    LaunchLedger ledger_;
    std::shared_ptr<bus::MessageBus> queue_;
    std::map<JobKind, Launcher> launchers_;

    mutable std::mutex mutex_;
    std::set<std::string> in_flight_;
    std::set<std::string> rejected_;
    DispatcherStats stats_;
    bool started_ = false;
};

} // namespace candlecast::jobs
