#pragma once

#include "core/error.hpp"
#include "jobs/job_descriptor.hpp"

#include <functional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace candlecast::jobs {

// Starts the process for a job and returns its pid.
using Launcher = std::function<core::Expected<pid_t>(const JobDescriptor&)>;

// argv built from typed fields; the descriptor's command line is not interpreted.
std::vector<std::string> build_argv(const JobDescriptor& job, const std::string& bin_dir);

/**
 * @brief fork/setsid/fork/execv so the child outlives the caller and is
 * reparented to init. stdio goes to /dev/null. Exec failures are reported
 * back through a close-on-exec pipe.
 */
core::Expected<pid_t> spawn_detached(const std::vector<std::string>& argv);

Launcher make_process_launcher(std::string bin_dir);

} // namespace candlecast::jobs
