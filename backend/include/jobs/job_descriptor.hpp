#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace candlecast::jobs {

enum class JobKind {
    Producer,
    Consumer
};

const char* to_string(JobKind kind);

/**
 * @brief One launch request. The file form is "{entity id}.sh" holding a
 * shebang, "# job-id:" and "# symbol:" header comments and one command line.
 */
struct JobDescriptor {
    JobKind kind = JobKind::Consumer;
    core::EntityKey entity;
    std::string symbol;
    std::string job_id;
    std::string command;

    std::string filename() const { return entity.id() + ".sh"; }
};

JobDescriptor make_producer_job(const std::string& symbol, const std::string& bin_dir);
JobDescriptor make_consumer_job(const core::EntityKey& entity, const std::string& bin_dir);

// "BTCUSDT_lightgbm_v1.sh" or "ALL_producer_main.sh".
core::Expected<JobDescriptor> parse_job_filename(const std::string& filename);

std::string render_job_file(const JobDescriptor& job);
// Filename gives routing; the header comments fill job_id, symbol and command.
core::Expected<JobDescriptor> parse_job_file(const std::string& filename, const std::string& content);
core::Expected<JobDescriptor> read_job_file(const std::filesystem::path& path);

// Writes via a dot-prefixed temp file and rename so watchers never see a partial file.
core::Status write_job_file(const std::filesystem::path& dir, const JobDescriptor& job);

// Bus framing (FrameType::JobRequest, JSON payload).
std::vector<uint8_t> encode_job(const JobDescriptor& job);
core::Expected<JobDescriptor> decode_job(const void* data, size_t size);

} // namespace candlecast::jobs
