#include "jobs/job_descriptor.hpp"

#include "bus/message_protocol.hpp"
#include "core/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>

#include <unistd.h>

namespace candlecast::jobs {

namespace {

constexpr const char* kJobIdTag = "# job-id:";
constexpr const char* kSymbolTag = "# symbol:";

std::string new_job_id(const core::EntityKey& entity) {
    static std::atomic<uint64_t> seq{0};
    return entity.id() + "-" + std::to_string(core::unix_now_ms()) + "-" + std::to_string(::getpid()) + "-" +
           std::to_string(seq.fetch_add(1));
}

std::string binary(const std::string& bin_dir, const char* name) {
    return (std::filesystem::path(bin_dir.empty() ? "." : bin_dir) / name).string();
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

const char* to_string(JobKind kind) {
    switch (kind) {
        case JobKind::Producer: return "producer";
        case JobKind::Consumer: return "consumer";
    }
    return "unknown";
}

JobDescriptor make_producer_job(const std::string& symbol, const std::string& bin_dir) {
    JobDescriptor job;
    job.kind = JobKind::Producer;
    job.entity = core::EntityKey::producer();
    job.symbol = core::to_upper(symbol);
    job.job_id = new_job_id(job.entity);
    job.command = binary(bin_dir, "candlecast_producer") + " --symbol " + job.symbol;
    return job;
}

JobDescriptor make_consumer_job(const core::EntityKey& entity, const std::string& bin_dir) {
    JobDescriptor job;
    job.kind = JobKind::Consumer;
    job.entity = entity;
    job.symbol = entity.symbol;
    job.job_id = new_job_id(entity);
    job.command = binary(bin_dir, "candlecast_consumer") + " --crypto " + entity.symbol + " --model " + entity.model +
                  " --version " + entity.version;
    return job;
}

core::Expected<JobDescriptor> parse_job_filename(const std::string& filename) {
    const std::string suffix = ".sh";
    if (filename.size() <= suffix.size() || filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return core::make_error(core::ErrorCode::Invalid, "not a job file: " + filename);
    }
    const std::string stem = filename.substr(0, filename.size() - suffix.size());
    const size_t first = stem.find('_');
    const size_t last = stem.rfind('_');
    if (first == std::string::npos || first == last || first == 0 || last + 1 == stem.size() || last == first + 1) {
        return core::make_error(core::ErrorCode::Invalid, "invalid job file name format: " + filename);
    }

    JobDescriptor job;
    job.entity.symbol = stem.substr(0, first);
    job.entity.model = stem.substr(first + 1, last - first - 1);
    job.entity.version = stem.substr(last + 1);
    if (job.entity == core::EntityKey::producer()) {
        job.kind = JobKind::Producer;
        job.symbol.clear();
    } else if (job.entity.model == "producer") {
        return core::make_error(core::ErrorCode::Invalid, "producer jobs must be named ALL_producer_main.sh");
    } else {
        job.kind = JobKind::Consumer;
        job.symbol = job.entity.symbol;
    }
    return job;
}

std::string render_job_file(const JobDescriptor& job) {
    std::ostringstream out;
    out << "#!/bin/sh\n";
    out << kJobIdTag << ' ' << job.job_id << '\n';
    out << kSymbolTag << ' ' << job.symbol << '\n';
    out << "exec " << job.command << '\n';
    return out.str();
}

core::Expected<JobDescriptor> parse_job_file(const std::string& filename, const std::string& content) {
    auto parsed = parse_job_filename(filename);
    if (!parsed) return parsed;
    JobDescriptor job = parsed.value();

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#!", 0) == 0) continue;
        if (line.rfind(kJobIdTag, 0) == 0) {
            job.job_id = trim(line.substr(std::char_traits<char>::length(kJobIdTag)));
        } else if (line.rfind(kSymbolTag, 0) == 0) {
            const std::string symbol = trim(line.substr(std::char_traits<char>::length(kSymbolTag)));
            if (job.kind == JobKind::Producer && !symbol.empty()) job.symbol = core::to_upper(symbol);
        } else if (line[0] != '#' && job.command.empty()) {
            job.command = line.rfind("exec ", 0) == 0 ? trim(line.substr(5)) : line;
        }
    }
    if (job.job_id.empty()) {
        // Descriptors without a job-id header get one derived from their content.
        job.job_id = job.entity.id() + "-" + std::to_string(std::hash<std::string>{}(content));
    }
    return job;
}

core::Expected<JobDescriptor> read_job_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return core::make_error(core::ErrorCode::Io, "cannot open " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse_job_file(path.filename().string(), content.str());
}

core::Status write_job_file(const std::filesystem::path& dir, const JobDescriptor& job) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return core::make_error(core::ErrorCode::Io, "cannot create " + dir.string() + ": " + ec.message());

    const std::filesystem::path target = dir / job.filename();
    const std::filesystem::path temp = dir / ("." + job.filename() + ".tmp." + std::to_string(::getpid()));
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return core::make_error(core::ErrorCode::Io, "cannot open " + temp.string());
        file << render_job_file(job);
        file.flush();
        if (!file) return core::make_error(core::ErrorCode::Io, "write to " + temp.string() + " failed");
    }
    std::filesystem::permissions(temp, std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::add, ec);
    if (!ec) std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return core::make_error(core::ErrorCode::Io, "publishing " + target.string() + " failed: " + ec.message());
    }
    return core::Status::ok();
}

std::vector<uint8_t> encode_job(const JobDescriptor& job) {
    const nlohmann::json body{
        {"kind", to_string(job.kind)},
        {"crypto", job.entity.symbol},
        {"model", job.entity.model},
        {"version", job.entity.version},
        {"symbol", job.symbol},
        {"job_id", job.job_id},
        {"command", job.command},
    };
    const std::string payload = body.dump();
    return bus::encode_frame(bus::FrameType::JobRequest, bus::PayloadEncoding::Json, payload.data(), payload.size(),
                             core::unix_now_ns());
}

core::Expected<JobDescriptor> decode_job(const void* data, size_t size) {
    bus::Frame frame{};
    CandlecastStatus status = bus::decode_frame(data, size, &frame);
    if (status != CANDLECAST_OK) return core::make_error(core::to_error(status), "bad job frame");
    if (frame.header.type != static_cast<uint16_t>(bus::FrameType::JobRequest) ||
        frame.header.encoding != static_cast<uint16_t>(bus::PayloadEncoding::Json)) {
        return core::make_error(core::ErrorCode::Proto, "frame is not a job request");
    }

    auto body = nlohmann::json::parse(frame.payload, frame.payload + frame.header.size, nullptr, false);
    if (body.is_discarded() || !body.is_object()) return core::make_error(core::ErrorCode::Parse, "job payload is not JSON");

    JobDescriptor job;
    const std::string kind = body.value("kind", "");
    if (kind == "producer") {
        job.kind = JobKind::Producer;
    } else if (kind == "consumer") {
        job.kind = JobKind::Consumer;
    } else {
        return core::make_error(core::ErrorCode::Parse, "unknown job kind '" + kind + "'");
    }
    job.entity.symbol = body.value("crypto", "");
    job.entity.model = body.value("model", "");
    job.entity.version = body.value("version", "");
    job.symbol = body.value("symbol", "");
    job.job_id = body.value("job_id", "");
    job.command = body.value("command", "");
    if (job.job_id.empty() || job.entity.symbol.empty()) {
        return core::make_error(core::ErrorCode::Parse, "job payload missing id or entity");
    }
    return job;
}

} // namespace candlecast::jobs
