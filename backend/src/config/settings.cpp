#include "config/settings.hpp"

#include "audit/logger.hpp"
#include "core/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace candlecast::config {

namespace {

void read_string(const char* name, std::string* out) {
    if (const char* value = std::getenv(name)) {
        if (value[0] != '\0') *out = value;
    }
}

void read_list(const char* name, std::vector<std::string>* out) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') return;
    std::vector<std::string> parsed;
    for (auto& item : core::split(value, ',')) {
        size_t first = item.find_first_not_of(" \t");
        size_t last = item.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        parsed.push_back(item.substr(first, last - first + 1));
    }
    if (parsed.empty()) {
        audit::log_warn(std::string("Ignoring empty list in ") + name);
        return;
    }
    *out = std::move(parsed);
}

template <typename T>
void read_number(const char* name, T* out, long long min_value, long long max_value) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') return;
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(value, &end, 10);
    if (errno != 0 || !end || *end != '\0' || parsed < min_value || parsed > max_value) {
        audit::log_warn(std::string("Invalid value for ") + name + ": '" + value + "', keeping default");
        return;
    }
    *out = static_cast<T>(parsed);
}

} // namespace

PipelineSettings load_settings_from_env() {
    PipelineSettings settings;

    read_list("CANDLECAST_SYMBOLS", &settings.symbols);
    read_list("CANDLECAST_MODELS", &settings.models);
    read_list("CANDLECAST_VERSIONS", &settings.versions);

    read_string("JOBS_DIR", &settings.jobs_dir);
    read_string("STATE_DIR", &settings.state_dir);
    read_string("DATA_PATH", &settings.data_path);
    read_string("LOG_DIR", &settings.log_dir);
    read_string("MODELS_DIR", &settings.models_dir);
    read_string("CANDLECAST_BIN_DIR", &settings.bin_dir);
    read_string("CANDLECAST_PG_DSN", &settings.pg_dsn);
    read_string("INFERENCE_URL", &settings.inference_url);
    read_string("MARKET_DATA_URL", &settings.market_data_url);

    if (const char* backend = std::getenv("CANDLECAST_CONTROL_BACKEND")) {
        const std::string lowered = core::to_lower(backend);
        if (lowered == "store") {
            settings.control_backend = ControlBackend::Store;
        } else if (lowered != "file" && !lowered.empty()) {
            audit::log_warn("Unknown CANDLECAST_CONTROL_BACKEND '" + lowered + "', using file");
        }
    }

    read_number("CANDLECAST_SEQ_LEN", &settings.seq_len, 1, 10000);
    read_number("MAX_INITIAL_SYNC_ROWS", &settings.max_initial_sync_rows, 0, 100000000);
    read_number("CANDLECAST_QUOTA_BACKOFF_S", &settings.quota_backoff_s, 0, 3600);
    read_number("CANDLECAST_RETENTION_DAYS", &settings.retention_days, 1, 3650);
    read_number("CANDLECAST_STREAM_RETENTION_H", &settings.stream_retention_h, 1, 24 * 365);
    read_number("CANDLECAST_STREAM_TRIM_EVERY", &settings.stream_trim_every, 0, 1000000);
    read_number("CANDLECAST_STARTUP_TIMEOUT_S", &settings.startup_timeout_s, 1, 86400);
    read_number("CANDLECAST_DISPATCHER_WORKERS", &settings.dispatcher_workers, 1, 64);

    return settings;
}

std::string log_path_for(const PipelineSettings& settings, const std::string& component) {
    return (std::filesystem::path(settings.log_dir) / (component + ".log")).string();
}

} // namespace candlecast::config
