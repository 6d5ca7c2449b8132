#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace candlecast::config {

enum class ControlBackend { File, Store };

/**
 * @brief Process configuration shared by every candlecast executable.
 * Populated from environment variables by load_settings_from_env().
 */
struct PipelineSettings {
    std::vector<std::string> symbols{"BTCUSDT"};
    std::vector<std::string> models{"lightgbm", "tst"};
    std::vector<std::string> versions{"v1", "v2", "v3"};

    std::string jobs_dir = "jobs";
    std::string state_dir = "states";
    std::string data_path = "data";
    std::string log_dir = "logs";
    std::string models_dir = "models";
    std::string bin_dir = ".";

    std::string pg_dsn;
    std::string inference_url = "http://localhost:8000";
    std::string market_data_url = "https://api.binance.com";
    ControlBackend control_backend = ControlBackend::File;

    size_t seq_len = 30;
    size_t publish_chunk = 1000;
    size_t store_batch_limit = 500;
    size_t upsert_threshold = 100;
    size_t inference_chunk = 5000;
    size_t max_initial_sync_rows = 100000;
    uint32_t retention_days = 180;
    uint32_t event_retention_days = 365;
    uint32_t stream_retention_h = 168;
    uint32_t stream_trim_every = 100;

    uint32_t quota_backoff_s = 60;
    uint32_t startup_timeout_s = 300;
    uint32_t startup_poll_s = 5;
    uint32_t kill_entity_timeout_s = 60;
    uint32_t kill_total_timeout_s = 600;
    uint32_t kill_poll_s = 5;
    uint32_t monitor_poll_s = 5;
    uint32_t pause_sleep_s = 10;
    uint32_t dispatcher_poll_ms = 500;
    uint32_t dispatcher_workers = 2;
    uint32_t predict_timeout_s = 300;
    uint32_t availability_timeout_s = 10;
};

PipelineSettings load_settings_from_env();

std::string log_path_for(const PipelineSettings& settings, const std::string& component);

} // namespace candlecast::config
