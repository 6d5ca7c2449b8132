#include "audit/logger.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

int main() {
    using namespace candlecast;
    namespace fs = std::filesystem;

    const fs::path dir = fs::temp_directory_path() / ("candlecast_logs_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    const fs::path path = dir / "nested" / "dispatcher.log";

    audit::Logger& logger = audit::Logger::instance();
    logger.set_console(false);
    logger.configure("dispatcher", path.string());
    audit::log_info("booting");
    audit::log_warn("slow poll");
    audit::log_error("launch failed");
    audit::log_audit("launched consumer BTCUSDT_lightgbm_v1");
    logger.flush();

    std::vector<std::string> lines;
    {
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
    }
    assert(lines.size() == 4);
    assert(lines[0].find(" [INFO] [dispatcher] booting") != std::string::npos);
    assert(lines[1].find(" [WARN] [dispatcher] slow poll") != std::string::npos);
    assert(lines[2].find(" [ERR] [dispatcher] launch failed") != std::string::npos);
    assert(lines[3].find(" [AUDIT] [dispatcher] launched consumer BTCUSDT_lightgbm_v1") != std::string::npos);

    // A full queue drops entries instead of blocking the caller.
    const uint64_t before = logger.dropped_count();
    logger.set_queue_capacity(0);
    audit::log_info("lost");
    audit::log_info("lost too");
    assert(logger.dropped_count() == before + 2);
    logger.set_queue_capacity(4096);

    logger.configure("dispatcher", "");
    fs::remove_all(dir);
    return 0;
}
