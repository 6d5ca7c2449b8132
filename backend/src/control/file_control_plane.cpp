#include "control/file_control_plane.hpp"

#include "audit/logger.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

namespace candlecast::control {

FileControlPlane::FileControlPlane(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

std::filesystem::path FileControlPlane::path_for(const core::EntityKey& entity) const {
    return dir_ / (entity.id() + ".json");
}

core::Expected<std::optional<ControlRecord>> FileControlPlane::load(const core::EntityKey& entity) {
    const auto path = path_for(entity);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::optional<ControlRecord>{};

    std::ifstream in(path);
    if (!in) {
        // Removed between exists() and open().
        return std::optional<ControlRecord>{};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto body = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (body.is_discarded()) {
        return core::make_error(core::ErrorCode::Parse, "malformed state file " + path.string());
    }
    auto record = record_from_json(body);
    if (!record) return record.error_info();
    return std::optional<ControlRecord>(std::move(record.value()));
}

core::Status FileControlPlane::save(const ControlRecord& record) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return core::make_error(core::ErrorCode::Io, "cannot create " + dir_.string() + ": " + ec.message());

    const auto path = path_for(record.entity);
    const auto tmp = dir_ / ("." + record.entity.id() + ".tmp." + std::to_string(::getpid()));
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return core::make_error(core::ErrorCode::Io, "cannot write " + tmp.string());
        out << to_json(record).dump(2) << "\n";
        out.flush();
        if (!out) return core::make_error(core::ErrorCode::Io, "short write to " + tmp.string());
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return core::make_error(core::ErrorCode::Io, "cannot replace " + path.string());
    }
    return core::Status::ok();
}

core::Status FileControlPlane::remove(const core::EntityKey& entity) {
    std::error_code ec;
    std::filesystem::remove(path_for(entity), ec);
    if (ec) return core::make_error(core::ErrorCode::Io, "cannot remove state for " + entity.id() + ": " + ec.message());
    return core::Status::ok();
}

core::Expected<std::vector<ControlRecord>> FileControlPlane::list() {
    std::vector<ControlRecord> records;
    std::error_code ec;
    if (!std::filesystem::exists(dir_, ec)) return records;
    for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json" || path.filename().string().front() == '.') continue;
        std::ifstream in(path);
        if (!in) continue;
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto body = nlohmann::json::parse(buffer.str(), nullptr, false);
        auto record = body.is_discarded() ? core::Expected<ControlRecord>(core::ErrorCode::Parse)
                                          : record_from_json(body);
        if (!record) {
            audit::log_warn("Skipping unreadable state file " + path.string());
            continue;
        }
        records.push_back(std::move(record.value()));
    }
    if (ec) return core::make_error(core::ErrorCode::Io, "cannot list " + dir_.string() + ": " + ec.message());
    return records;
}

core::Status FileControlPlane::delete_all() {
    std::error_code ec;
    if (!std::filesystem::exists(dir_, ec)) return core::Status::ok();
    std::vector<std::filesystem::path> doomed;
    for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json") doomed.push_back(it->path());
    }
    if (ec) return core::make_error(core::ErrorCode::Io, "cannot list " + dir_.string() + ": " + ec.message());
    size_t failures = 0;
    for (const auto& path : doomed) {
        std::error_code rm_ec;
        std::filesystem::remove(path, rm_ec);
        if (rm_ec) ++failures;
    }
    audit::log_info("Deleted " + std::to_string(doomed.size() - failures) + " state files from " + dir_.string());
    if (failures > 0) {
        return core::make_error(core::ErrorCode::Io, std::to_string(failures) + " state files could not be removed");
    }
    return core::Status::ok();
}

} // namespace candlecast::control
