#include "registry/version_manager.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <fnmatch.h>
#include <unistd.h>

#include <fstream>
#include <sstream>

namespace candlecast::registry {

namespace fs = std::filesystem;

namespace {

std::string slot_key(int slot) {
    return "v" + std::to_string(slot);
}

bool valid_slot(int slot) {
    return slot >= kBaselineSlot && slot <= kLatestSlot;
}

std::string now_iso() {
    return core::format_iso8601(core::unix_now_ms());
}

core::Error io_error(const std::string& what, const std::error_code& ec) {
    return core::make_error(core::ErrorCode::Io, what + ": " + ec.message());
}

} // namespace

nlohmann::json to_json(const SlotInfo& slot) {
    nlohmann::json body{
        {"path", slot.path},
        {"created_at", slot.created_at},
        {"metadata", slot.metadata},
    };
    if (slot.promoted_at) body["promoted_at"] = *slot.promoted_at;
    if (slot.created_from_v1) body["created_from_v1"] = true;
    if (slot.rolled_back_at) {
        body["rolled_back_at"] = *slot.rolled_back_at;
        body["rolled_back_from"] = slot_key(slot.rolled_back_from);
        body["original_created_at"] = slot.original_created_at;
    }
    return body;
}

SlotInfo slot_from_json(const nlohmann::json& body) {
    SlotInfo slot;
    slot.path = body.value("path", std::string());
    slot.created_at = body.value("created_at", std::string());
    if (body.contains("metadata") && body.at("metadata").is_object()) slot.metadata = body.at("metadata");
    if (body.contains("promoted_at") && body.at("promoted_at").is_string()) {
        slot.promoted_at = body.at("promoted_at").get<std::string>();
    }
    slot.created_from_v1 = body.value("created_from_v1", false);
    if (body.contains("rolled_back_at") && body.at("rolled_back_at").is_string()) {
        slot.rolled_back_at = body.at("rolled_back_at").get<std::string>();
        const std::string from = body.value("rolled_back_from", std::string());
        slot.rolled_back_from = (from.size() == 2) ? from[1] - '0' : 0;
        slot.original_created_at = body.value("original_created_at", std::string());
    }
    return slot;
}

std::vector<std::string> VersionManager::default_model_types() {
    return {"lightgbm", "tst", "finbert", "ensemble"};
}

std::vector<std::string> VersionManager::side_file_patterns(const std::string& model_type) {
    if (model_type == "lightgbm") return {"*_features.pkl"};
    if (model_type == "tst") return {"*scaler*.pkl"};
    return {};
}

VersionManager::VersionManager(fs::path models_dir, std::vector<std::string> model_types)
    : models_dir_(std::move(models_dir)),
      registry_path_(models_dir_ / "version_registry.json"),
      model_types_(std::move(model_types)) {}

core::Expected<VersionManager> VersionManager::open(fs::path models_dir, std::vector<std::string> model_types) {
    VersionManager manager(std::move(models_dir), std::move(model_types));
    core::Status status = manager.load();
    if (!status) return status.error_info();
    return manager;
}

core::Status VersionManager::load() {
    std::error_code ec;
    fs::create_directories(models_dir_, ec);
    if (ec) return io_error("cannot create " + models_dir_.string(), ec);

    registry_ = nlohmann::json::object();
    if (fs::exists(registry_path_, ec)) {
        std::ifstream in(registry_path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        registry_ = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (registry_.is_discarded() || !registry_.is_object()) {
            return core::make_error(core::ErrorCode::Parse, "corrupt registry " + registry_path_.string());
        }
    }

    bool changed = false;
    for (const auto& type : model_types_) {
        if (!registry_.contains(type) || !registry_[type].is_object()) {
            registry_[type] = nlohmann::json::object();
            changed = true;
        }
        for (int slot = kBaselineSlot; slot <= kLatestSlot; ++slot) {
            if (!registry_[type].contains(slot_key(slot))) {
                registry_[type][slot_key(slot)] = nullptr;
                changed = true;
            }
        }
    }
    if (!registry_.contains("metadata") || !registry_["metadata"].is_object()) {
        registry_["metadata"] = nlohmann::json{{"last_updated", now_iso()},
                                               {"version_history", nlohmann::json::array()}};
        changed = true;
    }
    return changed ? save() : core::Status::ok();
}

core::Status VersionManager::save() {
    registry_["metadata"]["last_updated"] = now_iso();
    const fs::path tmp = registry_path_.string() + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return core::make_error(core::ErrorCode::Io, "cannot write " + tmp.string());
        out << registry_.dump(2) << "\n";
        if (!out) return core::make_error(core::ErrorCode::Io, "short write to " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, registry_path_, ec);
    if (ec) return io_error("cannot replace " + registry_path_.string(), ec);
    return core::Status::ok();
}

bool VersionManager::known_type(const std::string& model_type) const {
    for (const auto& type : model_types_) {
        if (type == model_type) return true;
    }
    return false;
}

nlohmann::json& VersionManager::slot_entry(const std::string& model_type, int slot) {
    return registry_[model_type][slot_key(slot)];
}

const nlohmann::json* VersionManager::find_slot(const std::string& model_type, int slot) const {
    auto type_it = registry_.find(model_type);
    if (type_it == registry_.end() || !type_it->is_object()) return nullptr;
    auto slot_it = type_it->find(slot_key(slot));
    if (slot_it == type_it->end() || !slot_it->is_object()) return nullptr;
    return &*slot_it;
}

bool VersionManager::populated(const std::string& model_type, int slot) const {
    return find_slot(model_type, slot) != nullptr;
}

fs::path VersionManager::slot_dir(const std::string& model_type, int slot) const {
    return models_dir_ / model_type / slot_key(slot);
}

core::Expected<fs::path> VersionManager::install_artifact(const std::string& model_type, int slot,
                                                          const fs::path& source) {
    const fs::path dir = slot_dir(model_type, slot);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) return io_error("cannot clear " + dir.string(), ec);
    fs::create_directories(dir, ec);
    if (ec) return io_error("cannot create " + dir.string(), ec);

    if (fs::is_directory(source, ec)) {
        fs::copy(source, dir, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) return io_error("cannot copy " + source.string(), ec);
        return dir;
    }

    const fs::path target = dir / source.filename();
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) return io_error("cannot copy " + source.string(), ec);

    const auto patterns = side_file_patterns(model_type);
    const fs::path source_dir = source.has_parent_path() ? source.parent_path() : fs::path(".");
    if (!patterns.empty()) {
        for (fs::directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            const std::string name = it->path().filename().string();
            if (it->path() == source) continue;
            for (const auto& pattern : patterns) {
                if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
                    std::error_code copy_ec;
                    fs::copy_file(it->path(), dir / name, fs::copy_options::overwrite_existing, copy_ec);
                    if (copy_ec) {
                        audit::log_warn("Side file " + name + " not copied: " + copy_ec.message());
                    }
                    break;
                }
            }
        }
    }
    return target;
}

core::Status VersionManager::copy_slot(const std::string& model_type, int from, int to) {
    const fs::path src = slot_dir(model_type, from);
    const fs::path dst = slot_dir(model_type, to);
    std::error_code ec;
    fs::remove_all(dst, ec);
    if (ec) return io_error("cannot clear " + dst.string(), ec);
    fs::create_directories(dst, ec);
    if (ec) return io_error("cannot create " + dst.string(), ec);
    if (fs::exists(src, ec)) {
        fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) return io_error("cannot copy " + src.string() + " to " + dst.string(), ec);
    }

    const nlohmann::json* source_entry = find_slot(model_type, from);
    if (!source_entry) return core::make_error(core::ErrorCode::NotFound, model_type + " " + slot_key(from) + " is empty");
    SlotInfo info = slot_from_json(*source_entry);
    fs::path old_path(info.path);
    info.path = (old_path == src) ? dst.string() : (dst / old_path.filename()).string();
    info.promoted_at.reset();
    info.created_from_v1 = false;
    info.rolled_back_at.reset();
    slot_entry(model_type, to) = to_json(info);
    return core::Status::ok();
}

void VersionManager::record_history(const std::string& action, const std::string& model_type,
                                    const nlohmann::json& details) {
    nlohmann::json entry{{"action", action}, {"model_type", model_type}, {"timestamp", now_iso()}};
    for (auto it = details.begin(); it != details.end(); ++it) {
        entry[it.key()] = it.value();
    }
    registry_["metadata"]["version_history"].push_back(std::move(entry));
}

core::Status VersionManager::initialize_baseline(const std::string& model_type, const fs::path& source,
                                                 const nlohmann::json& metadata) {
    if (!known_type(model_type)) return core::make_error(core::ErrorCode::Invalid, "unknown model type " + model_type);
    if (populated(model_type, kBaselineSlot)) {
        audit::log_warn(model_type + " baseline already initialised, leaving v1 unchanged");
        return core::Status::ok();
    }
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return core::make_error(core::ErrorCode::NotFound, "artifact " + source.string() + " does not exist");
    }

    auto installed = install_artifact(model_type, kBaselineSlot, source);
    if (!installed) return installed.error_info();

    SlotInfo info;
    info.path = installed.value().string();
    info.created_at = now_iso();
    info.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    slot_entry(model_type, kBaselineSlot) = to_json(info);
    record_history("initialize_baseline", model_type, {{"path", info.path}});
    audit::log_audit("Initialised " + model_type + " v1 from " + source.string());
    return save();
}

core::Expected<SlotInfo> VersionManager::register_new_model(const std::string& model_type, const fs::path& source,
                                                            const nlohmann::json& metadata) {
    if (!known_type(model_type)) return core::make_error(core::ErrorCode::Invalid, "unknown model type " + model_type);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return core::make_error(core::ErrorCode::NotFound, "artifact " + source.string() + " does not exist");
    }

    const std::string now = now_iso();
    if (populated(model_type, kLatestSlot)) {
        core::Status status = copy_slot(model_type, kLatestSlot, kPreviousSlot);
        if (!status) return status.error_info();
        slot_entry(model_type, kPreviousSlot)["promoted_at"] = now;
        audit::log_info(model_type + " v3 promoted to v2");
    } else if (!populated(model_type, kPreviousSlot) && populated(model_type, kBaselineSlot)) {
        core::Status status = copy_slot(model_type, kBaselineSlot, kPreviousSlot);
        if (!status) return status.error_info();
        slot_entry(model_type, kPreviousSlot)["created_from_v1"] = true;
        audit::log_info(model_type + " v2 seeded from v1");
    }

    auto installed = install_artifact(model_type, kLatestSlot, source);
    if (!installed) return installed.error_info();

    SlotInfo info;
    info.path = installed.value().string();
    info.created_at = now;
    info.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    slot_entry(model_type, kLatestSlot) = to_json(info);
    record_history("register_new_model", model_type, {{"path", info.path}});
    audit::log_audit("Registered new " + model_type + " model as v3 from " + source.string());

    core::Status status = save();
    if (!status) return status.error_info();
    return info;
}

core::Status VersionManager::rollback_to_version(const std::string& model_type, int target_slot) {
    if (!known_type(model_type)) return core::make_error(core::ErrorCode::Invalid, "unknown model type " + model_type);
    if (target_slot != kBaselineSlot && target_slot != kPreviousSlot) {
        return core::make_error(core::ErrorCode::Invalid, "rollback target must be v1 or v2");
    }
    const nlohmann::json* target = find_slot(model_type, target_slot);
    if (!target) {
        return core::make_error(core::ErrorCode::NotFound, model_type + " " + slot_key(target_slot) + " is empty");
    }
    const std::string original_created_at = target->value("created_at", std::string());

    std::error_code ec;
    const fs::path latest_dir = slot_dir(model_type, kLatestSlot);
    if (fs::exists(latest_dir, ec)) {
        const fs::path backups = models_dir_ / model_type / "backups";
        fs::create_directories(backups, ec);
        if (ec) return io_error("cannot create " + backups.string(), ec);
        fs::path backup = backups / ("v3_backup_" + core::format_file_stamp(core::unix_now_ms()));
        for (int n = 1; fs::exists(backup, ec); ++n) {
            backup = backups / ("v3_backup_" + core::format_file_stamp(core::unix_now_ms()) + "_" + std::to_string(n));
        }
        fs::copy(latest_dir, backup, fs::copy_options::recursive, ec);
        if (ec) return io_error("cannot back up " + latest_dir.string(), ec);
        audit::log_info("Backed up " + model_type + " v3 to " + backup.string());
    }

    core::Status status = copy_slot(model_type, target_slot, kLatestSlot);
    if (!status) return status;
    nlohmann::json& latest = slot_entry(model_type, kLatestSlot);
    latest["rolled_back_at"] = now_iso();
    latest["rolled_back_from"] = slot_key(target_slot);
    latest["original_created_at"] = original_created_at;
    record_history("rollback", model_type, {{"target", slot_key(target_slot)}});
    audit::log_audit("Rolled back " + model_type + " v3 to " + slot_key(target_slot));
    return save();
}

core::Expected<std::string> VersionManager::get_model_path(const std::string& model_type, int slot) const {
    if (!known_type(model_type) || !valid_slot(slot)) {
        return core::make_error(core::ErrorCode::Invalid, "unknown model " + model_type + " " + slot_key(slot));
    }
    const nlohmann::json* entry = find_slot(model_type, slot);
    if (!entry) return core::make_error(core::ErrorCode::NotFound, model_type + " " + slot_key(slot) + " is empty");
    return entry->value("path", std::string());
}

std::map<int, SlotInfo> VersionManager::get_all_versions(const std::string& model_type) const {
    std::map<int, SlotInfo> out;
    for (int slot = kBaselineSlot; slot <= kLatestSlot; ++slot) {
        if (const nlohmann::json* entry = find_slot(model_type, slot)) {
            out.emplace(slot, slot_from_json(*entry));
        }
    }
    return out;
}

std::optional<SlotInfo> VersionManager::get_version_info(const std::string& model_type, int slot) const {
    const nlohmann::json* entry = valid_slot(slot) ? find_slot(model_type, slot) : nullptr;
    if (!entry) return std::nullopt;
    return slot_from_json(*entry);
}

std::map<std::string, std::map<int, SlotInfo>> VersionManager::list_all_models() const {
    std::map<std::string, std::map<int, SlotInfo>> out;
    for (const auto& type : model_types_) {
        out.emplace(type, get_all_versions(type));
    }
    return out;
}

std::vector<nlohmann::json> VersionManager::version_history() const {
    std::vector<nlohmann::json> out;
    auto meta = registry_.find("metadata");
    if (meta == registry_.end()) return out;
    auto history = meta->find("version_history");
    if (history == meta->end() || !history->is_array()) return out;
    for (const auto& entry : *history) out.push_back(entry);
    return out;
}

} // namespace candlecast::registry
