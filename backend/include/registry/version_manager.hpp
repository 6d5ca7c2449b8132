#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace candlecast::registry {

constexpr int kBaselineSlot = 1;
constexpr int kPreviousSlot = 2;
constexpr int kLatestSlot = 3;

struct SlotInfo {
    std::string path;
    std::string created_at;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> promoted_at;
    bool created_from_v1 = false;
    std::optional<std::string> rolled_back_at;
    int rolled_back_from = 0;
    std::string original_created_at;
};

nlohmann::json to_json(const SlotInfo& slot);
SlotInfo slot_from_json(const nlohmann::json& body);

/**
 * @class VersionManager
 * @brief Three artifact slots per model type under models/{type}/v{1,2,3}.
 *
 * Slot 1 is the write-once baseline, slot 3 the latest registration and
 * slot 2 the one before it. Every mutation rewrites version_registry.json.
 * File copies and the registry write are not atomic together: a crash in
 * between leaves the directories ahead of the registry.
 */
class VersionManager {
public:
    static core::Expected<VersionManager> open(std::filesystem::path models_dir,
                                               std::vector<std::string> model_types = default_model_types());

    static std::vector<std::string> default_model_types();
    // Extra files copied beside the artifact, by model type.
    static std::vector<std::string> side_file_patterns(const std::string& model_type);

    core::Status initialize_baseline(const std::string& model_type, const std::filesystem::path& source,
                                     const nlohmann::json& metadata = nlohmann::json::object());
    core::Expected<SlotInfo> register_new_model(const std::string& model_type, const std::filesystem::path& source,
                                                const nlohmann::json& metadata = nlohmann::json::object());
    core::Status rollback_to_version(const std::string& model_type, int target_slot);

    core::Expected<std::string> get_model_path(const std::string& model_type, int slot) const;
    std::map<int, SlotInfo> get_all_versions(const std::string& model_type) const;
    std::optional<SlotInfo> get_version_info(const std::string& model_type, int slot) const;
    std::map<std::string, std::map<int, SlotInfo>> list_all_models() const;
    std::vector<nlohmann::json> version_history() const;

    std::filesystem::path slot_dir(const std::string& model_type, int slot) const;
    const std::filesystem::path& registry_path() const { return registry_path_; }

private:
    VersionManager(std::filesystem::path models_dir, std::vector<std::string> model_types);

    core::Status load();
    core::Status save();
    bool known_type(const std::string& model_type) const;
    bool populated(const std::string& model_type, int slot) const;
    nlohmann::json& slot_entry(const std::string& model_type, int slot);
    const nlohmann::json* find_slot(const std::string& model_type, int slot) const;
    core::Expected<std::filesystem::path> install_artifact(const std::string& model_type, int slot,
                                                           const std::filesystem::path& source);
    core::Status copy_slot(const std::string& model_type, int from, int to);
    void record_history(const std::string& action, const std::string& model_type, const nlohmann::json& details);

    std::filesystem::path models_dir_;
    std::filesystem::path registry_path_;
    std::vector<std::string> model_types_;
    nlohmann::json registry_;
};

} // namespace candlecast::registry
