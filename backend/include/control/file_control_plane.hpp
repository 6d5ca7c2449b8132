#pragma once

#include "control/control_plane.hpp"

#include <filesystem>

namespace candlecast::control {

/**
 * @class FileControlPlane
 * @brief One JSON file per entity ({SYMBOL}_{model}_{version}.json) in a
 * shared directory. Files are replaced atomically via rename.
 */
class FileControlPlane final : public ControlPlane {
public:
    explicit FileControlPlane(std::filesystem::path dir);

    core::Expected<std::optional<ControlRecord>> load(const core::EntityKey& entity) override;
    core::Status save(const ControlRecord& record) override;
    core::Status remove(const core::EntityKey& entity) override;
    core::Expected<std::vector<ControlRecord>> list() override;
    core::Status delete_all() override;

    std::filesystem::path path_for(const core::EntityKey& entity) const;

private:
    std::filesystem::path dir_;
};

} // namespace candlecast::control
