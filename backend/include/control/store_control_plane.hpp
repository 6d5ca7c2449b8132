#pragma once

#include "control/control_plane.hpp"
#include "store/batch_writer.hpp"

namespace candlecast::control {

// Control records kept as documents, keyed by EntityKey::id().
class StoreControlPlane final : public ControlPlane {
public:
    explicit StoreControlPlane(store::DocumentStore& documents, std::string collection = "control_state");

    core::Expected<std::optional<ControlRecord>> load(const core::EntityKey& entity) override;
    core::Status save(const ControlRecord& record) override;
    core::Status remove(const core::EntityKey& entity) override;
    core::Expected<std::vector<ControlRecord>> list() override;
    core::Status delete_all() override;

private:
    store::DocumentStore& store_;
    store::BatchWriter writer_;
    std::string collection_;
};

} // namespace candlecast::control
