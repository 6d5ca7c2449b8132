#pragma once

#include "core/error.hpp"
#include "core/retry.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace candlecast::control {

struct ControlRecord {
    core::EntityKey entity;
    core::ControlState state = core::ControlState::Pending;
    std::string error_message;
    int64_t updated_at_ms = 0;
};

nlohmann::json to_json(const ControlRecord& record);
core::Expected<ControlRecord> record_from_json(const nlohmann::json& body);

struct WaitResult {
    core::ControlState state = core::ControlState::Unknown;
    bool satisfied = false;
    bool cancelled = false;
};

using StatePredicate = std::function<bool(core::ControlState)>;

/**
 * @class ControlPlane
 * @brief Shared entity -> lifecycle state map used for cross-process signaling.
 * Backends implement load/save/remove/list; the rendezvous helpers are
 * built on top. Writes are last-write-wins per entity with no locking.
 */
class ControlPlane {
public:
    virtual ~ControlPlane() = default;

    virtual core::Expected<std::optional<ControlRecord>> load(const core::EntityKey& entity) = 0;
    virtual core::Status save(const ControlRecord& record) = 0;
    virtual core::Status remove(const core::EntityKey& entity) = 0;
    virtual core::Expected<std::vector<ControlRecord>> list() = 0;
    virtual core::Status delete_all() = 0;

    // Upsert; the stored error message is kept when error is not given.
    core::Status write(const core::EntityKey& entity, core::ControlState state,
                       std::optional<std::string> error = std::nullopt);

    // Current state, or Unknown when no record exists or it cannot be read.
    core::ControlState current(const core::EntityKey& entity);

    // Polls every poll interval until a record exists; Unknown after timeout.
    core::ControlState read(const core::EntityKey& entity,
                            std::chrono::milliseconds timeout,
                            std::chrono::milliseconds poll = std::chrono::milliseconds(1000));

    /**
     * @brief Poll until predicate(state) holds, the timeout passes, or cancel is set.
     * The predicate sees Unknown while no record exists.
     */
    WaitResult wait_for(const core::EntityKey& entity,
                        const StatePredicate& predicate,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds poll,
                        const std::atomic<bool>* cancel = nullptr);

    // Clears a stale record before relaunch. A pending START is kept.
    core::Status reset_for_launch(const core::EntityKey& entity);

    void set_sleeper(core::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

protected:
    void pause(std::chrono::milliseconds delay) const;

private:
    core::Sleeper sleeper_ = core::sleep_for_ms;
};

} // namespace candlecast::control
