#include "control/control_plane.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

namespace candlecast::control {

nlohmann::json to_json(const ControlRecord& record) {
    return nlohmann::json{
        {"crypto", record.entity.symbol},
        {"model", record.entity.model},
        {"version", record.entity.version},
        {"state", core::to_string(record.state)},
        {"error_message", record.error_message},
        {"updated_at", core::format_iso8601(record.updated_at_ms)},
        {"updated_at_ms", record.updated_at_ms},
    };
}

core::Expected<ControlRecord> record_from_json(const nlohmann::json& body) {
    if (!body.is_object()) return core::make_error(core::ErrorCode::Parse, "control record is not an object");
    ControlRecord record;
    auto text = [&](const char* key) -> std::string {
        auto it = body.find(key);
        return (it != body.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };
    record.entity.symbol = text("crypto");
    record.entity.model = text("model");
    record.entity.version = text("version");
    if (record.entity.symbol.empty() || record.entity.model.empty() || record.entity.version.empty()) {
        return core::make_error(core::ErrorCode::Parse, "control record without entity fields");
    }
    if (!core::parse_control_state(text("state"), &record.state)) {
        return core::make_error(core::ErrorCode::Parse, "unknown control state '" + text("state") + "'");
    }
    record.error_message = text("error_message");
    if (record.error_message.empty()) record.error_message = text("error_msg");
    auto ms = body.find("updated_at_ms");
    if (ms != body.end() && ms->is_number_integer()) record.updated_at_ms = ms->get<int64_t>();
    return record;
}

core::Status ControlPlane::write(const core::EntityKey& entity, core::ControlState state,
                                 std::optional<std::string> error) {
    ControlRecord record;
    record.entity = entity;
    record.state = state;
    if (error) {
        record.error_message = *error;
    } else {
        auto existing = load(entity);
        if (existing && existing.value()) {
            record.error_message = existing.value()->error_message;
        }
    }
    record.updated_at_ms = core::unix_now_ms();
    core::Status status = save(record);
    if (status) {
        audit::log_audit("state " + entity.id() + " -> " + core::to_string(state) +
                         (record.error_message.empty() ? std::string() : " (" + record.error_message + ")"));
    } else {
        audit::log_error("Failed to write state for " + entity.id() + ": " + status.message());
    }
    return status;
}

core::ControlState ControlPlane::current(const core::EntityKey& entity) {
    auto record = load(entity);
    if (!record) {
        audit::log_warn("Failed to read state for " + entity.id() + ": " + record.message());
        return core::ControlState::Unknown;
    }
    if (!record.value()) return core::ControlState::Unknown;
    return record.value()->state;
}

core::ControlState ControlPlane::read(const core::EntityKey& entity,
                                      std::chrono::milliseconds timeout,
                                      std::chrono::milliseconds poll) {
    WaitResult result = wait_for(entity,
                                 [](core::ControlState s) { return s != core::ControlState::Unknown; },
                                 timeout, poll);
    return result.state;
}

WaitResult ControlPlane::wait_for(const core::EntityKey& entity,
                                  const StatePredicate& predicate,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds poll,
                                  const std::atomic<bool>* cancel) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    if (poll.count() <= 0) poll = std::chrono::milliseconds(1);
    // A sleeper that does not advance the clock still terminates after this many polls.
    const int64_t max_polls = timeout.count() / poll.count() + 1;

    WaitResult result;
    for (int64_t polls = 0;; ++polls) {
        result.state = current(entity);
        if (predicate(result.state)) {
            result.satisfied = true;
            return result;
        }
        if (cancel && cancel->load()) {
            result.cancelled = true;
            return result;
        }
        if (clock::now() >= deadline || polls >= max_polls) {
            return result;
        }
        pause(poll);
    }
}

core::Status ControlPlane::reset_for_launch(const core::EntityKey& entity) {
    auto record = load(entity);
    if (record && record.value() && record.value()->state == core::ControlState::Start) {
        return core::Status::ok();
    }
    return remove(entity);
}

void ControlPlane::pause(std::chrono::milliseconds delay) const {
    if (sleeper_) sleeper_(delay);
}

} // namespace candlecast::control
