#include "control/file_control_plane.hpp"
#include "control/store_control_plane.hpp"
#include "store/memory_document_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace {

using namespace candlecast;
using core::ControlState;
using std::chrono::milliseconds;

void exercise(control::ControlPlane& plane) {
    const core::EntityKey entity = core::EntityKey::consumer("BTCUSDT", "lightgbm", "v1");
    const core::EntityKey producer = core::EntityKey::producer();

    assert(plane.delete_all().is_ok());
    assert(plane.current(entity) == ControlState::Unknown);

    // Error text is kept until the next explicit error.
    assert(plane.write(entity, ControlState::Error, std::string("Model not available")).is_ok());
    assert(plane.write(entity, ControlState::Running).is_ok());
    auto record = plane.load(entity);
    assert(record && record.value());
    assert(record.value()->state == ControlState::Running);
    assert(record.value()->error_message == "Model not available");
    assert(record.value()->updated_at_ms > 0);
    assert(plane.write(entity, ControlState::Running, std::string()).is_ok());
    assert(plane.load(entity).value()->error_message.empty());

    assert(plane.write(producer, ControlState::Running).is_ok());
    auto all = plane.list();
    assert(all && all.value().size() == 2);

    // Rendezvous: the state flips to RUNNING on the third poll.
    int polls = 0;
    assert(plane.write(entity, ControlState::Wait).is_ok());
    plane.set_sleeper([&](milliseconds) {
        if (++polls == 3) {
            core::Status flipped = plane.write(entity, ControlState::Running);
            assert(flipped.is_ok());
        }
    });
    control::WaitResult ready = plane.wait_for(
        entity, [](ControlState s) { return s == ControlState::Running; }, milliseconds(60000), milliseconds(5000));
    assert(ready.satisfied);
    assert(ready.state == ControlState::Running);
    assert(polls == 3);

    // A sleeper that never advances the clock still stops after timeout / poll polls.
    polls = 0;
    plane.set_sleeper([&](milliseconds) { ++polls; });
    control::WaitResult timed_out = plane.wait_for(
        entity, [](ControlState s) { return s == ControlState::Deleted; }, milliseconds(1000), milliseconds(100));
    assert(!timed_out.satisfied && !timed_out.cancelled);
    assert(timed_out.state == ControlState::Running);
    assert(polls == 11);

    std::atomic<bool> cancel{true};
    control::WaitResult cancelled = plane.wait_for(
        entity, [](ControlState s) { return s == ControlState::Deleted; }, milliseconds(60000), milliseconds(100),
        &cancel);
    assert(cancelled.cancelled && !cancelled.satisfied);

    assert(plane.read(core::EntityKey::consumer("ETHUSDT", "tst", "v2"), milliseconds(500), milliseconds(100)) ==
           ControlState::Unknown);
    assert(plane.read(entity, milliseconds(500), milliseconds(100)) == ControlState::Running);

    // Relaunch reset keeps a pending START and clears anything else.
    assert(plane.write(entity, ControlState::Start).is_ok());
    assert(plane.reset_for_launch(entity).is_ok());
    assert(plane.current(entity) == ControlState::Start);
    assert(plane.write(entity, ControlState::Deleted).is_ok());
    assert(plane.reset_for_launch(entity).is_ok());
    assert(plane.current(entity) == ControlState::Unknown);

    assert(plane.remove(producer).is_ok());
    assert(plane.current(producer) == ControlState::Unknown);
    assert(plane.write(producer, ControlState::Delete).is_ok());
    assert(plane.delete_all().is_ok());
    auto none = plane.list();
    assert(none && none.value().empty());
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / ("candlecast_states_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    {
        control::FileControlPlane plane(dir);
        exercise(plane);

        const core::EntityKey entity = core::EntityKey::consumer("BTCUSDT", "tst", "v3");
        assert(plane.write(entity, ControlState::Pause).is_ok());
        assert(plane.path_for(entity) == dir / "BTCUSDT_tst_v3.json");
        assert(fs::exists(plane.path_for(entity)));
    }
    fs::remove_all(dir);

    store::MemoryDocumentStore documents(500);
    control::StoreControlPlane plane(documents);
    exercise(plane);

    documents.fail_reads(core::ErrorCode::Unavailable);
    assert(plane.current(core::EntityKey::producer()) == ControlState::Unknown);
    documents.fail_reads(core::ErrorCode::Ok);

    return 0;
}
