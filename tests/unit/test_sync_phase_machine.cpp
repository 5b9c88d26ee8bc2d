#include <catch2/catch_test_macros.hpp>
#include "sync/sync_phase_machine.hpp"

using namespace daybook;
using namespace daybook::sync;

namespace {

SyncMachineState run(SyncMachineState state, std::initializer_list<SyncMachineEvent> events) {
    for (const auto& e : events) {
        state = reduce(state, e);
    }
    return state;
}

const SyncMachineState kReady{SyncPhase::Ready, SyncStatus::Idle, std::nullopt};
const SyncMachineState kSyncing{SyncPhase::Syncing, SyncStatus::Syncing, std::nullopt};

} // namespace

TEST_CASE("Sync phase: becoming ready carries an immediate intent", "[sync][phase]") {
    SECTION("from disabled") {
        auto s = reduce(SyncMachineState{}, sync_event::InputsChanged{true, true});
        REQUIRE(s == SyncMachineState{SyncPhase::Ready, SyncStatus::Idle, SyncIntent{true}});
    }

    SECTION("from offline") {
        SyncMachineState offline{SyncPhase::Offline, SyncStatus::Offline, std::nullopt};
        auto s = reduce(offline, sync_event::InputsChanged{true, true});
        REQUIRE(s.phase == SyncPhase::Ready);
        REQUIRE(s.intent == SyncIntent{true});
    }

    SECTION("from error") {
        SyncMachineState error{SyncPhase::Error, SyncStatus::Error, std::nullopt};
        auto s = reduce(error, sync_event::InputsChanged{true, true});
        REQUIRE(s.phase == SyncPhase::Ready);
        REQUIRE(s.status == SyncStatus::Idle);
        REQUIRE(s.intent == SyncIntent{true});
    }

    SECTION("not when already ready or syncing") {
        REQUIRE(reduce(kReady, sync_event::InputsChanged{true, true}) == kReady);
        REQUIRE(reduce(kSyncing, sync_event::InputsChanged{true, true}) == kSyncing);
    }
}

TEST_CASE("Sync phase: disabling and going offline win from any phase", "[sync][phase]") {
    const SyncMachineState phases[] = {
        SyncMachineState{},
        SyncMachineState{SyncPhase::Offline, SyncStatus::Offline, std::nullopt},
        SyncMachineState{SyncPhase::Ready, SyncStatus::Synced, SyncIntent{false}},
        kSyncing,
        SyncMachineState{SyncPhase::Error, SyncStatus::Error, std::nullopt},
    };

    for (const auto& start : phases) {
        auto disabled = reduce(start, sync_event::InputsChanged{false, true});
        REQUIRE(disabled.phase == SyncPhase::Disabled);

        auto disabled_offline = reduce(start, sync_event::InputsChanged{false, false});
        REQUIRE(disabled_offline.phase == SyncPhase::Disabled);

        auto offline = reduce(start, sync_event::InputsChanged{true, false});
        REQUIRE(offline == SyncMachineState{SyncPhase::Offline, SyncStatus::Offline, std::nullopt});
    }
}

TEST_CASE("Sync phase: requests record intent while ready", "[sync][phase]") {
    auto s = reduce(kReady, sync_event::SyncRequested{SyncIntent{false}});
    REQUIRE(s.phase == SyncPhase::Ready);
    REQUIRE(s.intent == SyncIntent{false});

    s = reduce(s, sync_event::SyncDispatched{});
    REQUIRE_FALSE(s.intent.has_value());

    SECTION("ignored while offline or disabled") {
        SyncMachineState offline{SyncPhase::Offline, SyncStatus::Offline, std::nullopt};
        REQUIRE(reduce(offline, sync_event::SyncRequested{SyncIntent{true}}) == offline);
        REQUIRE(reduce(SyncMachineState{}, sync_event::SyncRequested{SyncIntent{true}}) ==
                SyncMachineState{});
    }
}

TEST_CASE("Sync phase: a run routes by its final status", "[sync][phase]") {
    auto syncing = reduce(kReady, sync_event::SyncStarted{});
    REQUIRE(syncing == kSyncing);

    SECTION("synced returns to ready") {
        auto s = reduce(syncing, sync_event::SyncFinished{SyncStatus::Synced});
        REQUIRE(s == SyncMachineState{SyncPhase::Ready, SyncStatus::Synced, std::nullopt});
    }

    SECTION("offline status goes offline") {
        auto s = reduce(syncing, sync_event::SyncFinished{SyncStatus::Offline});
        REQUIRE(s.phase == SyncPhase::Offline);
        REQUIRE(s.status == SyncStatus::Offline);
    }

    SECTION("error status goes to error") {
        auto s = reduce(syncing, sync_event::SyncFinished{SyncStatus::Error});
        REQUIRE(s.phase == SyncPhase::Error);
    }

    SECTION("started is ignored outside ready") {
        SyncMachineState offline{SyncPhase::Offline, SyncStatus::Offline, std::nullopt};
        REQUIRE(reduce(offline, sync_event::SyncStarted{}) == offline);
    }
}

TEST_CASE("Sync phase: a full online session", "[sync][phase]") {
    auto s = run(SyncMachineState{}, {
        sync_event::InputsChanged{true, true},
        sync_event::SyncDispatched{},
        sync_event::SyncStarted{},
        sync_event::SyncRequested{SyncIntent{false}},
        sync_event::SyncFinished{SyncStatus::Synced},
        sync_event::InputsChanged{true, false},
        sync_event::InputsChanged{true, true},
    });
    REQUIRE(s == SyncMachineState{SyncPhase::Ready, SyncStatus::Idle, SyncIntent{true}});
}

TEST_CASE("Sync phase names", "[sync][phase]") {
    REQUIRE(to_string(SyncPhase::Disabled) == "disabled");
    REQUIRE(to_string(SyncPhase::Syncing) == "syncing");
    REQUIRE(to_string(SyncPhase::Error) == "error");
}
