#include "sync/sync_phase_machine.hpp"

#include <type_traits>

namespace daybook::sync {

namespace {

SyncMachineState disabled() {
    return {SyncPhase::Disabled, SyncStatus::Idle, std::nullopt};
}

SyncMachineState offline() {
    return {SyncPhase::Offline, SyncStatus::Offline, std::nullopt};
}

SyncMachineState ready_with_immediate_intent() {
    return {SyncPhase::Ready, SyncStatus::Idle, SyncIntent{true}};
}

} // namespace

SyncMachineState reduce(const SyncMachineState& state, const SyncMachineEvent& event) {
    namespace ev = sync_event;

    return std::visit([&state](const auto& e) -> SyncMachineState {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, ev::InputsChanged>) {
            if (!e.enabled) {
                return state.phase == SyncPhase::Disabled ? state : disabled();
            }
            if (!e.online) {
                return state.phase == SyncPhase::Offline ? state : offline();
            }
            switch (state.phase) {
                case SyncPhase::Disabled:
                case SyncPhase::Offline:
                case SyncPhase::Error:
                    return ready_with_immediate_intent();
                case SyncPhase::Ready:
                case SyncPhase::Syncing:
                    return state;
            }
            return state;
        } else if constexpr (std::is_same_v<T, ev::SyncRequested>) {
            auto next = state;
            if (state.phase == SyncPhase::Ready) {
                next.intent = e.intent;
            } else if (state.phase == SyncPhase::Syncing) {
                next.intent.reset();
            }
            return next;
        } else if constexpr (std::is_same_v<T, ev::SyncDispatched>) {
            auto next = state;
            if (state.phase == SyncPhase::Ready) {
                next.intent.reset();
            }
            return next;
        } else if constexpr (std::is_same_v<T, ev::SyncStarted>) {
            if (state.phase != SyncPhase::Ready) {
                return state;
            }
            return {SyncPhase::Syncing, SyncStatus::Syncing, std::nullopt};
        } else if constexpr (std::is_same_v<T, ev::SyncFinished>) {
            if (state.phase == SyncPhase::Ready) {
                return {SyncPhase::Ready, e.status, std::nullopt};
            }
            if (state.phase != SyncPhase::Syncing) {
                return state;
            }
            if (e.status == SyncStatus::Offline) {
                return offline();
            }
            if (e.status == SyncStatus::Error) {
                return {SyncPhase::Error, SyncStatus::Error, std::nullopt};
            }
            return {SyncPhase::Ready, e.status, std::nullopt};
        }
    }, event);
}

} // namespace daybook::sync
