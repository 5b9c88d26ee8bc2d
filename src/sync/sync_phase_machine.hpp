#pragma once

#include "core/sync_status.hpp"
#include <optional>
#include <string_view>
#include <variant>

namespace daybook::sync {

enum class SyncPhase {
    Disabled,
    Offline,
    Ready,
    Syncing,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Disabled: return "disabled";
        case SyncPhase::Offline: return "offline";
        case SyncPhase::Ready: return "ready";
        case SyncPhase::Syncing: return "syncing";
        case SyncPhase::Error: return "error";
    }
    return "unknown";
}

struct SyncIntent {
    bool immediate{false};

    bool operator==(const SyncIntent&) const = default;
};

/**
 * Health of sync as a whole. `intent` is a sync the machine wants run as
 * soon as something dispatches it.
 */
struct SyncMachineState {
    SyncPhase phase{SyncPhase::Disabled};
    SyncStatus status{SyncStatus::Idle};
    std::optional<SyncIntent> intent;

    bool operator==(const SyncMachineState&) const = default;
};

namespace sync_event {

struct InputsChanged { bool enabled; bool online; };
struct SyncRequested { SyncIntent intent; };
struct SyncDispatched {};
struct SyncStarted {};
struct SyncFinished { SyncStatus status; };

} // namespace sync_event

using SyncMachineEvent = std::variant<
    sync_event::InputsChanged,
    sync_event::SyncRequested,
    sync_event::SyncDispatched,
    sync_event::SyncStarted,
    sync_event::SyncFinished>;

/**
 * Pure transition function of the sync phase machine.
 *
 * Disabling always lands in Disabled, going offline lands in Offline
 * (unless disabled), and every return to Ready from Disabled, Offline or
 * Error carries an immediate intent.
 */
[[nodiscard]] SyncMachineState reduce(const SyncMachineState& state, const SyncMachineEvent& event);

} // namespace daybook::sync
