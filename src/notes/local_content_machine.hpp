#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace daybook::notes {

enum class LocalPhase {
    Idle,
    Loading,
    Ready,
    Dirty,
    Saving,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LocalPhase phase) {
    switch (phase) {
        case LocalPhase::Idle: return "idle";
        case LocalPhase::Loading: return "loading";
        case LocalPhase::Ready: return "ready";
        case LocalPhase::Dirty: return "dirty";
        case LocalPhase::Saving: return "saving";
        case LocalPhase::Error: return "error";
    }
    return "unknown";
}

/**
 * Editing state of the active date.
 */
struct LocalContentState {
    LocalPhase phase{LocalPhase::Idle};
    std::optional<std::string> date;
    std::string content;
    bool has_edits{false};
    std::optional<std::string> error;

    bool operator==(const LocalContentState&) const = default;

    /**
     * Loaded (or failed to load) and accepting edits.
     */
    [[nodiscard]] bool is_ready() const noexcept {
        return phase != LocalPhase::Idle && phase != LocalPhase::Loading;
    }
};

namespace local_event {

struct Reset {};
struct LoadStart { std::string date; };
struct LoadSucceeded { std::string date; std::string content; };
struct LoadFailed { std::string date; std::string message; };
struct Edit { std::string content; };
struct RemoteUpdate { std::string date; std::string content; };
struct DebounceElapsed {};
struct Flush {};
struct SaveSucceeded { std::string date; std::string content; };
struct SaveFailed { std::string date; std::string content; std::string message; };

} // namespace local_event

using LocalContentEvent = std::variant<
    local_event::Reset,
    local_event::LoadStart,
    local_event::LoadSucceeded,
    local_event::LoadFailed,
    local_event::Edit,
    local_event::RemoteUpdate,
    local_event::DebounceElapsed,
    local_event::Flush,
    local_event::SaveSucceeded,
    local_event::SaveFailed>;

namespace local_effect {

struct StartLoad { std::string date; };
struct ArmDebounce {};
struct CancelDebounce {};

/**
 * Persist `content` for `date`; `is_delete` when the content is empty.
 */
struct EnqueueSave {
    std::string date;
    std::string content;
    bool is_delete{false};

    bool operator==(const EnqueueSave&) const = default;
};

inline bool operator==(const StartLoad& a, const StartLoad& b) { return a.date == b.date; }
inline bool operator==(const ArmDebounce&, const ArmDebounce&) { return true; }
inline bool operator==(const CancelDebounce&, const CancelDebounce&) { return true; }

} // namespace local_effect

using LocalContentEffect = std::variant<
    local_effect::StartLoad,
    local_effect::ArmDebounce,
    local_effect::CancelDebounce,
    local_effect::EnqueueSave>;

struct LocalContentTransition {
    LocalContentState state;
    std::vector<LocalContentEffect> effects;
};

/**
 * Pure transition function of the per-date editing lifecycle:
 *
 *   idle -> loading -> ready <-> dirty -> saving -> ready
 *
 * with error reachable from loading. Only a state carrying user edits ever
 * yields EnqueueSave, so loads, resets and remote updates never write.
 * Results for a date other than the current one are ignored.
 */
[[nodiscard]] LocalContentTransition reduce(const LocalContentState& state,
                                            const LocalContentEvent& event);

} // namespace daybook::notes
