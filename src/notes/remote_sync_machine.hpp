#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace daybook::notes {

class NoteRepository;

/**
 * What the reconciler knows about the active date. `repository` is only
 * compared for identity.
 */
struct RemoteSyncInputs {
    std::optional<std::string> date;
    const NoteRepository* repository{nullptr};
    bool can_refresh{false};      // repository offers refresh_note
    bool has_remote_index{false}; // repository offers has_remote_date_cached
    bool online{false};
    std::string local_content;
    bool has_local_edits{false};
    bool is_local_ready{false};

    bool operator==(const RemoteSyncInputs&) const = default;
};

enum class RemotePhase {
    Idle,
    CheckingCache,
    Refreshing
};

struct RemoteCacheResult {
    std::string date;
    bool has_remote{false};

    bool operator==(const RemoteCacheResult&) const = default;
};

struct RemoteSyncState {
    RemotePhase phase{RemotePhase::Idle};
    RemoteSyncInputs inputs;
    std::optional<RemoteCacheResult> remote_cache;
    std::optional<std::string> refreshed_date;
    // Identifies the outstanding check or refresh; results carrying any
    // other id are stale.
    uint64_t request{0};

    bool operator==(const RemoteSyncState&) const = default;
};

namespace remote_event {

struct InputsChanged { RemoteSyncInputs inputs; };
struct ForceRefresh {};
struct CacheChecked { uint64_t request; std::string date; bool has_remote; };
struct CheckFailed { uint64_t request; };
struct Refreshed { uint64_t request; std::string content; };
struct RefreshSkipped { uint64_t request; };

} // namespace remote_event

using RemoteSyncEvent = std::variant<
    remote_event::InputsChanged,
    remote_event::ForceRefresh,
    remote_event::CacheChecked,
    remote_event::CheckFailed,
    remote_event::Refreshed,
    remote_event::RefreshSkipped>;

namespace remote_effect {

struct CheckRemoteCache {
    uint64_t request;
    std::string date;

    bool operator==(const CheckRemoteCache&) const = default;
};

struct StartRefresh {
    uint64_t request;
    std::string date;

    bool operator==(const StartRefresh&) const = default;
};

/**
 * Replace the local content with the refreshed remote content.
 */
struct ApplyRemoteContent {
    std::string date;
    std::string content;

    bool operator==(const ApplyRemoteContent&) const = default;
};

} // namespace remote_effect

using RemoteSyncEffect = std::variant<
    remote_effect::CheckRemoteCache,
    remote_effect::StartRefresh,
    remote_effect::ApplyRemoteContent>;

struct RemoteSyncTransition {
    RemoteSyncState state;
    std::vector<RemoteSyncEffect> effects;
};

/**
 * Pure transition function of remote reconciliation for the active date.
 *
 * Offline with empty local content it asks the remote date index whether
 * the note exists elsewhere; online it refreshes the date once (until the
 * date or repository changes, or ForceRefresh). A refresh result is
 * dropped when the inputs changed since it was requested or the user has
 * local edits.
 */
[[nodiscard]] RemoteSyncTransition reduce(const RemoteSyncState& state,
                                          const RemoteSyncEvent& event);

/**
 * True when the active date is known to exist remotely but has no local
 * content and the device is offline.
 */
[[nodiscard]] bool is_known_remote_only(const RemoteSyncState& state);

} // namespace daybook::notes
