#include "notes/remote_sync_machine.hpp"

#include <type_traits>

namespace daybook::notes {

namespace {

bool should_check_remote_cache(const RemoteSyncInputs& in) {
    return in.date && in.repository && in.is_local_ready && !in.online &&
           in.local_content.empty() && in.has_remote_index;
}

bool should_refresh(const RemoteSyncState& state) {
    const auto& in = state.inputs;
    return in.date && in.repository && in.can_refresh && in.online && in.is_local_ready &&
           state.refreshed_date != in.date;
}

// Enter whichever activity the current inputs call for. Leaving a working
// phase invalidates its outstanding request.
void decide(RemoteSyncTransition& out) {
    auto& state = out.state;
    if (should_check_remote_cache(state.inputs)) {
        state.phase = RemotePhase::CheckingCache;
        state.request += 1;
        out.effects.emplace_back(remote_effect::CheckRemoteCache{state.request, *state.inputs.date});
    } else if (should_refresh(state)) {
        state.phase = RemotePhase::Refreshing;
        state.request += 1;
        state.refreshed_date = state.inputs.date;
        out.effects.emplace_back(remote_effect::StartRefresh{state.request, *state.inputs.date});
    } else {
        if (state.phase != RemotePhase::Idle) {
            state.request += 1;
        }
        state.phase = RemotePhase::Idle;
    }
}

} // namespace

RemoteSyncTransition reduce(const RemoteSyncState& state, const RemoteSyncEvent& event) {
    namespace ev = remote_event;

    return std::visit([&state](const auto& e) -> RemoteSyncTransition {
        using T = std::decay_t<decltype(e)>;
        RemoteSyncTransition out{state, {}};
        auto& next = out.state;

        if constexpr (std::is_same_v<T, ev::InputsChanged>) {
            if (e.inputs == state.inputs && state.phase != RemotePhase::Idle) {
                return out;
            }
            const bool context_changed = e.inputs.date != state.inputs.date ||
                                         e.inputs.repository != state.inputs.repository;
            if (context_changed || !e.inputs.date || !e.inputs.repository) {
                next.refreshed_date.reset();
            }
            if (context_changed) {
                next.remote_cache.reset();
            }
            next.inputs = e.inputs;
            decide(out);
        } else if constexpr (std::is_same_v<T, ev::ForceRefresh>) {
            next.refreshed_date.reset();
            decide(out);
        } else if constexpr (std::is_same_v<T, ev::CacheChecked>) {
            if (state.phase == RemotePhase::CheckingCache && e.request == state.request) {
                next.phase = RemotePhase::Idle;
                next.remote_cache = RemoteCacheResult{e.date, e.has_remote};
            }
        } else if constexpr (std::is_same_v<T, ev::CheckFailed>) {
            if (state.phase == RemotePhase::CheckingCache && e.request == state.request) {
                next.phase = RemotePhase::Idle;
            }
        } else if constexpr (std::is_same_v<T, ev::Refreshed>) {
            if (state.phase == RemotePhase::Refreshing && e.request == state.request) {
                next.phase = RemotePhase::Idle;
                if (!state.inputs.has_local_edits && e.content != state.inputs.local_content) {
                    out.effects.emplace_back(
                        remote_effect::ApplyRemoteContent{*state.inputs.date, e.content});
                }
            }
        } else if constexpr (std::is_same_v<T, ev::RefreshSkipped>) {
            if (state.phase == RemotePhase::Refreshing && e.request == state.request) {
                next.phase = RemotePhase::Idle;
            }
        }
        return out;
    }, event);
}

bool is_known_remote_only(const RemoteSyncState& state) {
    const auto& in = state.inputs;
    return !in.online && in.local_content.empty() && in.is_local_ready &&
           state.remote_cache && in.date && state.remote_cache->date == *in.date &&
           state.remote_cache->has_remote;
}

} // namespace daybook::notes
