#include "notes/local_content_machine.hpp"
#include "core/sanitize.hpp"

#include <type_traits>

namespace daybook::notes {

namespace {

bool accepts_edits(LocalPhase phase) {
    return phase == LocalPhase::Ready || phase == LocalPhase::Dirty ||
           phase == LocalPhase::Saving || phase == LocalPhase::Error;
}

local_effect::EnqueueSave save_of(const LocalContentState& state) {
    return local_effect::EnqueueSave{*state.date, state.content, is_content_empty(state.content)};
}

} // namespace

LocalContentTransition reduce(const LocalContentState& state, const LocalContentEvent& event) {
    namespace ev = local_event;
    namespace fx = local_effect;

    return std::visit([&state](const auto& e) -> LocalContentTransition {
        using T = std::decay_t<decltype(e)>;
        LocalContentTransition out{state, {}};
        auto& next = out.state;

        if constexpr (std::is_same_v<T, ev::Reset>) {
            next = LocalContentState{};
            out.effects.emplace_back(fx::CancelDebounce{});
        } else if constexpr (std::is_same_v<T, ev::LoadStart>) {
            next = LocalContentState{LocalPhase::Loading, e.date, "", false, std::nullopt};
            out.effects.emplace_back(fx::CancelDebounce{});
            out.effects.emplace_back(fx::StartLoad{e.date});
        } else if constexpr (std::is_same_v<T, ev::LoadSucceeded>) {
            if (state.phase == LocalPhase::Loading && state.date == e.date) {
                next = LocalContentState{LocalPhase::Ready, e.date, e.content, false, std::nullopt};
            }
        } else if constexpr (std::is_same_v<T, ev::LoadFailed>) {
            if (state.phase == LocalPhase::Loading && state.date == e.date) {
                next = LocalContentState{LocalPhase::Error, e.date, "", false, e.message};
            }
        } else if constexpr (std::is_same_v<T, ev::Edit>) {
            if (accepts_edits(state.phase)) {
                next.phase = LocalPhase::Dirty;
                next.has_edits = state.has_edits || e.content != state.content;
                next.content = e.content;
                next.error.reset();
                out.effects.emplace_back(fx::ArmDebounce{});
            }
        } else if constexpr (std::is_same_v<T, ev::RemoteUpdate>) {
            const bool settled = state.phase == LocalPhase::Ready ||
                                 state.phase == LocalPhase::Error ||
                                 state.phase == LocalPhase::Dirty;
            if (settled && state.date == e.date && !state.has_edits) {
                if (state.phase == LocalPhase::Dirty) {
                    out.effects.emplace_back(fx::CancelDebounce{});
                }
                next = LocalContentState{LocalPhase::Ready, e.date, e.content, false, std::nullopt};
            }
        } else if constexpr (std::is_same_v<T, ev::DebounceElapsed>) {
            // Ready with edits is a failed save waiting for its retry.
            const bool retry = state.phase == LocalPhase::Ready && state.has_edits;
            if (state.phase == LocalPhase::Dirty || retry) {
                if (state.has_edits && state.date) {
                    next.phase = LocalPhase::Saving;
                    out.effects.emplace_back(save_of(state));
                } else {
                    next.phase = LocalPhase::Ready;
                }
            }
        } else if constexpr (std::is_same_v<T, ev::Flush>) {
            const bool flushable = state.phase == LocalPhase::Dirty ||
                                   state.phase == LocalPhase::Ready ||
                                   state.phase == LocalPhase::Error;
            if (flushable && state.has_edits && state.date) {
                next.phase = LocalPhase::Saving;
                out.effects.emplace_back(fx::CancelDebounce{});
                out.effects.emplace_back(save_of(state));
            } else if (state.phase == LocalPhase::Dirty) {
                next.phase = LocalPhase::Ready;
                out.effects.emplace_back(fx::CancelDebounce{});
            }
        } else if constexpr (std::is_same_v<T, ev::SaveSucceeded>) {
            if (state.date == e.date) {
                // A newer edit keeps the note dirty.
                if (state.content == e.content) {
                    next.has_edits = false;
                }
                if (state.phase == LocalPhase::Saving) {
                    next.phase = LocalPhase::Ready;
                    next.error.reset();
                }
            }
        } else if constexpr (std::is_same_v<T, ev::SaveFailed>) {
            if (state.date == e.date && state.phase == LocalPhase::Saving) {
                next.phase = LocalPhase::Ready;
                next.error = e.message;
                out.effects.emplace_back(fx::ArmDebounce{});
            }
        }
        return out;
    }, event);
}

} // namespace daybook::notes
