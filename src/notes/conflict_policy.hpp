#pragma once

#include "core/note.hpp"
#include <optional>

namespace daybook::notes {

enum class ConflictResolution {
    KeepLocal,   // re-push local content over the server's current revision
    KeepRemote,  // adopt the server row (or its deletion) locally
    Surface      // stop the sync run with SyncErrorKind::Conflict
};

[[nodiscard]] constexpr const char* to_string(ConflictResolution resolution) noexcept {
    switch (resolution) {
        case ConflictResolution::KeepLocal: return "keep-local";
        case ConflictResolution::KeepRemote: return "keep-remote";
        case ConflictResolution::Surface: return "surface";
    }
    return "unknown";
}

/**
 * ConflictPolicy - decides what happens when a push is rejected as stale.
 *
 * Without a policy the engine surfaces every conflict.
 */
class ConflictPolicy {
public:
    virtual ~ConflictPolicy() = default;

    [[nodiscard]] virtual ConflictResolution resolve(
        const NoteRecord& local,
        const NoteMeta& meta,
        const std::optional<RemoteNote>& remote) = 0;
};

/**
 * Newer updated_at wins; a missing or tombstoned remote row loses to the
 * local edit. Ties keep the remote row.
 */
class LastWriteWinsPolicy : public ConflictPolicy {
public:
    [[nodiscard]] ConflictResolution resolve(
        const NoteRecord& local,
        const NoteMeta& meta,
        const std::optional<RemoteNote>& remote) override;
};

} // namespace daybook::notes
