#include "notes/conflict_policy.hpp"
#include "core/types.hpp"

namespace daybook::notes {

ConflictResolution LastWriteWinsPolicy::resolve(
    const NoteRecord& local,
    const NoteMeta& /*meta*/,
    const std::optional<RemoteNote>& remote) {
    if (!remote || remote->deleted) {
        return ConflictResolution::KeepLocal;
    }
    auto local_time = Timestamp::from_iso_string(local.updated_at);
    auto remote_time = Timestamp::from_iso_string(remote->updated_at);
    if (!local_time) {
        return ConflictResolution::KeepRemote;
    }
    if (!remote_time) {
        return ConflictResolution::KeepLocal;
    }
    return *local_time > *remote_time ? ConflictResolution::KeepLocal
                                      : ConflictResolution::KeepRemote;
}

} // namespace daybook::notes
