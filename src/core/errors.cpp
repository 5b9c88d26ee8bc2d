#include "core/errors.hpp"

namespace daybook {

std::string format_sync_error(const SyncError& error) {
    switch (error.kind) {
        case SyncErrorKind::Offline: return "Offline";
        case SyncErrorKind::Conflict: return "Conflict detected";
        case SyncErrorKind::RemoteRejected: return "Remote rejected changes";
        case SyncErrorKind::Unknown: return "Sync failed";
    }
    return "Sync failed";
}

const char* to_string(RepositoryErrorKind kind) noexcept {
    switch (kind) {
        case RepositoryErrorKind::IO: return "IO";
        case RepositoryErrorKind::DecryptFailed: return "DecryptFailed";
        case RepositoryErrorKind::EncryptFailed: return "EncryptFailed";
        case RepositoryErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* to_string(SyncErrorKind kind) noexcept {
    switch (kind) {
        case SyncErrorKind::Offline: return "Offline";
        case SyncErrorKind::Conflict: return "Conflict";
        case SyncErrorKind::RemoteRejected: return "RemoteRejected";
        case SyncErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace daybook
