#pragma once

namespace daybook {

/**
 * Health of sync as a whole, as reported by a sync-capable repository.
 */
enum class SyncStatus {
    Idle,
    Syncing,
    Synced,
    Offline,
    Error
};

[[nodiscard]] constexpr const char* to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Offline: return "offline";
        case SyncStatus::Error: return "error";
    }
    return "idle";
}

} // namespace daybook
