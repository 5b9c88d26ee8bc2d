#pragma once

#include <QString>
#include <chrono>

class QSettings;

namespace daybook::config {

/**
 * SyncSettings - timing knobs of the editing and sync pipeline.
 */
struct SyncSettings {
    bool enabled = true;
    std::chrono::milliseconds save_debounce{400};
    std::chrono::milliseconds sync_debounce{2000};
    std::chrono::milliseconds idle_sync_delay{4000};
    std::chrono::milliseconds pending_ops_poll{5000};
    std::chrono::milliseconds operation_timeout{30000};
    std::chrono::milliseconds refresh_dates_cooldown{2000};
    std::chrono::milliseconds remote_change_debounce{500};

    /**
     * Read `sync/...` keys from QSettings, then apply DAYBOOK_* environment
     * overrides. Missing, malformed or non-positive values keep defaults.
     */
    [[nodiscard]] static SyncSettings load();
    [[nodiscard]] static SyncSettings load(QSettings& settings);

    void save() const;
    void save(QSettings& settings) const;

    bool operator==(const SyncSettings&) const = default;
};

/**
 * Local database location: DAYBOOK_DB_PATH if set, otherwise
 * `<AppLocalDataLocation>/daybook.db`. Creates the parent directory.
 */
[[nodiscard]] QString resolve_database_path();

} // namespace daybook::config
