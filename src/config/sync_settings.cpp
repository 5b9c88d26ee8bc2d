#include "config/sync_settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace daybook::config {

namespace {

constexpr const char* kSettingsEnabled = "sync/enabled";
constexpr const char* kSettingsSaveDebounce = "sync/save_debounce_ms";
constexpr const char* kSettingsSyncDebounce = "sync/sync_debounce_ms";
constexpr const char* kSettingsIdleSync = "sync/idle_sync_ms";
constexpr const char* kSettingsPendingPoll = "sync/pending_ops_poll_ms";
constexpr const char* kSettingsOpTimeout = "sync/op_timeout_ms";
constexpr const char* kSettingsDatesCooldown = "sync/refresh_dates_cooldown_ms";
constexpr const char* kSettingsRemoteDebounce = "sync/remote_change_debounce_ms";

void read_millis(QSettings& settings, const char* key, std::chrono::milliseconds& target) {
    const auto stored = settings.value(QString::fromLatin1(key));
    if (!stored.isValid()) return;
    bool ok = false;
    const auto value = stored.toLongLong(&ok);
    if (ok && value > 0) {
        target = std::chrono::milliseconds(value);
    }
}

void env_millis(const char* name, std::chrono::milliseconds& target) {
    if (!qEnvironmentVariableIsSet(name)) return;
    bool ok = false;
    const auto value = qEnvironmentVariable(name).trimmed().toLongLong(&ok);
    if (ok && value > 0) {
        target = std::chrono::milliseconds(value);
    }
}

void write_millis(QSettings& settings, const char* key, std::chrono::milliseconds value) {
    settings.setValue(QString::fromLatin1(key), static_cast<qlonglong>(value.count()));
}

} // namespace

SyncSettings SyncSettings::load() {
    QSettings settings;
    return load(settings);
}

SyncSettings SyncSettings::load(QSettings& settings) {
    SyncSettings out;
    out.enabled = settings.value(QString::fromLatin1(kSettingsEnabled), out.enabled).toBool();
    read_millis(settings, kSettingsSaveDebounce, out.save_debounce);
    read_millis(settings, kSettingsSyncDebounce, out.sync_debounce);
    read_millis(settings, kSettingsIdleSync, out.idle_sync_delay);
    read_millis(settings, kSettingsPendingPoll, out.pending_ops_poll);
    read_millis(settings, kSettingsOpTimeout, out.operation_timeout);
    read_millis(settings, kSettingsDatesCooldown, out.refresh_dates_cooldown);
    read_millis(settings, kSettingsRemoteDebounce, out.remote_change_debounce);

    env_millis("DAYBOOK_SYNC_DEBOUNCE_MS", out.sync_debounce);
    env_millis("DAYBOOK_IDLE_SYNC_MS", out.idle_sync_delay);
    env_millis("DAYBOOK_SAVE_DEBOUNCE_MS", out.save_debounce);
    env_millis("DAYBOOK_OP_TIMEOUT_MS", out.operation_timeout);
    return out;
}

void SyncSettings::save() const {
    QSettings settings;
    save(settings);
}

void SyncSettings::save(QSettings& settings) const {
    settings.setValue(QString::fromLatin1(kSettingsEnabled), enabled);
    write_millis(settings, kSettingsSaveDebounce, save_debounce);
    write_millis(settings, kSettingsSyncDebounce, sync_debounce);
    write_millis(settings, kSettingsIdleSync, idle_sync_delay);
    write_millis(settings, kSettingsPendingPoll, pending_ops_poll);
    write_millis(settings, kSettingsOpTimeout, operation_timeout);
    write_millis(settings, kSettingsDatesCooldown, refresh_dates_cooldown);
    write_millis(settings, kSettingsRemoteDebounce, remote_change_debounce);
}

QString resolve_database_path() {
    const auto overridePath = qEnvironmentVariable("DAYBOOK_DB_PATH");
    if (!overridePath.isEmpty()) {
        QFileInfo info(overridePath);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dir.filePath(QStringLiteral("daybook.db"));
}

} // namespace daybook::config
