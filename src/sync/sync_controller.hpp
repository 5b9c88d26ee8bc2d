#pragma once

#include "config/sync_settings.hpp"
#include "core/errors.hpp"
#include "core/observer.hpp"
#include "network/connectivity.hpp"
#include "notes/note_repository.hpp"
#include "sync/cancellable_operation.hpp"
#include "sync/intent_scheduler.hpp"
#include "sync/pending_ops.hpp"
#include "sync/sync_phase_machine.hpp"
#include "sync/sync_service.hpp"
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>
#include <memory>

namespace daybook::sync {

/**
 * SyncController - drives the sync phase machine.
 *
 * Owns the intent scheduler, the sync service and the pending-op poller,
 * feeds connectivity and the enabled flag into the machine, and starts a
 * sync whenever the machine is Ready with an intent. Each run is bounded
 * by the operation timeout; a run that times out is reported as failed
 * and its late callbacks are ignored.
 */
class SyncController : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(QString phase READ phase NOTIFY statusChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)
    Q_PROPERTY(QDateTime lastSynced READ lastSynced NOTIFY lastSyncedChanged)
    Q_PROPERTY(int pendingNotes READ pendingNotes NOTIFY pendingOpsChanged)
    Q_PROPERTY(int pendingImages READ pendingImages NOTIFY pendingOpsChanged)
    Q_PROPERTY(int pendingTotal READ pendingTotal NOTIFY pendingOpsChanged)
    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)

public:
    SyncController(std::shared_ptr<notes::SyncCapableRepository> repository,
                   std::shared_ptr<network::Connectivity> connectivity,
                   std::shared_ptr<PendingOpsSource> pending,
                   config::SyncSettings settings,
                   QObject* parent = nullptr);
    ~SyncController() override;

    /**
     * Begin observing connectivity and pending ops. A sync starts right
     * away when enabled and online.
     */
    void start();

    /**
     * Stop timers and the service. Later callbacks are ignored.
     */
    void dispose();

    [[nodiscard]] QString status() const;
    [[nodiscard]] QString phase() const;
    [[nodiscard]] QString lastError() const { return last_error_; }
    [[nodiscard]] QDateTime lastSynced() const { return last_synced_; }
    [[nodiscard]] int pendingNotes() const { return poller_->summary().notes; }
    [[nodiscard]] int pendingImages() const { return poller_->summary().images; }
    [[nodiscard]] int pendingTotal() const { return poller_->summary().total; }
    [[nodiscard]] bool isEnabled() const noexcept { return enabled_; }

    [[nodiscard]] const SyncMachineState& state() const noexcept { return state_; }

    void setEnabled(bool enabled);

    /**
     * Ask for a sync. Non-immediate requests are debounced.
     */
    Q_INVOKABLE void requestSync(bool immediate = false);

    /**
     * Sync after a quiet period, if anything is pending by then. A
     * negative delay uses the configured idle delay.
     */
    Q_INVOKABLE void requestIdleSync(int delayMs = -1);

    /**
     * Another device changed something. Bursts collapse into one
     * immediate sync.
     */
    Q_INVOKABLE void notifyRemoteChange();

    Q_INVOKABLE void syncNow() { requestSync(true); }

signals:
    void statusChanged();
    void lastErrorChanged();
    void lastSyncedChanged();
    void pendingOpsChanged();
    void enabledChanged();
    void syncFailed(const QString& message);

private:
    void dispatch(const SyncMachineEvent& event);
    void dispatch_inputs();
    void on_scheduled(bool immediate);
    void run_sync_now();
    void on_sync_start();
    void on_sync_complete(SyncStatus status);
    void on_sync_error(const SyncError& error);
    void on_timeout();
    void set_last_error(const QString& message);

    config::SyncSettings settings_;
    std::shared_ptr<network::Connectivity> connectivity_;
    std::shared_ptr<SyncService> service_;
    IntentScheduler* scheduler_;
    PendingOpsPoller* poller_;
    QTimer remote_change_timer_;
    Subscription connectivity_sub_;
    std::shared_ptr<CancellableOperation> operation_;

    SyncMachineState state_;
    bool enabled_;
    bool started_ = false;
    bool disposed_ = false;
    bool run_active_ = false;
    QString last_error_;
    QDateTime last_synced_;
};

} // namespace daybook::sync
