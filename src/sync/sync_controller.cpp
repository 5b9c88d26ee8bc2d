#include "sync/sync_controller.hpp"

#include <QDebug>
#include <QPointer>

namespace daybook::sync {

SyncController::SyncController(std::shared_ptr<notes::SyncCapableRepository> repository,
                               std::shared_ptr<network::Connectivity> connectivity,
                               std::shared_ptr<PendingOpsSource> pending,
                               config::SyncSettings settings,
                               QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , connectivity_(std::move(connectivity))
    , scheduler_(new IntentScheduler(pending,
                                     IntentScheduler::Options{settings.sync_debounce,
                                                              settings.idle_sync_delay},
                                     this))
    , poller_(new PendingOpsPoller(pending, settings.pending_ops_poll, this))
    , enabled_(settings.enabled) {
    QPointer<SyncController> guard(this);
    service_ = std::make_shared<SyncService>(
        std::move(repository),
        SyncService::Callbacks{
            [guard] {
                if (guard) guard->on_sync_start();
            },
            [guard](SyncStatus status) {
                if (guard) guard->on_sync_complete(status);
            },
            [guard](const SyncError& error) {
                if (guard) guard->on_sync_error(error);
            },
        });

    connect(scheduler_, &IntentScheduler::syncRequested, this, &SyncController::on_scheduled);
    connect(poller_, &PendingOpsPoller::summaryChanged, this, &SyncController::pendingOpsChanged);

    remote_change_timer_.setSingleShot(true);
    connect(&remote_change_timer_, &QTimer::timeout, this, [this] {
        requestSync(true);
        poller_->refresh();
    });
}

SyncController::~SyncController() {
    dispose();
}

void SyncController::start() {
    if (started_ || disposed_) return;
    started_ = true;

    QPointer<SyncController> guard(this);
    connectivity_sub_ = connectivity_->on_change([guard](bool online) {
        if (!guard) return;
        qInfo() << "SYNC: connectivity changed online=" << online;
        guard->dispatch_inputs();
    });
    poller_->start();
    dispatch_inputs();
}

void SyncController::dispose() {
    if (disposed_) return;
    disposed_ = true;
    connectivity_sub_.unsubscribe();
    remote_change_timer_.stop();
    scheduler_->dispose();
    poller_->stop();
    service_->dispose();
    if (operation_) {
        operation_->cancel();
        operation_.reset();
    }
    run_active_ = false;
}

QString SyncController::status() const {
    return QString::fromLatin1(to_string(state_.status));
}

QString SyncController::phase() const {
    const auto name = to_string(state_.phase);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

void SyncController::setEnabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    emit enabledChanged();
    if (!enabled) {
        scheduler_->dispose();
        remote_change_timer_.stop();
    }
    if (started_ && !disposed_) {
        dispatch_inputs();
    }
}

void SyncController::requestSync(bool immediate) {
    if (disposed_ || !started_) return;
    if (!enabled_) {
        qDebug() << "SYNC: request ignored, sync disabled";
        return;
    }
    scheduler_->request_sync(SyncIntent{immediate});
}

void SyncController::requestIdleSync(int delayMs) {
    if (disposed_ || !started_ || !enabled_) return;
    if (delayMs < 0) {
        scheduler_->request_idle_sync();
    } else {
        scheduler_->request_idle_sync(std::chrono::milliseconds(delayMs));
    }
}

void SyncController::notifyRemoteChange() {
    if (disposed_ || !started_ || !enabled_) return;
    remote_change_timer_.start(settings_.remote_change_debounce);
}

void SyncController::dispatch_inputs() {
    dispatch(sync_event::InputsChanged{enabled_, connectivity_->is_online()});
}

void SyncController::on_scheduled(bool immediate) {
    if (disposed_) return;
    switch (state_.phase) {
        case SyncPhase::Error:
            // Asking again is how the user retries; the machine re-arms
            // with an immediate intent.
            dispatch_inputs();
            return;
        case SyncPhase::Offline:
            if (connectivity_->is_online()) {
                dispatch_inputs();
            }
            return;
        case SyncPhase::Syncing:
            dispatch(sync_event::SyncRequested{SyncIntent{immediate}});
            service_->sync_now();
            return;
        case SyncPhase::Ready:
            dispatch(sync_event::SyncRequested{SyncIntent{immediate}});
            return;
        case SyncPhase::Disabled:
            return;
    }
}

void SyncController::dispatch(const SyncMachineEvent& event) {
    const auto previous = state_;
    state_ = reduce(state_, event);

    if (state_.phase != previous.phase || state_.status != previous.status) {
        qInfo() << "SYNC: phase" << phase() << "status" << status();
        emit statusChanged();
    }

    if (state_.phase == SyncPhase::Disabled && previous.phase != SyncPhase::Disabled) {
        if (operation_) {
            operation_->cancel();
            operation_.reset();
        }
        run_active_ = false;
    }

    if (state_.phase == SyncPhase::Ready && state_.intent) {
        state_ = reduce(state_, sync_event::SyncDispatched{});
        run_sync_now();
    }
}

void SyncController::run_sync_now() {
    if (disposed_) return;
    if (operation_) {
        operation_->cancel();
    }
    run_active_ = true;

    QPointer<SyncController> guard(this);
    std::weak_ptr<SyncService> weak_service = service_;
    operation_ = CancellableOperation::start(
        [guard, weak_service](const CancellationToken&, std::function<void()> finished) {
            auto service = weak_service.lock();
            if (!service) {
                finished();
                return;
            }
            service->sync_now([guard, finished] {
                if (guard) guard->run_active_ = false;
                finished();
            });
        },
        settings_.operation_timeout,
        [guard] {
            if (guard) guard->on_timeout();
        });
}

void SyncController::on_sync_start() {
    if (!run_active_ || disposed_) return;
    dispatch(sync_event::SyncStarted{});
}

void SyncController::on_sync_complete(SyncStatus status) {
    if (!run_active_ || disposed_) return;
    if (status == SyncStatus::Synced) {
        last_synced_ = QDateTime::currentDateTimeUtc();
        emit lastSyncedChanged();
    }
    set_last_error(QString{});
    dispatch(sync_event::SyncFinished{status});
    poller_->refresh();
}

void SyncController::on_sync_error(const SyncError& error) {
    if (!run_active_ || disposed_) return;
    const auto message = QString::fromStdString(format_sync_error(error));
    qWarning() << "SYNC: sync failed:" << to_string(error.kind)
               << QString::fromStdString(error.message);
    set_last_error(message);
    emit syncFailed(message);
    dispatch(sync_event::SyncFinished{
        error.kind == SyncErrorKind::Offline ? SyncStatus::Offline : SyncStatus::Error});
    poller_->refresh();
}

void SyncController::on_timeout() {
    if (disposed_) return;
    run_active_ = false;
    service_->cancel();
    const auto message = QString::fromStdString(
        format_sync_error(SyncError{SyncErrorKind::Unknown, "timed out"}));
    set_last_error(message);
    emit syncFailed(message);
    dispatch(sync_event::SyncFinished{SyncStatus::Error});
}

void SyncController::set_last_error(const QString& message) {
    if (last_error_ == message) return;
    last_error_ = message;
    emit lastErrorChanged();
}

} // namespace daybook::sync
