#include "sync/sync_service.hpp"

#include <QDebug>
#include <exception>

namespace daybook::sync {

SyncService::SyncService(std::shared_ptr<notes::SyncCapableRepository> repository,
                         Callbacks callbacks)
    : repository_(std::move(repository)), callbacks_(std::move(callbacks)) {}

void SyncService::sync_now(std::function<void()> done) {
    if (done) {
        waiters_.push_back(std::move(done));
    }
    if (running_) {
        queued_ = true;
        return;
    }
    disposed_ = false;
    running_ = true;
    run_once();
}

void SyncService::run_once() {
    queued_ = false;
    if (callbacks_.on_sync_start) callbacks_.on_sync_start();

    std::weak_ptr<SyncService> weak = weak_from_this();
    const uint64_t generation = generation_;
    try {
        repository_->sync([weak, generation](Result<SyncStatus, SyncError> result) {
            if (auto self = weak.lock()) {
                self->on_result(generation, std::move(result));
            }
        });
    } catch (const std::exception& e) {
        qWarning() << "SYNC: repository sync threw:" << e.what();
        if (callbacks_.on_sync_error) {
            callbacks_.on_sync_error(SyncError{SyncErrorKind::Unknown, e.what()});
        }
        finish();
    }
}

void SyncService::on_result(uint64_t generation, Result<SyncStatus, SyncError> result) {
    if (generation != generation_) {
        qDebug() << "SYNC: ignoring result of a cancelled run";
        return;
    }
    if (disposed_) {
        finish();
        return;
    }
    if (result.is_err()) {
        if (callbacks_.on_sync_error) callbacks_.on_sync_error(result.unwrap_err());
        finish();
        return;
    }
    if (callbacks_.on_sync_complete) callbacks_.on_sync_complete(result.unwrap());
    if (queued_ && !disposed_) {
        run_once();
        return;
    }
    finish();
}

void SyncService::finish() {
    running_ = false;
    queued_ = false;
    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& waiter : waiters) {
        waiter();
    }
}

void SyncService::cancel() {
    if (!running_) return;
    ++generation_;
    running_ = false;
    queued_ = false;
    waiters_.clear();
    repository_->cancel_sync();
}

void SyncService::dispose() {
    disposed_ = true;
    queued_ = false;
}

} // namespace daybook::sync
