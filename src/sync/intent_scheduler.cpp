#include "sync/intent_scheduler.hpp"

#include <QPointer>

namespace daybook::sync {

IntentScheduler::IntentScheduler(std::shared_ptr<PendingOpsSource> pending, Options options,
                                 QObject* parent)
    : QObject(parent), pending_(std::move(pending)), options_(options) {
    debounce_timer_.setSingleShot(true);
    idle_timer_.setSingleShot(true);

    connect(&debounce_timer_, &QTimer::timeout, this, [this] {
        emit syncRequested(debounced_intent_.immediate);
    });
    connect(&idle_timer_, &QTimer::timeout, this, &IntentScheduler::on_idle_elapsed);
}

void IntentScheduler::request_sync(SyncIntent intent) {
    debounce_timer_.stop();
    if (intent.immediate) {
        emit syncRequested(true);
        return;
    }
    debounced_intent_ = intent;
    debounce_timer_.start(options_.debounce);
}

void IntentScheduler::request_idle_sync(std::optional<std::chrono::milliseconds> delay) {
    if (idle_timer_.isActive()) {
        return;
    }
    idle_timer_.start(delay.value_or(options_.idle_delay));
}

void IntentScheduler::on_idle_elapsed() {
    QPointer<IntentScheduler> guard(this);
    pending_->has_pending([guard](bool pending) {
        if (guard && pending) {
            guard->request_sync(SyncIntent{true});
        }
    });
}

void IntentScheduler::dispose() {
    debounce_timer_.stop();
    idle_timer_.stop();
}

} // namespace daybook::sync
