#pragma once

#include "sync/pending_ops.hpp"
#include "sync/sync_phase_machine.hpp"
#include <QObject>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>

namespace daybook::sync {

/**
 * IntentScheduler - turns sync requests into SyncRequested events.
 *
 * Immediate intents go out at once; others are debounced, each request
 * restarting the delay. An idle request waits, then asks for an
 * immediate sync only if local changes are pending. Only one idle wait is
 * outstanding at a time.
 */
class IntentScheduler : public QObject {
    Q_OBJECT

public:
    struct Options {
        std::chrono::milliseconds debounce{2000};
        std::chrono::milliseconds idle_delay{4000};
    };

    IntentScheduler(std::shared_ptr<PendingOpsSource> pending, Options options,
                    QObject* parent = nullptr);

    void request_sync(SyncIntent intent);
    void request_idle_sync(std::optional<std::chrono::milliseconds> delay = std::nullopt);

    /**
     * Cancel both timers.
     */
    void dispose();

    [[nodiscard]] bool has_pending_debounce() const { return debounce_timer_.isActive(); }
    [[nodiscard]] bool has_pending_idle() const { return idle_timer_.isActive(); }

signals:
    void syncRequested(bool immediate);

private:
    void on_idle_elapsed();

    std::shared_ptr<PendingOpsSource> pending_;
    Options options_;
    QTimer debounce_timer_;
    QTimer idle_timer_;
    SyncIntent debounced_intent_;
};

} // namespace daybook::sync
