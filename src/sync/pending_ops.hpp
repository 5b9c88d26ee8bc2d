#pragma once

#include "core/completion.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include "storage/local_store.hpp"
#include <QObject>
#include <QTimer>
#include <chrono>
#include <memory>

namespace daybook::sync {

/**
 * PendingOpsSource - counts of local changes the remote store has not
 * confirmed.
 */
class PendingOpsSource {
public:
    virtual ~PendingOpsSource() = default;

    virtual void get_summary(Completion<Result<PendingOpsSummary, Error>> done) = 0;

    /**
     * True when anything is pending. A failed count reports false.
     */
    virtual void has_pending(Completion<bool> done);
};

/**
 * Pending-op markers of the local note and image stores.
 */
class LocalPendingOpsSource : public PendingOpsSource {
public:
    explicit LocalPendingOpsSource(std::shared_ptr<storage::LocalStore> store)
        : store_(std::move(store)) {}

    void get_summary(Completion<Result<PendingOpsSummary, Error>> done) override;

private:
    std::shared_ptr<storage::LocalStore> store_;
};

/**
 * PendingOpsPoller - keeps a recent PendingOpsSummary.
 *
 * Refreshes on a fixed interval and on demand; a failed count resets the
 * summary to zero.
 */
class PendingOpsPoller : public QObject {
    Q_OBJECT

public:
    PendingOpsPoller(std::shared_ptr<PendingOpsSource> source,
                     std::chrono::milliseconds interval,
                     QObject* parent = nullptr);

    [[nodiscard]] const PendingOpsSummary& summary() const noexcept { return summary_; }

    void start();
    void stop();
    void refresh();

signals:
    void summaryChanged();
    void refreshFailed(const QString& message);

private:
    void apply(const PendingOpsSummary& summary);

    std::shared_ptr<PendingOpsSource> source_;
    QTimer timer_;
    PendingOpsSummary summary_;
};

} // namespace daybook::sync
