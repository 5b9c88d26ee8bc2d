#include "sync/pending_ops.hpp"

#include <QDebug>
#include <QPointer>

namespace daybook::sync {

void PendingOpsSource::has_pending(Completion<bool> done) {
    get_summary([done](Result<PendingOpsSummary, Error> summary) {
        if (summary.is_err()) {
            qWarning() << "SYNC: pending-op count failed:"
                       << QString::fromStdString(summary.unwrap_err().message);
            done(false);
            return;
        }
        done(summary.unwrap().total > 0);
    });
}

void LocalPendingOpsSource::get_summary(Completion<Result<PendingOpsSummary, Error>> done) {
    using R = Result<PendingOpsSummary, Error>;
    auto notes = store_->notes.count_pending();
    if (notes.is_err()) {
        done(R::err(notes.unwrap_err()));
        return;
    }
    auto images = store_->images.count_pending();
    if (images.is_err()) {
        done(R::err(images.unwrap_err()));
        return;
    }
    const int note_count = notes.unwrap();
    const int image_count = images.unwrap();
    done(R::ok(PendingOpsSummary{note_count, image_count, note_count + image_count}));
}

PendingOpsPoller::PendingOpsPoller(std::shared_ptr<PendingOpsSource> source,
                                   std::chrono::milliseconds interval,
                                   QObject* parent)
    : QObject(parent), source_(std::move(source)) {
    timer_.setInterval(interval);
    connect(&timer_, &QTimer::timeout, this, &PendingOpsPoller::refresh);
}

void PendingOpsPoller::start() {
    refresh();
    timer_.start();
}

void PendingOpsPoller::stop() {
    timer_.stop();
}

void PendingOpsPoller::refresh() {
    QPointer<PendingOpsPoller> guard(this);
    source_->get_summary([guard](Result<PendingOpsSummary, Error> summary) {
        if (!guard) return;
        if (summary.is_err()) {
            const auto message = QString::fromStdString(summary.unwrap_err().message);
            qWarning() << "SYNC: pending-op refresh failed:" << message;
            guard->apply(PendingOpsSummary{});
            emit guard->refreshFailed(message);
            return;
        }
        guard->apply(summary.unwrap());
    });
}

void PendingOpsPoller::apply(const PendingOpsSummary& summary) {
    if (summary == summary_) return;
    summary_ = summary;
    emit summaryChanged();
}

} // namespace daybook::sync
