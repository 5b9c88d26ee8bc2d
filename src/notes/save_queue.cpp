#include "notes/save_queue.hpp"

#include <QDebug>

namespace daybook::notes {

void SaveQueue::enqueue(Job job) {
    jobs_.push_back(std::move(job));
    if (!running_) {
        pump();
    }
}

void SaveQueue::pump() {
    if (pumping_) return;
    // Loop instead of recursing: a local repository settles inline.
    pumping_ = true;
    while (!running_ && !jobs_.empty()) {
        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        running_ = true;

        auto self = shared_from_this();
        auto done = std::move(job.done);
        auto on_settled = [self, done](Result<void, RepositoryError> result) {
            self->settle(done, std::move(result));
        };

        if (job.is_delete) {
            repository_->remove(job.date, std::move(on_settled));
        } else {
            repository_->save(job.date, job.content, std::nullopt, std::move(on_settled));
        }
    }
    pumping_ = false;
}

void SaveQueue::settle(const Completion<Result<void, RepositoryError>>& done,
                       Result<void, RepositoryError> result) {
    if (result.is_err()) {
        qWarning() << "NOTES: save failed:" << to_string(result.unwrap_err().kind)
                   << QString::fromStdString(result.unwrap_err().message);
    }
    running_ = false;
    if (done) {
        done(std::move(result));
    }
    pump();
}

} // namespace daybook::notes
