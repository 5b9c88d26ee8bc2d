#pragma once

#include "core/completion.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "notes/note_repository.hpp"
#include <deque>
#include <memory>
#include <string>

namespace daybook::notes {

/**
 * SaveQueue - runs note writes one after another.
 *
 * A write starts only after the previous one settled, so writes for a
 * date reach the repository in the order they were issued. Must be owned
 * by a shared_ptr; queued writes keep the queue alive, so a write issued
 * just before its owner goes away still completes.
 */
class SaveQueue : public std::enable_shared_from_this<SaveQueue> {
public:
    struct Job {
        std::string date;
        std::string content;
        bool is_delete{false};
        Completion<Result<void, RepositoryError>> done;
    };

    explicit SaveQueue(std::shared_ptr<NoteRepository> repository)
        : repository_(std::move(repository)) {}

    void enqueue(Job job);

    [[nodiscard]] bool is_idle() const noexcept { return !running_ && jobs_.empty(); }
    [[nodiscard]] size_t queued() const noexcept { return jobs_.size(); }

private:
    void pump();
    void settle(const Completion<Result<void, RepositoryError>>& done,
                Result<void, RepositoryError> result);

    std::shared_ptr<NoteRepository> repository_;
    std::deque<Job> jobs_;
    bool running_ = false;
    bool pumping_ = false;
};

} // namespace daybook::notes
