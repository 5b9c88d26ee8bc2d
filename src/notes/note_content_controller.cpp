#include "notes/note_content_controller.hpp"

#include <QDebug>
#include <QPointer>
#include <type_traits>

namespace daybook::notes {

NoteContentController::NoteContentController(std::shared_ptr<network::Connectivity> connectivity,
                                             config::SyncSettings settings,
                                             QObject* parent)
    : QObject(parent), connectivity_(std::move(connectivity)), settings_(settings) {
    save_timer_.setSingleShot(true);
    connect(&save_timer_, &QTimer::timeout, this, [this] {
        dispatch_local(local_event::DebounceElapsed{});
    });

    if (connectivity_) {
        QPointer<NoteContentController> guard(this);
        connectivity_sub_ = connectivity_->on_change([guard](bool) {
            if (guard) guard->sync_remote_inputs();
        });
    }
}

NoteContentController::~NoteContentController() {
    tearing_down_ = true;
    connectivity_sub_.unsubscribe();
    if (refresh_op_) {
        refresh_op_->cancel();
    }
    // The queue is shared with the pending job, so the write outlives us.
    dispatch_local(local_event::Flush{});
}

bool NoteContentController::isSaving() const noexcept {
    return local_.phase == LocalPhase::Saving ||
           (local_.phase == LocalPhase::Dirty && local_.has_edits);
}

QString NoteContentController::error() const {
    return local_.error ? QString::fromStdString(*local_.error) : QString{};
}

void NoteContentController::setRepository(std::shared_ptr<NoteRepository> repository) {
    if (repository_ == repository) return;
    dispatch_local(local_event::Flush{});
    repository_ = std::move(repository);
    save_queue_ = repository_ ? std::make_shared<SaveQueue>(repository_) : nullptr;
    restart();
}

void NoteContentController::setDate(const QString& date) {
    if (date_ == date) return;
    dispatch_local(local_event::Flush{});
    date_ = date;
    emit dateChanged();
    restart();
}

void NoteContentController::setContent(const QString& content) {
    dispatch_local(local_event::Edit{content.toStdString()});
}

void NoteContentController::flush() {
    dispatch_local(local_event::Flush{});
}

void NoteContentController::forceRefresh() {
    dispatch_remote(remote_event::ForceRefresh{});
}

void NoteContentController::restart() {
    if (refresh_op_) {
        refresh_op_->cancel();
        refresh_op_.reset();
    }
    if (repository_ && !date_.isEmpty()) {
        dispatch_local(local_event::LoadStart{date_.toStdString()});
    } else {
        dispatch_local(local_event::Reset{});
    }
}

void NoteContentController::dispatch_local(const LocalContentEvent& event) {
    const auto previous = local_;
    auto transition = reduce(local_, event);
    local_ = std::move(transition.state);
    emit_local_changes(previous);
    sync_remote_inputs();

    for (const auto& effect : transition.effects) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, local_effect::ArmDebounce>) {
                save_timer_.start(settings_.save_debounce);
            } else if constexpr (std::is_same_v<T, local_effect::CancelDebounce>) {
                save_timer_.stop();
            } else {
                run(e);
            }
        }, effect);
    }
}

void NoteContentController::emit_local_changes(const LocalContentState& previous) {
    if (tearing_down_) return;
    if (previous.content != local_.content) emit contentChanged();
    if (previous.has_edits != local_.has_edits) emit hasEditsChanged();
    if ((previous.phase == LocalPhase::Loading) != (local_.phase == LocalPhase::Loading)) {
        emit isLoadingChanged();
    }
    const bool was_saving = previous.phase == LocalPhase::Saving ||
                            (previous.phase == LocalPhase::Dirty && previous.has_edits);
    if (was_saving != isSaving()) emit isSavingChanged();
    if (previous.error != local_.error) emit errorChanged();
}

void NoteContentController::sync_remote_inputs() {
    if (tearing_down_) return;
    auto* sync = repository_ ? repository_->sync_capability() : nullptr;
    RemoteSyncInputs inputs;
    inputs.date = local_.date;
    inputs.repository = repository_.get();
    inputs.can_refresh = sync != nullptr;
    inputs.has_remote_index = sync != nullptr;
    inputs.online = connectivity_ && connectivity_->is_online();
    inputs.local_content = local_.content;
    inputs.has_local_edits = local_.has_edits;
    inputs.is_local_ready = local_.is_ready();
    dispatch_remote(remote_event::InputsChanged{std::move(inputs)});
}

void NoteContentController::dispatch_remote(const RemoteSyncEvent& event) {
    if (tearing_down_) return;
    const bool was_stub = is_known_remote_only(remote_);
    const auto previous_request = remote_.request;
    auto transition = reduce(remote_, event);
    remote_ = std::move(transition.state);

    // A new request supersedes the refresh in flight.
    if (remote_.request != previous_request && refresh_op_) {
        refresh_op_->cancel();
        refresh_op_.reset();
    }
    if (was_stub != is_known_remote_only(remote_)) emit isOfflineStubChanged();

    for (const auto& effect : transition.effects) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, remote_effect::ApplyRemoteContent>) {
                dispatch_local(local_event::RemoteUpdate{e.date, e.content});
            } else {
                run(e);
            }
        }, effect);
    }
}

void NoteContentController::run(const local_effect::StartLoad& effect) {
    if (!repository_) return;
    const auto seq = ++load_seq_;
    QPointer<NoteContentController> guard(this);
    const auto date = effect.date;
    repository_->get(date, [guard, seq, date](Result<std::optional<Note>, RepositoryError> result) {
        if (!guard || guard->tearing_down_ || guard->load_seq_ != seq) return;
        if (result.is_err()) {
            const auto& err = result.unwrap_err();
            qWarning() << "NOTES: load failed for" << QString::fromStdString(date) << ":"
                       << to_string(err.kind) << QString::fromStdString(err.message);
            guard->dispatch_local(local_event::LoadFailed{date, err.message});
            emit guard->loadFailed(QString::fromStdString(date),
                                   QString::fromStdString(err.message));
            return;
        }
        const auto& note = result.unwrap();
        guard->dispatch_local(local_event::LoadSucceeded{date, note ? note->content : std::string{}});
    });
}

void NoteContentController::run(const local_effect::EnqueueSave& effect) {
    if (!save_queue_) return;
    QPointer<NoteContentController> guard(this);
    const auto date = effect.date;
    const auto content = effect.content;
    const bool is_delete = effect.is_delete;
    save_queue_->enqueue(SaveQueue::Job{
        date, content, is_delete,
        [guard, date, content, is_delete](Result<void, RepositoryError> result) {
            if (!guard || guard->tearing_down_) return;
            if (result.is_err()) {
                const auto message = result.unwrap_err().message;
                guard->dispatch_local(local_event::SaveFailed{date, content, message});
                emit guard->saveFailed(QString::fromStdString(date),
                                       QString::fromStdString(message));
                return;
            }
            guard->dispatch_local(local_event::SaveSucceeded{date, content});
            emit guard->noteSaved(QString::fromStdString(date), is_delete);
        }});
}

void NoteContentController::run(const remote_effect::CheckRemoteCache& effect) {
    auto* sync = repository_ ? repository_->sync_capability() : nullptr;
    if (!sync) {
        dispatch_remote(remote_event::CheckFailed{effect.request});
        return;
    }
    QPointer<NoteContentController> guard(this);
    const auto request = effect.request;
    const auto date = effect.date;
    sync->has_remote_date_cached(date, [guard, request, date](bool has_remote) {
        if (guard) guard->dispatch_remote(remote_event::CacheChecked{request, date, has_remote});
    });
}

void NoteContentController::run(const remote_effect::StartRefresh& effect) {
    auto* sync = repository_ ? repository_->sync_capability() : nullptr;
    if (!sync) {
        dispatch_remote(remote_event::RefreshSkipped{effect.request});
        return;
    }

    QPointer<NoteContentController> guard(this);
    const auto request = effect.request;
    const auto date = effect.date;
    // Keeps the repository alive for the duration of the refresh.
    auto repository = repository_;

    auto body = [guard, repository, sync, request, date](const sync::CancellationToken& token,
                                                          std::function<void()> finished) {
        auto skip = [guard, request, finished] {
            if (guard) guard->dispatch_remote(remote_event::RefreshSkipped{request});
            finished();
        };
        sync->refresh_note(date, [guard, repository, sync, token, request, date, finished, skip](
                                     Result<std::optional<Note>, RepositoryError> result) {
            if (token.is_cancelled() || !guard) {
                finished();
                return;
            }
            if (result.is_err()) {
                qWarning() << "NOTES: refresh failed for" << QString::fromStdString(date) << ":"
                           << QString::fromStdString(result.unwrap_err().message);
                skip();
                return;
            }
            if (!result.unwrap()) {
                skip();
                return;
            }
            auto content = result.unwrap()->content;
            sync->has_pending_op(date, [guard, repository, token, request, finished, skip,
                                        content = std::move(content)](bool pending) {
                if (token.is_cancelled() || !guard) {
                    finished();
                    return;
                }
                if (pending) {
                    skip();
                    return;
                }
                guard->dispatch_remote(remote_event::Refreshed{request, content});
                finished();
            });
        });
    };

    auto op = sync::CancellableOperation::start(std::move(body), settings_.operation_timeout,
                                                [guard, request] {
        if (guard) guard->dispatch_remote(remote_event::RefreshSkipped{request});
    });
    // The refresh may already have settled inline.
    if (op->is_active() && remote_.request == request) {
        refresh_op_ = std::move(op);
    }
}

} // namespace daybook::notes
