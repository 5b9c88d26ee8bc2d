#include "notes/envelope_repository.hpp"
#include "core/note_date.hpp"

#include <QDebug>
#include <QtGlobal>
#include <algorithm>
#include <set>
#include <tuple>

namespace daybook::notes {

namespace {

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("DAYBOOK_DEBUG_SYNC");
}

SyncError local_failure(const Error& e) {
    return SyncError{SyncErrorKind::Unknown, "Local store: " + e.message};
}

RemoteNotePayload payload_for(const NoteRecord& record, const NoteMeta& meta) {
    return RemoteNotePayload{
        .id = meta.remote_id,
        .date = record.date,
        .key_id = record.key_id,
        .ciphertext = record.ciphertext,
        .nonce = record.nonce,
        .updated_at = record.updated_at,
        .revision = meta.revision,
        .server_updated_at = meta.server_updated_at
    };
}

bool chronological(const std::string& a, const std::string& b) {
    auto pa = parse_note_date(a);
    auto pb = parse_note_date(b);
    if (!pa || !pb) return a < b;
    return std::tie(pa->year, pa->month, pa->day) < std::tie(pb->year, pb->month, pb->day);
}

} // namespace

// ============================================================================
// SyncRun - one push / images / pull cycle
// ============================================================================

class SyncRun : public std::enable_shared_from_this<SyncRun> {
public:
    using Done = Completion<Result<void, SyncError>>;

    SyncRun(std::shared_ptr<EnvelopeRepository> repo, uint64_t generation, Done done)
        : repo_(std::move(repo)), generation_(generation), done_(std::move(done)) {}

    void start() {
        auto pending = repo_->store_->notes.pending_metas();
        if (pending.is_err()) {
            finish(Result<void, SyncError>::err(local_failure(pending.unwrap_err())));
            return;
        }
        pending_ = std::move(pending).unwrap();
        push_next(0);
    }

private:
    using R = Result<void, SyncError>;

    void finish(R result) { done_(std::move(result)); }

    [[nodiscard]] bool abandoned() const noexcept {
        return repo_->sync_generation_ != generation_;
    }

    [[nodiscard]] static R cancelled() {
        return R::err(SyncError{SyncErrorKind::Unknown, "sync cancelled"});
    }

    void push_next(size_t index) {
        if (abandoned()) {
            finish(cancelled());
            return;
        }
        if (index >= pending_.size()) {
            sync_images();
            return;
        }
        const auto& meta = pending_[index];
        auto self = shared_from_this();
        auto next = [self, index](R result) {
            if (result.is_err()) {
                self->finish(std::move(result));
                return;
            }
            self->push_next(index + 1);
        };
        if (meta.pending_op == PendingOp::Delete) {
            push_delete(meta, std::move(next));
        } else {
            push_upsert(meta, std::move(next));
        }
    }

    void push_delete(const NoteMeta& meta, Done next) {
        auto self = shared_from_this();
        RemoteNoteRef ref{meta.remote_id, meta.date};
        repo_->gateway_->delete_note(ref, [self, meta, next](Result<void, SyncError> result) {
            if (result.is_err()) {
                next(result);
                return;
            }
            auto& store = *self->repo_->store_;
            auto current = store.notes.get_meta(meta.date);
            if (current.is_err()) {
                next(R::err(local_failure(current.unwrap_err())));
                return;
            }
            auto latest = current.unwrap();
            if (!latest) {
                next(R::ok());
                return;
            }
            Result<void, Error> written = Result<void, Error>::ok();
            if (latest->pending_op == PendingOp::Delete) {
                written = store.db.transaction([&]() -> Result<void, Error> {
                    return store.notes.delete_meta(meta.date).and_then([&] {
                        return store.remote_index.remove(meta.date);
                    });
                });
            } else {
                // Recreated while the delete was in flight: the server row is
                // now a tombstone, so the next push inserts afresh.
                latest->remote_id.reset();
                latest->revision = 0;
                latest->server_updated_at.reset();
                written = store.notes.put_meta(*latest);
            }
            next(written.is_err() ? R::err(local_failure(written.unwrap_err())) : R::ok());
        });
    }

    void push_upsert(const NoteMeta& meta, Done next) {
        auto record = repo_->store_->notes.get_record(meta.date);
        if (record.is_err()) {
            next(R::err(local_failure(record.unwrap_err())));
            return;
        }
        if (!record.unwrap()) {
            qWarning() << "SYNC: pending upsert for" << QString::fromStdString(meta.date)
                       << "has no envelope, clearing";
            auto cleared = meta;
            cleared.pending_op.reset();
            auto written = repo_->store_->notes.put_meta(cleared);
            next(written.is_err() ? R::err(local_failure(written.unwrap_err())) : R::ok());
            return;
        }
        push_record(*record.unwrap(), meta, payload_for(*record.unwrap(), meta), true,
                    std::move(next));
    }

    void push_record(const NoteRecord& record, const NoteMeta& meta,
                     const RemoteNotePayload& payload, bool may_resolve, Done next) {
        auto self = shared_from_this();
        repo_->gateway_->push_note(payload,
            [self, record, meta, may_resolve, next](Result<RemoteNote, SyncError> result) {
                if (result.is_ok()) {
                    next(self->adopt_push(meta, result.unwrap()));
                    return;
                }
                const auto& error = result.unwrap_err();
                if (error.kind != SyncErrorKind::Conflict || !may_resolve ||
                    !self->repo_->conflict_policy_) {
                    next(R::err(error));
                    return;
                }
                self->resolve_conflict(record, meta, error, next);
            });
    }

    R adopt_push(const NoteMeta& pushed, const RemoteNote& remote) {
        auto& store = *repo_->store_;
        auto current = store.notes.get_meta(pushed.date);
        if (current.is_err()) {
            return R::err(local_failure(current.unwrap_err()));
        }
        auto latest = current.unwrap();
        const auto now = repo_->clock_().to_iso_string();

        if (!latest) {
            // Forgotten locally while the first push was in flight; the
            // server now holds a row that must be tombstoned.
            latest = NoteMeta{.date = pushed.date, .pending_op = PendingOp::Delete};
        } else if (latest->pending_op == PendingOp::Upsert &&
                   latest->local_version == pushed.local_version) {
            latest->pending_op.reset();
            latest->last_synced_at = now;
        }
        latest->remote_id = remote.id;
        latest->revision = remote.revision;
        latest->server_updated_at = remote.server_updated_at;

        auto written = store.db.transaction([&]() -> Result<void, Error> {
            auto put = store.notes.put_meta(*latest);
            if (put.is_err() || latest->pending_op == PendingOp::Delete) return put;
            return store.remote_index.add(pushed.date, now);
        });
        if (written.is_err()) {
            return R::err(local_failure(written.unwrap_err()));
        }
        if (sync_debug_enabled()) {
            qDebug() << "SYNC: pushed" << QString::fromStdString(pushed.date)
                     << "revision" << remote.revision;
        }
        return R::ok();
    }

    void resolve_conflict(const NoteRecord& record, const NoteMeta& meta,
                          const SyncError& conflict, Done next) {
        auto self = shared_from_this();
        repo_->gateway_->fetch_note_by_date(meta.date,
            [self, record, meta, conflict, next](Result<std::optional<RemoteNote>, SyncError> fetched) {
                if (fetched.is_err()) {
                    next(R::err(fetched.unwrap_err()));
                    return;
                }
                const auto& remote = fetched.unwrap();
                const auto resolution = self->repo_->conflict_policy_->resolve(record, meta, remote);
                qInfo() << "SYNC: conflict on" << QString::fromStdString(meta.date)
                        << "resolved as" << to_string(resolution);

                switch (resolution) {
                case ConflictResolution::Surface:
                    next(R::err(conflict));
                    return;
                case ConflictResolution::KeepLocal: {
                    auto payload = payload_for(record, meta);
                    payload.id = remote ? std::optional<std::string>(remote->id) : std::nullopt;
                    payload.revision = remote ? remote->revision : 0;
                    auto rebased = meta;
                    rebased.remote_id = payload.id;
                    rebased.revision = payload.revision;
                    self->push_record(record, rebased, payload, false, next);
                    return;
                }
                case ConflictResolution::KeepRemote: {
                    auto current = self->repo_->store_->notes.get_meta(meta.date);
                    if (current.is_err()) {
                        next(R::err(local_failure(current.unwrap_err())));
                        return;
                    }
                    const int64_t version = current.unwrap() ? current.unwrap()->local_version : 0;
                    auto applied = (remote && !remote->deleted)
                        ? self->repo_->adopt_remote(*remote, version)
                        : self->repo_->forget(meta.date);
                    next(applied.is_err() ? R::err(local_failure(applied.unwrap_err())) : R::ok());
                    return;
                }
                }
            });
    }

    void sync_images() {
        if (abandoned()) {
            finish(cancelled());
            return;
        }
        if (!repo_->image_sync_) {
            pull();
            return;
        }
        auto self = shared_from_this();
        repo_->image_sync_->sync([self](Result<void, SyncError> result) {
            if (result.is_err()) {
                self->finish(std::move(result));
                return;
            }
            self->pull();
        });
    }

    void pull() {
        if (abandoned()) {
            finish(cancelled());
            return;
        }
        auto cursor = repo_->store_->sync_state.cursor();
        if (cursor.is_err()) {
            finish(R::err(local_failure(cursor.unwrap_err())));
            return;
        }
        auto self = shared_from_this();
        auto previous = cursor.unwrap();
        repo_->gateway_->fetch_notes_since(previous,
            [self, previous](Result<std::vector<RemoteNote>, SyncError> result) {
                if (self->abandoned()) {
                    self->finish(cancelled());
                    return;
                }
                if (result.is_err()) {
                    self->finish(R::err(result.unwrap_err()));
                    return;
                }
                const auto& changes = result.unwrap();
                for (const auto& remote : changes) {
                    auto applied = self->repo_->apply_remote_change(remote);
                    if (applied.is_err()) {
                        self->finish(R::err(local_failure(applied.unwrap_err())));
                        return;
                    }
                }
                if (!changes.empty() && changes.back().server_updated_at != previous) {
                    auto saved = self->repo_->store_->sync_state.set_cursor(
                        changes.back().server_updated_at);
                    if (saved.is_err()) {
                        self->finish(R::err(local_failure(saved.unwrap_err())));
                        return;
                    }
                }
                if (sync_debug_enabled()) {
                    qDebug() << "SYNC: pulled" << changes.size() << "changes";
                }
                self->finish(R::ok());
            });
    }

    std::shared_ptr<EnvelopeRepository> repo_;
    uint64_t generation_;
    Done done_;
    std::vector<NoteMeta> pending_;
};

// ============================================================================
// EnvelopeRepository
// ============================================================================

EnvelopeRepository::EnvelopeRepository(std::shared_ptr<storage::LocalStore> store,
                                       std::shared_ptr<network::RemoteNotesGateway> gateway,
                                       std::shared_ptr<network::Connectivity> connectivity,
                                       ClockFn clock,
                                       Options options)
    : store_(std::move(store))
    , gateway_(std::move(gateway))
    , connectivity_(std::move(connectivity))
    , clock_(std::move(clock))
    , options_(options) {}

Result<std::optional<NoteEnvelope>, Error> EnvelopeRepository::get_envelope(const std::string& date) {
    using R = Result<std::optional<NoteEnvelope>, Error>;
    auto record = store_->notes.get_record(date);
    if (record.is_err()) return R::err(record.unwrap_err());
    if (!record.unwrap()) return R::ok(std::nullopt);

    auto meta = store_->notes.get_meta(date);
    if (meta.is_err()) return R::err(meta.unwrap_err());
    return R::ok(NoteEnvelope{*record.unwrap(), meta.unwrap()});
}

Result<void, Error> EnvelopeRepository::save_envelope(const EnvelopeWrite& write) {
    auto existing = store_->notes.get_meta(write.date);
    if (existing.is_err()) return Result<void, Error>::err(existing.unwrap_err());

    NoteMeta meta = existing.unwrap().value_or(NoteMeta{.date = write.date});
    meta.pending_op = PendingOp::Upsert;
    meta.local_version += 1;

    NoteRecord record{
        .version = 1,
        .date = write.date,
        .key_id = write.key_id,
        .ciphertext = write.ciphertext,
        .nonce = write.nonce,
        .updated_at = write.updated_at
    };
    return store_->notes.put(record, meta);
}

Result<void, Error> EnvelopeRepository::delete_envelope(const std::string& date) {
    auto existing = store_->notes.get_meta(date);
    if (existing.is_err()) return Result<void, Error>::err(existing.unwrap_err());

    auto meta = existing.unwrap();
    if (!meta || !meta->remote_id) {
        return store_->notes.remove(date);
    }

    meta->pending_op = PendingOp::Delete;
    meta->local_version += 1;
    return store_->db.transaction([&]() -> Result<void, Error> {
        return store_->notes.delete_record(date)
            .and_then([&] { return store_->notes.put_meta(*meta); })
            .and_then([&] { return store_->remote_index.remove(date); });
    });
}

Result<bool, Error> EnvelopeRepository::has_pending_op(const std::string& date) {
    return store_->notes.get_meta(date).map([](const std::optional<NoteMeta>& meta) {
        return meta && meta->pending_op.has_value();
    });
}

Result<std::vector<std::string>, Error> EnvelopeRepository::get_all_local_dates() {
    return store_->notes.all_dates();
}

Result<std::vector<std::string>, Error> EnvelopeRepository::get_all_local_dates_for_year(int year) {
    return store_->notes.dates_for_year(year);
}

Result<std::vector<std::string>, Error> EnvelopeRepository::get_all_dates_for_year(int year) {
    using R = Result<std::vector<std::string>, Error>;
    auto local = store_->notes.dates_for_year(year);
    if (local.is_err()) return local;
    auto remote = store_->remote_index.dates_for_year(year);
    if (remote.is_err()) return remote;

    std::set<std::string> merged(local.unwrap().begin(), local.unwrap().end());
    merged.insert(remote.unwrap().begin(), remote.unwrap().end());

    std::vector<std::string> dates(merged.begin(), merged.end());
    std::sort(dates.begin(), dates.end(), chronological);
    return R::ok(std::move(dates));
}

Result<bool, Error> EnvelopeRepository::has_remote_date_cached(const std::string& date) {
    return store_->remote_index.contains(date);
}

void EnvelopeRepository::refresh_envelope(
    const std::string& date,
    Completion<Result<std::optional<NoteEnvelope>, Error>> done) {
    using R = Result<std::optional<NoteEnvelope>, Error>;
    if (!connectivity_->is_online()) {
        done(R::ok(std::nullopt));
        return;
    }

    auto self = shared_from_this();
    gateway_->fetch_note_by_date(date,
        [self, date, done](Result<std::optional<RemoteNote>, SyncError> fetched) {
            if (fetched.is_err()) {
                qWarning() << "SYNC: refresh of" << QString::fromStdString(date) << "failed:"
                           << QString::fromStdString(fetched.unwrap_err().message);
                done(self->get_envelope(date));
                return;
            }

            auto meta = self->store_->notes.get_meta(date);
            if (meta.is_err()) {
                done(R::err(meta.unwrap_err()));
                return;
            }
            const auto& local_meta = meta.unwrap();
            if (local_meta && local_meta->pending_op) {
                done(self->get_envelope(date));
                return;
            }

            const auto& remote = fetched.unwrap();
            if (!remote || remote->deleted) {
                if (local_meta && local_meta->remote_id) {
                    auto forgotten = self->forget(date);
                    done(forgotten.is_err() ? R::err(forgotten.unwrap_err()) : R::ok(std::nullopt));
                    return;
                }
                done(self->get_envelope(date));
                return;
            }

            auto local = self->get_envelope(date);
            if (local.is_err()) {
                done(local);
                return;
            }
            if (local.unwrap() && local_meta &&
                local_meta->server_updated_at == remote->server_updated_at) {
                done(local);
                return;
            }

            auto adopted = self->adopt_remote(*remote, local_meta ? local_meta->local_version : 0);
            if (adopted.is_err()) {
                done(R::err(adopted.unwrap_err()));
                return;
            }
            done(self->get_envelope(date));
        });
}

void EnvelopeRepository::refresh_dates(int year, std::function<void()> done) {
    auto in_flight = dates_in_flight_.find(year);
    if (in_flight != dates_in_flight_.end()) {
        in_flight->second.push_back(std::move(done));
        return;
    }
    auto refreshed = dates_refreshed_at_.find(year);
    if (refreshed != dates_refreshed_at_.end() &&
        clock_() - refreshed->second < options_.refresh_dates_cooldown) {
        done();
        return;
    }
    if (!connectivity_->is_online()) {
        done();
        return;
    }

    dates_in_flight_[year].push_back(std::move(done));
    auto self = shared_from_this();
    gateway_->fetch_note_dates(year, [self, year](Result<std::vector<std::string>, SyncError> result) {
        if (result.is_ok()) {
            const auto now = self->clock_();
            auto stored = self->store_->remote_index.set_dates_for_year(
                year, result.unwrap(), now.to_iso_string());
            if (stored.is_err()) {
                qWarning() << "SYNC: could not store remote dates for" << year << ":"
                           << QString::fromStdString(stored.unwrap_err().message);
            } else {
                self->dates_refreshed_at_[year] = now;
            }
        } else {
            qWarning() << "SYNC: fetching remote dates for" << year << "failed:"
                       << QString::fromStdString(result.unwrap_err().message);
        }

        auto waiters = std::move(self->dates_in_flight_[year]);
        self->dates_in_flight_.erase(year);
        for (auto& waiter : waiters) {
            waiter();
        }
    });
}

void EnvelopeRepository::sync(Completion<Result<SyncStatus, SyncError>> done) {
    using R = Result<SyncStatus, SyncError>;
    if (sync_running_) {
        sync_waiters_.push_back(std::move(done));
        return;
    }
    if (!connectivity_->is_online()) {
        set_status(SyncStatus::Offline);
        done(R::ok(SyncStatus::Offline));
        return;
    }

    sync_running_ = true;
    sync_waiters_.push_back(std::move(done));
    set_status(SyncStatus::Syncing);

    auto self = shared_from_this();
    const uint64_t generation = sync_generation_;
    auto run = std::make_shared<SyncRun>(self, generation,
                                         [self, generation](Result<void, SyncError> result) {
        if (self->sync_generation_ != generation) {
            qInfo() << "SYNC: abandoned run finished, result discarded";
            return;
        }
        R outcome = R::ok(SyncStatus::Synced);
        if (result.is_err()) {
            const auto& error = result.unwrap_err();
            qWarning() << "SYNC: run failed:" << to_string(error.kind)
                       << QString::fromStdString(error.message);
            self->set_status(error.kind == SyncErrorKind::Offline ? SyncStatus::Offline
                                                                  : SyncStatus::Error);
            outcome = R::err(error);
        } else {
            self->set_status(SyncStatus::Synced);
        }

        self->sync_running_ = false;
        auto waiters = std::move(self->sync_waiters_);
        self->sync_waiters_.clear();
        for (auto& waiter : waiters) {
            waiter(outcome);
        }
    });
    run->start();
}

void EnvelopeRepository::cancel_sync() {
    if (!sync_running_) return;
    qWarning() << "SYNC: abandoning running cycle";
    ++sync_generation_;
    sync_running_ = false;
    set_status(SyncStatus::Error);

    auto waiters = std::move(sync_waiters_);
    sync_waiters_.clear();
    for (auto& waiter : waiters) {
        waiter(Result<SyncStatus, SyncError>::err(
            SyncError{SyncErrorKind::Unknown, "sync cancelled"}));
    }
}

void EnvelopeRepository::set_status(SyncStatus status) {
    if (status_ == status) return;
    status_ = status;
    status_observers_.notify(status);
}

Result<void, Error> EnvelopeRepository::adopt_remote(const RemoteNote& remote, int64_t local_version) {
    const auto now = clock_().to_iso_string();
    NoteMeta meta{
        .date = remote.date,
        .revision = remote.revision,
        .remote_id = remote.id,
        .server_updated_at = remote.server_updated_at,
        .last_synced_at = now,
        .pending_op = std::nullopt,
        .local_version = local_version
    };
    return store_->db.transaction([&]() -> Result<void, Error> {
        return store_->notes.put_record(to_note_record(remote))
            .and_then([&] { return store_->notes.put_meta(meta); })
            .and_then([&] { return store_->remote_index.add(remote.date, now); });
    });
}

Result<void, Error> EnvelopeRepository::apply_remote_change(const RemoteNote& remote) {
    auto existing = store_->notes.get_meta(remote.date);
    if (existing.is_err()) return Result<void, Error>::err(existing.unwrap_err());
    const auto& meta = existing.unwrap();

    if (meta && meta->pending_op) {
        if (sync_debug_enabled()) {
            qDebug() << "SYNC: skipping remote change for" << QString::fromStdString(remote.date)
                     << "with pending" << to_string(*meta->pending_op);
        }
        return Result<void, Error>::ok();
    }
    if (remote.deleted) {
        return forget(remote.date);
    }
    if (meta && meta->server_updated_at == remote.server_updated_at) {
        return Result<void, Error>::ok();
    }
    return adopt_remote(remote, meta ? meta->local_version : 0);
}

Result<void, Error> EnvelopeRepository::forget(const std::string& date) {
    return store_->db.transaction([&]() -> Result<void, Error> {
        return store_->notes.delete_record(date)
            .and_then([&] { return store_->notes.delete_meta(date); })
            .and_then([&] { return store_->remote_index.remove(date); });
    });
}

} // namespace daybook::notes
