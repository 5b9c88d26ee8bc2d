#include "notes/synced_note_repository.hpp"
#include "notes/note_codec.hpp"

#include <QDebug>

namespace daybook::notes {

namespace {

using DatesResult = Result<std::vector<std::string>, RepositoryError>;

DatesResult to_dates(Result<std::vector<std::string>, Error> dates) {
    if (dates.is_err()) {
        return DatesResult::err(RepositoryError::from(dates.unwrap_err()));
    }
    return DatesResult::ok(std::move(dates).unwrap());
}

} // namespace

SyncedNoteRepository::SyncedNoteRepository(std::shared_ptr<EnvelopeRepository> envelopes,
                                           std::shared_ptr<const crypto::E2eeService> e2ee,
                                           ClockFn clock)
    : envelopes_(std::move(envelopes)), e2ee_(std::move(e2ee)), clock_(std::move(clock)) {}

Result<std::optional<Note>, RepositoryError> SyncedNoteRepository::hydrate(
    const Result<std::optional<NoteEnvelope>, Error>& envelope) const {
    using R = Result<std::optional<Note>, RepositoryError>;
    if (envelope.is_err()) {
        return R::err(RepositoryError::from(envelope.unwrap_err()));
    }
    const auto& found = envelope.unwrap();
    if (!found) {
        return R::ok(std::nullopt);
    }
    return open_note(*e2ee_, found->record);
}

void SyncedNoteRepository::get(const std::string& date,
                               Completion<Result<std::optional<Note>, RepositoryError>> done) {
    done(hydrate(envelopes_->get_envelope(date)));
}

void SyncedNoteRepository::save(const std::string& date,
                                const std::string& content,
                                const std::optional<HabitValues>& habits,
                                Completion<Result<void, RepositoryError>> done) {
    using R = Result<void, RepositoryError>;
    auto sealed = seal_note(*e2ee_, date, content, habits, clock_().to_iso_string());
    if (sealed.is_err()) {
        done(R::err(sealed.unwrap_err()));
        return;
    }
    const auto& record = sealed.unwrap();
    auto written = envelopes_->save_envelope(EnvelopeWrite{
        .date = record.date,
        .key_id = record.key_id,
        .ciphertext = record.ciphertext,
        .nonce = record.nonce,
        .updated_at = record.updated_at
    });
    if (written.is_err()) {
        done(R::err(RepositoryError::from(written.unwrap_err())));
        return;
    }
    done(R::ok());
}

void SyncedNoteRepository::remove(const std::string& date,
                                  Completion<Result<void, RepositoryError>> done) {
    using R = Result<void, RepositoryError>;
    auto removed = envelopes_->delete_envelope(date);
    if (removed.is_err()) {
        done(R::err(RepositoryError::from(removed.unwrap_err())));
        return;
    }
    done(R::ok());
}

void SyncedNoteRepository::get_all_dates(Completion<DatesResult> done) {
    done(to_dates(envelopes_->get_all_local_dates()));
}

void SyncedNoteRepository::sync(Completion<Result<SyncStatus, SyncError>> done) {
    envelopes_->sync(std::move(done));
}

void SyncedNoteRepository::cancel_sync() {
    envelopes_->cancel_sync();
}

SyncStatus SyncedNoteRepository::sync_status() const {
    return envelopes_->sync_status();
}

Subscription SyncedNoteRepository::on_sync_status_change(std::function<void(SyncStatus)> callback) {
    return envelopes_->on_sync_status_change(std::move(callback));
}

void SyncedNoteRepository::get_all_dates_for_year(int year, Completion<DatesResult> done) {
    done(to_dates(envelopes_->get_all_dates_for_year(year)));
}

void SyncedNoteRepository::get_all_local_dates(Completion<DatesResult> done) {
    done(to_dates(envelopes_->get_all_local_dates()));
}

void SyncedNoteRepository::refresh_note(
    const std::string& date,
    Completion<Result<std::optional<Note>, RepositoryError>> done) {
    auto e2ee = e2ee_;
    envelopes_->refresh_envelope(date,
        [e2ee, done](Result<std::optional<NoteEnvelope>, Error> envelope) {
            using R = Result<std::optional<Note>, RepositoryError>;
            if (envelope.is_err()) {
                done(R::err(RepositoryError::from(envelope.unwrap_err())));
                return;
            }
            const auto& found = envelope.unwrap();
            done(found ? open_note(*e2ee, found->record) : R::ok(std::nullopt));
        });
}

void SyncedNoteRepository::has_pending_op(const std::string& date, Completion<bool> done) {
    auto pending = envelopes_->has_pending_op(date);
    if (pending.is_err()) {
        // Unknown state must not let remote content replace local edits.
        qWarning() << "NOTES: pending-op lookup for" << QString::fromStdString(date)
                   << "failed:" << QString::fromStdString(pending.unwrap_err().message);
        done(true);
        return;
    }
    done(pending.unwrap());
}

void SyncedNoteRepository::refresh_dates(int year, std::function<void()> done) {
    envelopes_->refresh_dates(year, std::move(done));
}

void SyncedNoteRepository::has_remote_date_cached(const std::string& date, Completion<bool> done) {
    auto cached = envelopes_->has_remote_date_cached(date);
    if (cached.is_err()) {
        qWarning() << "NOTES: remote index lookup for" << QString::fromStdString(date)
                   << "failed:" << QString::fromStdString(cached.unwrap_err().message);
        done(false);
        return;
    }
    done(cached.unwrap());
}

} // namespace daybook::notes
