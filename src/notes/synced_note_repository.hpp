#pragma once

#include "notes/envelope_repository.hpp"
#include "notes/note_repository.hpp"
#include "crypto/e2ee_service.hpp"
#include "core/types.hpp"
#include <memory>

namespace daybook::notes {

/**
 * SyncedNoteRepository - note repository backed by the envelope engine.
 *
 * Decrypts envelopes on the way out and seals content on the way in; all
 * sync bookkeeping lives in EnvelopeRepository.
 */
class SyncedNoteRepository : public NoteRepository, public SyncCapableRepository {
public:
    SyncedNoteRepository(std::shared_ptr<EnvelopeRepository> envelopes,
                         std::shared_ptr<const crypto::E2eeService> e2ee,
                         ClockFn clock = system_clock());

    // NoteRepository
    void get(const std::string& date,
             Completion<Result<std::optional<Note>, RepositoryError>> done) override;
    void save(const std::string& date,
              const std::string& content,
              const std::optional<HabitValues>& habits,
              Completion<Result<void, RepositoryError>> done) override;
    void remove(const std::string& date,
                Completion<Result<void, RepositoryError>> done) override;
    void get_all_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) override;

    [[nodiscard]] SyncCapableRepository* sync_capability() override { return this; }

    // SyncCapableRepository
    void sync(Completion<Result<SyncStatus, SyncError>> done) override;
    void cancel_sync() override;
    [[nodiscard]] SyncStatus sync_status() const override;
    [[nodiscard]] Subscription on_sync_status_change(
        std::function<void(SyncStatus)> callback) override;
    void get_all_dates_for_year(
        int year,
        Completion<Result<std::vector<std::string>, RepositoryError>> done) override;
    void get_all_local_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) override;
    void refresh_note(
        const std::string& date,
        Completion<Result<std::optional<Note>, RepositoryError>> done) override;
    void has_pending_op(const std::string& date, Completion<bool> done) override;
    void refresh_dates(int year, std::function<void()> done) override;
    void has_remote_date_cached(const std::string& date, Completion<bool> done) override;

    [[nodiscard]] const std::shared_ptr<EnvelopeRepository>& envelopes() const noexcept {
        return envelopes_;
    }

private:
    Result<std::optional<Note>, RepositoryError> hydrate(
        const Result<std::optional<NoteEnvelope>, Error>& envelope) const;

    std::shared_ptr<EnvelopeRepository> envelopes_;
    std::shared_ptr<const crypto::E2eeService> e2ee_;
    ClockFn clock_;
};

} // namespace daybook::notes
