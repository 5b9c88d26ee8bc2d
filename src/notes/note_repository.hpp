#pragma once

#include "core/completion.hpp"
#include "core/errors.hpp"
#include "core/note.hpp"
#include "core/observer.hpp"
#include "core/result.hpp"
#include "core/sync_status.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace daybook::notes {

class SyncCapableRepository;

/**
 * NoteRepository - per-date note persistence.
 *
 * Every operation completes through a callback; see Completion for the
 * timing rules.
 */
class NoteRepository {
public:
    virtual ~NoteRepository() = default;

    virtual void get(const std::string& date,
                     Completion<Result<std::optional<Note>, RepositoryError>> done) = 0;

    virtual void save(const std::string& date,
                      const std::string& content,
                      const std::optional<HabitValues>& habits,
                      Completion<Result<void, RepositoryError>> done) = 0;

    virtual void remove(const std::string& date,
                        Completion<Result<void, RepositoryError>> done) = 0;

    virtual void get_all_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) = 0;

    /**
     * The sync capability of this repository, or nullptr for a local-only
     * store. The pointer is owned by the repository.
     */
    [[nodiscard]] virtual SyncCapableRepository* sync_capability() { return nullptr; }
};

/**
 * SyncCapableRepository - operations only a repository backed by a remote
 * store can offer.
 *
 * Status callbacks may arrive after the subscriber has moved on (another
 * date selected, sync disabled); consumers re-check relevance before
 * acting on them.
 */
class SyncCapableRepository {
public:
    virtual ~SyncCapableRepository() = default;

    virtual void sync(Completion<Result<SyncStatus, SyncError>> done) = 0;

    /**
     * Abandon the running sync, if any. Its callers are completed with an
     * error and the next sync() starts a fresh cycle.
     */
    virtual void cancel_sync() = 0;

    [[nodiscard]] virtual SyncStatus sync_status() const = 0;

    [[nodiscard]] virtual Subscription on_sync_status_change(
        std::function<void(SyncStatus)> callback) = 0;

    /**
     * Local dates merged with dates known to exist remotely.
     */
    virtual void get_all_dates_for_year(
        int year,
        Completion<Result<std::vector<std::string>, RepositoryError>> done) = 0;

    virtual void get_all_local_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) = 0;

    /**
     * Reconcile one date with the remote store and return the resulting
     * note. Offline, or when the date has no note, yields nullopt.
     */
    virtual void refresh_note(
        const std::string& date,
        Completion<Result<std::optional<Note>, RepositoryError>> done) = 0;

    virtual void has_pending_op(const std::string& date, Completion<bool> done) = 0;

    /**
     * Refresh the remote date index for `year`. Failures are logged, not
     * reported.
     */
    virtual void refresh_dates(int year, std::function<void()> done) = 0;

    virtual void has_remote_date_cached(const std::string& date, Completion<bool> done) = 0;
};

} // namespace daybook::notes
