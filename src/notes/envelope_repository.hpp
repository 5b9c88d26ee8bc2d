#pragma once

#include "core/completion.hpp"
#include "core/errors.hpp"
#include "core/note.hpp"
#include "core/observer.hpp"
#include "core/result.hpp"
#include "core/sync_status.hpp"
#include "core/types.hpp"
#include "network/connectivity.hpp"
#include "network/remote_gateway.hpp"
#include "notes/conflict_policy.hpp"
#include "notes/image_sync.hpp"
#include "storage/local_store.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace daybook::notes {

/**
 * An envelope produced by the caller, ready to persist.
 */
struct EnvelopeWrite {
    std::string date;
    std::string key_id;
    std::string ciphertext;
    std::string nonce;
    std::string updated_at;
};

/**
 * EnvelopeRepository - encrypted notes kept in step with a remote store.
 *
 * Local writes land immediately and mark the date with a pending
 * operation. sync() pushes pending operations, pushes pending images,
 * then pulls the remote change stream from the persisted cursor. Remote
 * changes never overwrite a date that still has a pending operation.
 *
 * Must be owned by a shared_ptr: asynchronous steps keep it alive.
 */
class EnvelopeRepository : public std::enable_shared_from_this<EnvelopeRepository> {
public:
    struct Options {
        std::chrono::milliseconds refresh_dates_cooldown{2000};
    };

    EnvelopeRepository(std::shared_ptr<storage::LocalStore> store,
                       std::shared_ptr<network::RemoteNotesGateway> gateway,
                       std::shared_ptr<network::Connectivity> connectivity,
                       ClockFn clock,
                       Options options);

    EnvelopeRepository(std::shared_ptr<storage::LocalStore> store,
                       std::shared_ptr<network::RemoteNotesGateway> gateway,
                       std::shared_ptr<network::Connectivity> connectivity)
        : EnvelopeRepository(std::move(store), std::move(gateway), std::move(connectivity),
                             system_clock(), Options{}) {}

    void set_image_sync(std::shared_ptr<ImageSyncService> image_sync) {
        image_sync_ = std::move(image_sync);
    }

    void set_conflict_policy(std::shared_ptr<ConflictPolicy> policy) {
        conflict_policy_ = std::move(policy);
    }

    // Local state -----------------------------------------------------------

    [[nodiscard]] Result<std::optional<NoteEnvelope>, Error> get_envelope(const std::string& date);

    /**
     * Store the envelope and mark the date for upsert.
     */
    [[nodiscard]] Result<void, Error> save_envelope(const EnvelopeWrite& write);

    /**
     * Remove the local envelope. A note the server has seen is marked for
     * remote deletion; one it has never seen is forgotten outright.
     */
    [[nodiscard]] Result<void, Error> delete_envelope(const std::string& date);

    [[nodiscard]] Result<bool, Error> has_pending_op(const std::string& date);
    [[nodiscard]] Result<std::vector<std::string>, Error> get_all_local_dates();
    [[nodiscard]] Result<std::vector<std::string>, Error> get_all_local_dates_for_year(int year);

    /**
     * Local dates merged with the remote date index, in calendar order.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> get_all_dates_for_year(int year);

    [[nodiscard]] Result<bool, Error> has_remote_date_cached(const std::string& date);

    // Remote ----------------------------------------------------------------

    /**
     * Bring one date up to date with the remote store without pushing.
     * Offline yields ok(nullopt); a remote failure falls back to the local
     * envelope.
     */
    void refresh_envelope(const std::string& date,
                          Completion<Result<std::optional<NoteEnvelope>, Error>> done);

    /**
     * Refresh the remote date index for `year`. Concurrent calls for the
     * same year share one request; a completed refresh suppresses further
     * requests for the cooldown period.
     */
    void refresh_dates(int year, std::function<void()> done);

    /**
     * Run one push/pull cycle. A call while a cycle is running joins it.
     */
    void sync(Completion<Result<SyncStatus, SyncError>> done);

    /**
     * Abandon the running cycle. Its waiters fail with SyncErrorKind::Unknown,
     * steps it has not reached are skipped and its outcome is discarded; a
     * push the server already accepted is still recorded.
     */
    void cancel_sync();

    [[nodiscard]] SyncStatus sync_status() const noexcept { return status_; }

    [[nodiscard]] Subscription on_sync_status_change(std::function<void(SyncStatus)> callback) {
        return status_observers_.subscribe(std::move(callback));
    }

private:
    friend class SyncRun;

    void set_status(SyncStatus status);
    Result<void, Error> adopt_remote(const RemoteNote& remote, int64_t local_version);
    Result<void, Error> apply_remote_change(const RemoteNote& remote);
    Result<void, Error> forget(const std::string& date);

    std::shared_ptr<storage::LocalStore> store_;
    std::shared_ptr<network::RemoteNotesGateway> gateway_;
    std::shared_ptr<network::Connectivity> connectivity_;
    std::shared_ptr<ImageSyncService> image_sync_;
    std::shared_ptr<ConflictPolicy> conflict_policy_;
    ClockFn clock_;
    Options options_;

    SyncStatus status_ = SyncStatus::Idle;
    ObserverList<SyncStatus> status_observers_;

    std::vector<Completion<Result<SyncStatus, SyncError>>> sync_waiters_;
    bool sync_running_ = false;
    uint64_t sync_generation_ = 0;

    std::map<int, std::vector<std::function<void()>>> dates_in_flight_;
    std::map<int, Timestamp> dates_refreshed_at_;
};

} // namespace daybook::notes
