#pragma once

#include "core/errors.hpp"
#include "core/sync_status.hpp"
#include "notes/note_repository.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace daybook::sync {

/**
 * SyncService - runs repository syncs one at a time.
 *
 * A sync_now() while a run is in flight sets a single queued flag, so any
 * number of requests collapse into at most one further run. An error
 * stops the loop; the queued run is dropped and the next request starts
 * afresh. Every run carries a generation; results from a cancelled
 * generation are ignored.
 */
class SyncService : public std::enable_shared_from_this<SyncService> {
public:
    struct Callbacks {
        std::function<void()> on_sync_start;
        std::function<void(SyncStatus)> on_sync_complete;
        std::function<void(const SyncError&)> on_sync_error;
    };

    SyncService(std::shared_ptr<notes::SyncCapableRepository> repository, Callbacks callbacks);

    /**
     * Start (or queue) a sync. `done` runs when the loop that serves this
     * request stops.
     */
    void sync_now(std::function<void()> done = {});

    /**
     * Drop any queued run and stop reporting. An in-flight repository call
     * still completes.
     */
    void dispose();

    /**
     * Abandon the in-flight run. Its late result is ignored, the queued run
     * and the waiters of the abandoned loop are dropped, and the
     * repository cycle is cancelled so the next sync_now() starts fresh.
     */
    void cancel();

    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] bool is_queued() const noexcept { return queued_; }

private:
    void run_once();
    void on_result(uint64_t generation, Result<SyncStatus, SyncError> result);
    void finish();

    std::shared_ptr<notes::SyncCapableRepository> repository_;
    Callbacks callbacks_;
    bool running_ = false;
    bool queued_ = false;
    bool disposed_ = false;
    uint64_t generation_ = 0;
    std::vector<std::function<void()>> waiters_;
};

} // namespace daybook::sync
