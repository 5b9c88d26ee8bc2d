#pragma once

#include "network/remote_gateway.hpp"
#include "core/types.hpp"
#include <deque>
#include <functional>
#include <map>
#include <memory>

namespace daybook::network {

/**
 * InMemoryRemoteStore - reference server state for the remote contract.
 *
 * Several gateways may share one store to model multiple devices on the
 * same account.
 */
class InMemoryRemoteStore {
public:
    explicit InMemoryRemoteStore(ClockFn clock = system_clock());

    [[nodiscard]] std::optional<RemoteNote> note_by_date(const std::string& date) const;
    [[nodiscard]] std::vector<std::string> note_dates(std::optional<int> year) const;
    [[nodiscard]] std::vector<RemoteNote> notes_since(const std::optional<std::string>& cursor) const;
    [[nodiscard]] Result<RemoteNote, SyncError> push(const RemoteNotePayload& payload);
    [[nodiscard]] Result<void, SyncError> remove(const RemoteNoteRef& ref);

    [[nodiscard]] RemoteImageRef put_image(const ImageRecord& record, const ImageMeta& meta);
    void remove_image(const std::string& id);
    [[nodiscard]] bool has_image(const std::string& id) const { return images_.contains(id); }

    [[nodiscard]] size_t note_count() const noexcept { return notes_.size(); }

private:
    std::string next_server_time();

    ClockFn clock_;
    int64_t last_server_millis_ = 0;
    std::map<std::string, RemoteNote> notes_;  // by date
    std::map<std::string, std::pair<ImageRecord, ImageMeta>> images_;
};

/**
 * InMemoryRemoteGateway - one device's connection to an InMemoryRemoteStore.
 *
 * Completions run inline unless deferred, in which case they queue until
 * released, so callers can interleave responses with other work. Results
 * are computed when the call is made.
 */
class InMemoryRemoteGateway : public RemoteNotesGateway, public RemoteImagesGateway {
public:
    explicit InMemoryRemoteGateway(std::shared_ptr<InMemoryRemoteStore> store);

    void fetch_note_by_date(
        const std::string& date,
        Completion<Result<std::optional<RemoteNote>, SyncError>> done) override;
    void fetch_note_dates(
        std::optional<int> year,
        Completion<Result<std::vector<std::string>, SyncError>> done) override;
    void fetch_notes_since(
        const std::optional<std::string>& cursor,
        Completion<Result<std::vector<RemoteNote>, SyncError>> done) override;
    void push_note(
        const RemoteNotePayload& payload,
        Completion<Result<RemoteNote, SyncError>> done) override;
    void delete_note(
        const RemoteNoteRef& ref,
        Completion<Result<void, SyncError>> done) override;

    void upload_image(
        const ImageRecord& record,
        const ImageMeta& meta,
        Completion<Result<RemoteImageRef, SyncError>> done) override;
    void delete_image(
        const std::string& id,
        Completion<Result<void, SyncError>> done) override;

    /**
     * While offline every call fails with SyncErrorKind::Offline.
     */
    void set_offline(bool offline) noexcept { offline_ = offline; }

    /**
     * Fail the next call (of any kind) with `kind`.
     */
    void fail_next(SyncErrorKind kind, std::string message = "injected failure");

    void set_deferred(bool deferred) noexcept { deferred_ = deferred; }
    [[nodiscard]] size_t pending_count() const noexcept { return pending_.size(); }
    void release_next();
    void release_all();

    [[nodiscard]] int push_count() const noexcept { return push_count_; }
    [[nodiscard]] int delete_count() const noexcept { return delete_count_; }
    [[nodiscard]] int fetch_by_date_count() const noexcept { return fetch_by_date_count_; }
    [[nodiscard]] int fetch_since_count() const noexcept { return fetch_since_count_; }
    [[nodiscard]] int fetch_dates_count() const noexcept { return fetch_dates_count_; }
    [[nodiscard]] int upload_count() const noexcept { return upload_count_; }

private:
    std::optional<SyncError> take_failure();
    void deliver(std::function<void()> completion);

    std::shared_ptr<InMemoryRemoteStore> store_;
    bool offline_ = false;
    bool deferred_ = false;
    std::optional<SyncError> next_failure_;
    std::deque<std::function<void()>> pending_;

    int push_count_ = 0;
    int delete_count_ = 0;
    int fetch_by_date_count_ = 0;
    int fetch_since_count_ = 0;
    int fetch_dates_count_ = 0;
    int upload_count_ = 0;
};

} // namespace daybook::network
