#include "network/in_memory_gateway.hpp"
#include "core/note_date.hpp"

#include <algorithm>

namespace daybook::network {

// ============================================================================
// InMemoryRemoteStore
// ============================================================================

InMemoryRemoteStore::InMemoryRemoteStore(ClockFn clock) : clock_(std::move(clock)) {}

std::string InMemoryRemoteStore::next_server_time() {
    // Strictly increasing so the change stream has a total order.
    last_server_millis_ = std::max(clock_().millis(), last_server_millis_ + 1);
    return Timestamp(last_server_millis_).to_iso_string();
}

std::optional<RemoteNote> InMemoryRemoteStore::note_by_date(const std::string& date) const {
    auto it = notes_.find(date);
    if (it == notes_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryRemoteStore::note_dates(std::optional<int> year) const {
    std::vector<std::string> dates;
    for (const auto& [date, note] : notes_) {
        if (note.deleted) continue;
        if (year && !note_date_in_year(date, *year)) continue;
        dates.push_back(date);
    }
    return dates;
}

std::vector<RemoteNote> InMemoryRemoteStore::notes_since(
    const std::optional<std::string>& cursor) const {
    std::vector<RemoteNote> changed;
    for (const auto& [date, note] : notes_) {
        if (!cursor || note.server_updated_at > *cursor) {
            changed.push_back(note);
        }
    }
    std::sort(changed.begin(), changed.end(), [](const RemoteNote& a, const RemoteNote& b) {
        return a.server_updated_at < b.server_updated_at;
    });
    return changed;
}

Result<RemoteNote, SyncError> InMemoryRemoteStore::push(const RemoteNotePayload& payload) {
    using R = Result<RemoteNote, SyncError>;
    if (payload.key_id.empty() || payload.ciphertext.empty() || payload.nonce.empty()) {
        return R::err(SyncError{SyncErrorKind::RemoteRejected, "Envelope is incomplete"});
    }

    auto it = notes_.find(payload.date);
    if (payload.id) {
        if (it == notes_.end() || it->second.id != *payload.id) {
            return R::err(SyncError{SyncErrorKind::Conflict, "Note no longer exists"});
        }
        if (it->second.revision != payload.revision) {
            return R::err(SyncError{SyncErrorKind::Conflict, "Revision mismatch"});
        }
    } else if (it != notes_.end() && !it->second.deleted) {
        return R::err(SyncError{SyncErrorKind::Conflict, "Note already exists for date"});
    }

    RemoteNote note;
    if (it != notes_.end()) {
        note = it->second;
    } else {
        note.id = Uuid::generate().to_string();
        note.date = payload.date;
        note.revision = 0;
    }
    note.key_id = payload.key_id;
    note.ciphertext = payload.ciphertext;
    note.nonce = payload.nonce;
    note.updated_at = payload.updated_at;
    note.revision += 1;
    note.server_updated_at = next_server_time();
    note.deleted = false;

    notes_[payload.date] = note;
    return R::ok(note);
}

Result<void, SyncError> InMemoryRemoteStore::remove(const RemoteNoteRef& ref) {
    auto it = ref.id
        ? std::find_if(notes_.begin(), notes_.end(),
                       [&](const auto& kv) { return kv.second.id == *ref.id; })
        : notes_.find(ref.date);
    if (it == notes_.end() || it->second.deleted) {
        return Result<void, SyncError>::ok();
    }
    it->second.deleted = true;
    it->second.revision += 1;
    it->second.server_updated_at = next_server_time();
    return Result<void, SyncError>::ok();
}

RemoteImageRef InMemoryRemoteStore::put_image(const ImageRecord& record, const ImageMeta& meta) {
    images_[record.id] = {record, meta};
    return RemoteImageRef{
        .remote_path = meta.note_date + "/" + record.id,
        .server_updated_at = next_server_time()
    };
}

void InMemoryRemoteStore::remove_image(const std::string& id) {
    images_.erase(id);
}

// ============================================================================
// InMemoryRemoteGateway
// ============================================================================

InMemoryRemoteGateway::InMemoryRemoteGateway(std::shared_ptr<InMemoryRemoteStore> store)
    : store_(std::move(store)) {}

void InMemoryRemoteGateway::fail_next(SyncErrorKind kind, std::string message) {
    next_failure_ = SyncError{kind, std::move(message)};
}

std::optional<SyncError> InMemoryRemoteGateway::take_failure() {
    if (offline_) {
        return SyncError{SyncErrorKind::Offline, "Network unavailable"};
    }
    if (next_failure_) {
        auto failure = std::move(next_failure_);
        next_failure_.reset();
        return failure;
    }
    return std::nullopt;
}

void InMemoryRemoteGateway::deliver(std::function<void()> completion) {
    if (deferred_) {
        pending_.push_back(std::move(completion));
        return;
    }
    completion();
}

void InMemoryRemoteGateway::release_next() {
    if (pending_.empty()) return;
    auto completion = std::move(pending_.front());
    pending_.pop_front();
    completion();
}

void InMemoryRemoteGateway::release_all() {
    // Completions may issue further calls; those queue behind and are
    // released too.
    while (!pending_.empty()) {
        release_next();
    }
}

void InMemoryRemoteGateway::fetch_note_by_date(
    const std::string& date,
    Completion<Result<std::optional<RemoteNote>, SyncError>> done) {
    using R = Result<std::optional<RemoteNote>, SyncError>;
    ++fetch_by_date_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return R::ok(store_->note_by_date(date));
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::fetch_note_dates(
    std::optional<int> year,
    Completion<Result<std::vector<std::string>, SyncError>> done) {
    using R = Result<std::vector<std::string>, SyncError>;
    ++fetch_dates_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return R::ok(store_->note_dates(year));
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::fetch_notes_since(
    const std::optional<std::string>& cursor,
    Completion<Result<std::vector<RemoteNote>, SyncError>> done) {
    using R = Result<std::vector<RemoteNote>, SyncError>;
    ++fetch_since_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return R::ok(store_->notes_since(cursor));
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::push_note(
    const RemoteNotePayload& payload,
    Completion<Result<RemoteNote, SyncError>> done) {
    using R = Result<RemoteNote, SyncError>;
    ++push_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return store_->push(payload);
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::delete_note(
    const RemoteNoteRef& ref,
    Completion<Result<void, SyncError>> done) {
    using R = Result<void, SyncError>;
    ++delete_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return store_->remove(ref);
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::upload_image(
    const ImageRecord& record,
    const ImageMeta& meta,
    Completion<Result<RemoteImageRef, SyncError>> done) {
    using R = Result<RemoteImageRef, SyncError>;
    ++upload_count_;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        return R::ok(store_->put_image(record, meta));
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

void InMemoryRemoteGateway::delete_image(
    const std::string& id,
    Completion<Result<void, SyncError>> done) {
    using R = Result<void, SyncError>;
    auto result = [&]() -> R {
        if (auto failure = take_failure()) return R::err(*failure);
        store_->remove_image(id);
        return R::ok();
    }();
    deliver([done = std::move(done), result = std::move(result)] { done(result); });
}

} // namespace daybook::network
