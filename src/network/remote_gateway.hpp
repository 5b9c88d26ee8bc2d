#pragma once

#include "core/completion.hpp"
#include "core/errors.hpp"
#include "core/image.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace daybook::network {

/**
 * RemoteNotesGateway - wire contract of the remote note store.
 *
 * The store keeps one row per date with a server-assigned id, a revision
 * that increases on every accepted push, a server timestamp that orders
 * the change stream, and a tombstone flag.
 */
class RemoteNotesGateway {
public:
    virtual ~RemoteNotesGateway() = default;

    /**
     * The row for `date`, tombstoned or not, or nullopt if none exists.
     */
    virtual void fetch_note_by_date(
        const std::string& date,
        Completion<Result<std::optional<RemoteNote>, SyncError>> done) = 0;

    /**
     * Dates of live (non-deleted) notes, optionally limited to one year.
     */
    virtual void fetch_note_dates(
        std::optional<int> year,
        Completion<Result<std::vector<std::string>, SyncError>> done) = 0;

    /**
     * Rows changed strictly after `cursor`, ascending by server_updated_at,
     * tombstones included. A null cursor returns everything.
     */
    virtual void fetch_notes_since(
        const std::optional<std::string>& cursor,
        Completion<Result<std::vector<RemoteNote>, SyncError>> done) = 0;

    /**
     * Insert (no id) or conditionally update (id + expected revision).
     * A stale revision or a duplicate insert fails with Conflict.
     */
    virtual void push_note(
        const RemoteNotePayload& payload,
        Completion<Result<RemoteNote, SyncError>> done) = 0;

    /**
     * Tombstone the row matching id, or date when id is absent.
     * Deleting a missing row succeeds.
     */
    virtual void delete_note(
        const RemoteNoteRef& ref,
        Completion<Result<void, SyncError>> done) = 0;
};

struct RemoteImageRef {
    std::string remote_path;
    std::string server_updated_at;
};

/**
 * RemoteImagesGateway - blob storage for encrypted images.
 */
class RemoteImagesGateway {
public:
    virtual ~RemoteImagesGateway() = default;

    virtual void upload_image(
        const ImageRecord& record,
        const ImageMeta& meta,
        Completion<Result<RemoteImageRef, SyncError>> done) = 0;

    virtual void delete_image(
        const std::string& id,
        Completion<Result<void, SyncError>> done) = 0;
};

} // namespace daybook::network
