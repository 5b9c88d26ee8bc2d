#pragma once

#include "storage/database.hpp"
#include "storage/image_store.hpp"
#include "storage/migrations.hpp"
#include "storage/note_store.hpp"
#include "storage/remote_note_index.hpp"
#include "storage/sync_state_store.hpp"
#include "core/result.hpp"
#include <memory>
#include <string>

namespace daybook::storage {

/**
 * LocalStore - one migrated database and the stores that share it.
 *
 * Pinned in place (the stores hold references to `db`), so it is only
 * handed out through shared_ptr.
 */
class LocalStore {
public:
    [[nodiscard]] static Result<std::shared_ptr<LocalStore>, Error> open(const std::string& path);
    [[nodiscard]] static Result<std::shared_ptr<LocalStore>, Error> open_memory();

    explicit LocalStore(Database database)
        : db(std::move(database)), notes(db), images(db), sync_state(db), remote_index(db) {}

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    Database db;
    NoteStore notes;
    ImageStore images;
    SyncStateStore sync_state;
    RemoteNoteIndex remote_index;

private:
    static Result<std::shared_ptr<LocalStore>, Error> from(Result<Database, Error> opened);
};

inline Result<std::shared_ptr<LocalStore>, Error> LocalStore::from(Result<Database, Error> opened) {
    using R = Result<std::shared_ptr<LocalStore>, Error>;
    if (opened.is_err()) {
        return R::err(opened.unwrap_err());
    }
    auto store = std::make_shared<LocalStore>(std::move(opened).unwrap());
    auto migrated = initialize_database(store->db);
    if (migrated.is_err()) {
        return R::err(migrated.unwrap_err());
    }
    return R::ok(std::move(store));
}

inline Result<std::shared_ptr<LocalStore>, Error> LocalStore::open(const std::string& path) {
    return from(Database::open(path));
}

inline Result<std::shared_ptr<LocalStore>, Error> LocalStore::open_memory() {
    return from(Database::open_memory());
}

} // namespace daybook::storage
