#include "storage/note_store.hpp"

namespace daybook::storage {

namespace {

constexpr const char* kMetaColumns =
    "date, revision, remote_id, server_updated_at, last_synced_at, pending_op, local_version";

std::optional<std::string> optional_text(Statement& stmt, int index) {
    if (stmt.column_is_null(index)) return std::nullopt;
    return stmt.column_text(index);
}

} // namespace

NoteRecord NoteStore::row_to_record(Statement& stmt) {
    return NoteRecord{
        .version = stmt.column_int(1),
        .date = stmt.column_text(0),
        .key_id = stmt.column_text(2),
        .ciphertext = stmt.column_text(3),
        .nonce = stmt.column_text(4),
        .updated_at = stmt.column_text(5)
    };
}

NoteMeta NoteStore::row_to_meta(Statement& stmt) {
    std::optional<PendingOp> op;
    if (!stmt.column_is_null(5)) {
        op = pending_op_from_string(stmt.column_text(5));
    }
    return NoteMeta{
        .date = stmt.column_text(0),
        .revision = stmt.column_int64(1),
        .remote_id = optional_text(stmt, 2),
        .server_updated_at = optional_text(stmt, 3),
        .last_synced_at = optional_text(stmt, 4),
        .pending_op = op,
        .local_version = stmt.column_int64(6)
    };
}

Result<std::optional<NoteRecord>, Error> NoteStore::get_record(const std::string& date) {
    using R = Result<std::optional<NoteRecord>, Error>;
    auto stmt_result = db_.prepare(R"SQL(
        SELECT date, version, key_id, ciphertext, nonce, updated_at
        FROM notes WHERE date = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date);
    if (bind_result.is_err()) {
        return R::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_record(stmt));
}

Result<void, Error> NoteStore::put_record(const NoteRecord& record) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO notes (date, version, key_id, ciphertext, nonce, updated_at)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(date) DO UPDATE SET
            version = excluded.version,
            key_id = excluded.key_id,
            ciphertext = excluded.ciphertext,
            nonce = excluded.nonce,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(record.date, record.version, record.key_id,
                                     record.ciphertext, record.nonce, record.updated_at);
    if (bind_result.is_err()) {
        return bind_result;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> NoteStore::delete_record(const std::string& date) {
    auto stmt_result = db_.prepare("DELETE FROM notes WHERE date = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<std::optional<NoteMeta>, Error> NoteStore::get_meta(const std::string& date) {
    using R = Result<std::optional<NoteMeta>, Error>;
    auto stmt_result = db_.prepare(
        std::string("SELECT ") + kMetaColumns + " FROM note_meta WHERE date = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date);
    if (bind_result.is_err()) {
        return R::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_meta(stmt));
}

Result<void, Error> NoteStore::put_meta(const NoteMeta& meta) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO note_meta (date, revision, remote_id, server_updated_at,
                               last_synced_at, pending_op, local_version)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(date) DO UPDATE SET
            revision = excluded.revision,
            remote_id = excluded.remote_id,
            server_updated_at = excluded.server_updated_at,
            last_synced_at = excluded.last_synced_at,
            pending_op = excluded.pending_op,
            local_version = excluded.local_version;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    std::optional<std::string> op;
    if (meta.pending_op) {
        op = to_string(*meta.pending_op);
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(meta.date, meta.revision, meta.remote_id,
                                     meta.server_updated_at, meta.last_synced_at,
                                     op, meta.local_version);
    if (bind_result.is_err()) {
        return bind_result;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> NoteStore::delete_meta(const std::string& date) {
    auto stmt_result = db_.prepare("DELETE FROM note_meta WHERE date = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> NoteStore::put(const NoteRecord& record, const NoteMeta& meta) {
    return db_.transaction([&]() -> Result<void, Error> {
        return put_record(record).and_then([&] { return put_meta(meta); });
    });
}

Result<void, Error> NoteStore::remove(const std::string& date) {
    return db_.transaction([&]() -> Result<void, Error> {
        return delete_record(date).and_then([&] { return delete_meta(date); });
    });
}

Result<std::vector<std::string>, Error> NoteStore::all_dates() {
    std::vector<std::string> dates;
    auto result = db_.query("SELECT date FROM notes ORDER BY date;",
                            [&](Statement& stmt) { dates.push_back(stmt.column_text(0)); });
    if (result.is_err()) {
        return Result<std::vector<std::string>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(dates));
}

Result<std::vector<std::string>, Error> NoteStore::dates_for_year(int year) {
    using R = Result<std::vector<std::string>, Error>;
    // Keys are DD-MM-YYYY, so the year is the suffix.
    auto stmt_result = db_.prepare("SELECT date FROM notes WHERE date LIKE ? ORDER BY date;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all("%-" + std::to_string(year));
    if (bind_result.is_err()) {
        return R::err(bind_result.unwrap_err());
    }

    std::vector<std::string> dates;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        dates.push_back(stmt.column_text(0));
    }
    return R::ok(std::move(dates));
}

Result<std::vector<NoteMeta>, Error> NoteStore::pending_metas() {
    std::vector<NoteMeta> metas;
    auto result = db_.query(
        std::string("SELECT ") + kMetaColumns +
            " FROM note_meta WHERE pending_op IS NOT NULL ORDER BY date;",
        [&](Statement& stmt) { metas.push_back(row_to_meta(stmt)); });
    if (result.is_err()) {
        return Result<std::vector<NoteMeta>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<NoteMeta>, Error>::ok(std::move(metas));
}

Result<int, Error> NoteStore::count_pending() {
    int count = 0;
    auto result = db_.query("SELECT COUNT(*) FROM note_meta WHERE pending_op IS NOT NULL;",
                            [&](Statement& stmt) { count = stmt.column_int(0); });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(count);
}

} // namespace daybook::storage
