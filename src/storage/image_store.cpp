#include "storage/image_store.hpp"

namespace daybook::storage {

namespace {

constexpr const char* kMetaColumns =
    "id, note_date, type, filename, mime_type, width, height, size, created_at, "
    "sha256, key_id, remote_path, server_updated_at, pending_op";

std::optional<std::string> optional_text(Statement& stmt, int index) {
    if (stmt.column_is_null(index)) return std::nullopt;
    return stmt.column_text(index);
}

Result<void, Error> exec_one(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace

ImageMeta ImageStore::row_to_meta(Statement& stmt) {
    std::optional<ImagePendingOp> op;
    if (!stmt.column_is_null(13)) {
        const auto text = stmt.column_text(13);
        if (text == "upload") op = ImagePendingOp::Upload;
        else if (text == "delete") op = ImagePendingOp::Delete;
    }
    return ImageMeta{
        .id = stmt.column_text(0),
        .note_date = stmt.column_text(1),
        .type = stmt.column_text(2) == "background" ? ImageType::Background : ImageType::Inline,
        .filename = stmt.column_text(3),
        .mime_type = stmt.column_text(4),
        .width = stmt.column_int(5),
        .height = stmt.column_int(6),
        .size = stmt.column_int64(7),
        .created_at = stmt.column_text(8),
        .sha256 = stmt.column_text(9),
        .key_id = stmt.column_text(10),
        .remote_path = optional_text(stmt, 11),
        .server_updated_at = optional_text(stmt, 12),
        .pending_op = op
    };
}

Result<std::optional<ImageRecord>, Error> ImageStore::get_record(const std::string& id) {
    using R = Result<std::optional<ImageRecord>, Error>;
    auto stmt_result = db_.prepare(
        "SELECT id, version, key_id, ciphertext, nonce FROM images WHERE id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id);
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
    return R::ok(ImageRecord{
        .version = stmt.column_int(1),
        .id = stmt.column_text(0),
        .key_id = stmt.column_text(2),
        .ciphertext = stmt.column_text(3),
        .nonce = stmt.column_text(4)
    });
}

Result<std::optional<ImageMeta>, Error> ImageStore::get_meta(const std::string& id) {
    using R = Result<std::optional<ImageMeta>, Error>;
    auto metas = select_metas("id = ?", id);
    if (metas.is_err()) {
        return R::err(metas.unwrap_err());
    }
    auto& rows = metas.unwrap();
    if (rows.empty()) {
        return R::ok(std::nullopt);
    }
    return R::ok(std::move(rows.front()));
}

Result<void, Error> ImageStore::put_meta(const ImageMeta& meta) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO image_meta (id, note_date, type, filename, mime_type, width, height,
                                size, created_at, sha256, key_id, remote_path,
                                server_updated_at, pending_op)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            note_date = excluded.note_date,
            type = excluded.type,
            filename = excluded.filename,
            mime_type = excluded.mime_type,
            width = excluded.width,
            height = excluded.height,
            size = excluded.size,
            created_at = excluded.created_at,
            sha256 = excluded.sha256,
            key_id = excluded.key_id,
            remote_path = excluded.remote_path,
            server_updated_at = excluded.server_updated_at,
            pending_op = excluded.pending_op;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    std::optional<std::string> op;
    if (meta.pending_op) {
        op = to_string(*meta.pending_op);
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(meta.id, meta.note_date, to_string(meta.type),
                                     meta.filename, meta.mime_type, meta.width, meta.height,
                                     meta.size, meta.created_at, meta.sha256, meta.key_id,
                                     meta.remote_path, meta.server_updated_at, op);
    if (bind_result.is_err()) {
        return bind_result;
    }
    return exec_one(stmt);
}

Result<void, Error> ImageStore::put(const ImageRecord& record, const ImageMeta& meta) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO images (id, version, key_id, ciphertext, nonce)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                version = excluded.version,
                key_id = excluded.key_id,
                ciphertext = excluded.ciphertext,
                nonce = excluded.nonce;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(record.id, record.version, record.key_id,
                                         record.ciphertext, record.nonce);
        if (bind_result.is_err()) {
            return bind_result;
        }
        return exec_one(stmt).and_then([&] { return put_meta(meta); });
    });
}

Result<void, Error> ImageStore::delete_record(const std::string& id) {
    auto stmt_result = db_.prepare("DELETE FROM images WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id);
    if (bind_result.is_err()) {
        return bind_result;
    }
    return exec_one(stmt);
}

Result<void, Error> ImageStore::remove(const std::string& id) {
    return db_.transaction([&]() -> Result<void, Error> {
        return delete_record(id).and_then([&]() -> Result<void, Error> {
            auto stmt_result = db_.prepare("DELETE FROM image_meta WHERE id = ?;");
            if (stmt_result.is_err()) {
                return Result<void, Error>::err(stmt_result.unwrap_err());
            }
            auto stmt = std::move(stmt_result).unwrap();
            auto bind_result = stmt.bind_all(id);
            if (bind_result.is_err()) {
                return bind_result;
            }
            return exec_one(stmt);
        });
    });
}

Result<std::vector<ImageMeta>, Error> ImageStore::select_metas(
    const std::string& where,
    const std::optional<std::string>& arg) {
    using R = Result<std::vector<ImageMeta>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT ") + kMetaColumns +
                                   " FROM image_meta WHERE " + where + " ORDER BY created_at, id;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    if (arg) {
        auto bind_result = stmt.bind_all(*arg);
        if (bind_result.is_err()) {
            return R::err(bind_result.unwrap_err());
        }
    }

    std::vector<ImageMeta> metas;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        metas.push_back(row_to_meta(stmt));
    }
    return R::ok(std::move(metas));
}

Result<std::vector<ImageMeta>, Error> ImageStore::metas_for_note(const std::string& note_date) {
    return select_metas("note_date = ?", note_date);
}

Result<std::vector<ImageMeta>, Error> ImageStore::pending_metas() {
    return select_metas("pending_op IS NOT NULL", std::nullopt);
}

Result<int, Error> ImageStore::count_pending() {
    int count = 0;
    auto result = db_.query("SELECT COUNT(*) FROM image_meta WHERE pending_op IS NOT NULL;",
                            [&](Statement& stmt) { count = stmt.column_int(0); });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(count);
}

} // namespace daybook::storage
