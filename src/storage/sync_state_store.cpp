#include "storage/sync_state_store.hpp"

namespace daybook::storage {

Result<std::optional<std::string>, Error> SyncStateStore::cursor() {
    using R = Result<std::optional<std::string>, Error>;
    auto stmt_result = db_.prepare("SELECT cursor FROM sync_state WHERE id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(STATE_ID);
    if (bind_result.is_err()) {
        return R::err(bind_result.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap() || stmt.column_is_null(0)) {
        return R::ok(std::nullopt);
    }
    return R::ok(stmt.column_text(0));
}

Result<void, Error> SyncStateStore::set_cursor(const std::optional<std::string>& cursor) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_state (id, cursor) VALUES (?, ?)
        ON CONFLICT(id) DO UPDATE SET cursor = excluded.cursor;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(STATE_ID, cursor);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace daybook::storage
