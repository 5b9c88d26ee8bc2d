#include "storage/remote_note_index.hpp"
#include "core/note_date.hpp"

namespace daybook::storage {

Result<bool, Error> RemoteNoteIndex::contains(const std::string& date) {
    auto stmt_result = db_.prepare("SELECT 1 FROM remote_note_index WHERE date = ?;");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date);
    if (bind_result.is_err()) {
        return Result<bool, Error>::err(bind_result.unwrap_err());
    }
    return stmt.step();
}

Result<std::vector<std::string>, Error> RemoteNoteIndex::dates_for_year(int year) {
    using R = Result<std::vector<std::string>, Error>;
    auto stmt_result = db_.prepare(
        "SELECT date FROM remote_note_index WHERE year = ? ORDER BY date;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(year);
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

Result<void, Error> RemoteNoteIndex::insert(const std::string& date, int year,
                                            const std::string& fetched_at) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO remote_note_index (date, year, fetched_at) VALUES (?, ?, ?)
        ON CONFLICT(date) DO UPDATE SET fetched_at = excluded.fetched_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(date, year, fetched_at);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> RemoteNoteIndex::set_dates_for_year(int year,
                                                        const std::vector<std::string>& dates,
                                                        const std::string& fetched_at) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM remote_note_index WHERE year = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(year);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }

        for (const auto& date : dates) {
            if (!note_date_in_year(date, year)) continue;
            auto result = insert(date, year, fetched_at);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> RemoteNoteIndex::add(const std::string& date, const std::string& fetched_at) {
    auto year = note_date_year(date);
    if (!year) {
        return Result<void, Error>::err(Error{"Invalid note date: " + date});
    }
    return insert(date, *year, fetched_at);
}

Result<void, Error> RemoteNoteIndex::remove(const std::string& date) {
    auto stmt_result = db_.prepare("DELETE FROM remote_note_index WHERE date = ?;");
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

} // namespace daybook::storage
