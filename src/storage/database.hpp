#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace daybook::storage {

/**
 * Prepared statement; finalized when the last copy goes away.
 *
 * Envelope columns are all TEXT or INTEGER (ciphertext and nonces are
 * base64), so only those bindings exist.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] explicit operator bool() const noexcept { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    /**
     * Bind values to parameters 1..N in order; an empty optional binds NULL.
     * Stops at the first failing parameter.
     */
    template<typename... Args>
    Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        Result<void, Error> result = Result<void, Error>::ok();
        ((result = result.is_ok() ? bind_value(++index, args) : result), ...);
        return result;
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // ok(true) while rows remain, ok(false) once the statement is done.
    Result<bool, Error> step();
    Result<void, Error> reset();

private:
    Result<void, Error> bind_value(int index, std::string_view v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const std::string& v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const char* v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, int v) { return bind_int(index, v); }
    Result<void, Error> bind_value(int index, int64_t v) { return bind_int64(index, v); }
    Result<void, Error> bind_value(int index, bool v) { return bind_int(index, v ? 1 : 0); }

    template<typename T>
    Result<void, Error> bind_value(int index, const std::optional<T>& v) {
        if (!v) return bind_null(index);
        return bind_value(index, *v);
    }

    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - one SQLite connection holding every table of a device:
 * note and image envelopes, their sync metadata, the remote date index
 * and the sync cursor.
 */
class Database {
public:
    /**
     * How long a statement waits on a lock held by another connection
     * to the same file before failing with SQLITE_BUSY.
     */
    static constexpr int kBusyTimeoutMs = 5000;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (creating if needed) the device database at `path` in WAL mode.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Private in-memory database; each call gets a fresh one.
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Run one or more statements that return no rows.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `sql` and call `callback(stmt)` once per row.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }
        return Result<void, Error>::ok();
    }

    /**
     * Run `f` inside a transaction. Commits when it returns ok, rolls back
     * otherwise. The error of `f` is returned even if the rollback also
     * fails; the rollback failure is appended to its message.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] Result<void, Error> configure(bool on_disk);
    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    sqlite3* db_ = nullptr;
};

} // namespace daybook::storage
