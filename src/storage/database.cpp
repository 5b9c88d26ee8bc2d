#include "storage/database.hpp"

#include <QDebug>

namespace daybook::storage {

namespace {

constexpr const char* kMemoryPath = ":memory:";

Result<void, Error> check_bind(int rc, const char* kind, int index) {
    if (rc == SQLITE_OK) {
        return Result<void, Error>::ok();
    }
    return Result<void, Error>::err(Error{
        std::string("bind ") + kind + " to parameter " + std::to_string(index) + ": " +
            sqlite3_errstr(rc),
        rc});
}

} // namespace

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text", index);
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int", index);
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64", index);
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null", index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return Result<bool, Error>::ok(true);
    if (rc == SQLITE_DONE) return Result<bool, Error>::ok(false);

    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(Error{db ? sqlite3_errmsg(db) : sqlite3_errstr(rc), rc});
}

Result<void, Error> Statement::reset() {
    const int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{std::string("reset: ") + sqlite3_errstr(rc), rc});
    }
    return Result<void, Error>::ok();
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        qWarning() << "STORAGE: cannot open" << QString::fromStdString(path) << ":"
                   << QString::fromStdString(message);
        return Result<Database, Error>::err(Error{"open " + path + ": " + message, rc});
    }

    Database database(handle);
    auto configured = database.configure(path != kMemoryPath);
    if (configured.is_err()) {
        return Result<Database, Error>::err(configured.unwrap_err());
    }
    return Result<Database, Error>::ok(std::move(database));
}

Result<Database, Error> Database::open_memory() {
    return open(kMemoryPath);
}

Result<void, Error> Database::configure(bool on_disk) {
    const int busy_rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    if (busy_rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{last_error(), busy_rc});
    }
    if (!on_disk) {
        return Result<void, Error>::ok();
    }
    // WAL lets the editor read while a sync run writes.
    return execute("PRAGMA journal_mode = WAL;")
        .and_then([this] { return execute("PRAGMA synchronous = NORMAL;"); });
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()),
                                      &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{std::move(message), rc});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    // Takes the write lock up front: a busy database fails at BEGIN.
    return execute("BEGIN IMMEDIATE;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

} // namespace daybook::storage
