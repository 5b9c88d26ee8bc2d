#include "storage/migrations.hpp"

#include <QDebug>

namespace daybook::storage {

namespace {

std::string step_label(const Migration& m) {
    return "schema v" + std::to_string(m.version) + " (" + m.name + ")";
}

Error wrap(const std::string& context, const Error& cause) {
    return Error{context + ": " + cause.message, cause.code};
}

} // namespace

Result<int, Error> MigrationRunner::current_version() {
    using R = Result<int, Error>;
    auto stmt_result = db_.prepare("PRAGMA user_version;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    return R::ok(step_result.unwrap() ? stmt.column_int(0) : 0);
}

Result<void, Error> MigrationRunner::write_version(int version) {
    // PRAGMA arguments cannot be bound; the value is always one of ours.
    return db_.execute("PRAGMA user_version = " + std::to_string(version) + ";");
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto applied = db_.execute(m.up_sql);
    if (applied.is_err()) {
        return Result<void, Error>::err(wrap("applying " + step_label(m), applied.unwrap_err()));
    }
    qInfo() << "STORAGE: applied" << QString::fromStdString(step_label(m));
    return write_version(m.version);
}

Result<void, Error> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(Error{step_label(m) + " cannot be reverted"});
    }
    auto reverted = db_.execute(m.down_sql);
    if (reverted.is_err()) {
        return Result<void, Error>::err(wrap("reverting " + step_label(m), reverted.unwrap_err()));
    }
    qInfo() << "STORAGE: reverted" << QString::fromStdString(step_label(m));
    return write_version(m.version - 1);
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();

    if (current > latest_version()) {
        qWarning() << "STORAGE: database schema" << current
                   << "is newer than supported schema" << latest_version();
        return Result<void, Error>::err(Error{
            "database schema v" + std::to_string(current) +
            " is newer than this build supports (v" + std::to_string(latest_version()) + ")"});
    }
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current || m.version > target_version) continue;
            auto applied = apply(m);
            if (applied.is_err()) return applied;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }
    const int current = current_result.unwrap();
    if (current <= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > current || it->version <= target_version) continue;
            auto reverted = revert(*it);
            if (reverted.is_err()) return reverted;
        }
        return Result<void, Error>::ok();
    });
}

} // namespace daybook::storage
