#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace daybook::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // empty when the step cannot be reverted
};

// Ordered by version; versions are never reused once shipped.
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            -- Encrypted note envelopes, one per calendar day
            CREATE TABLE IF NOT EXISTS notes (
                date TEXT PRIMARY KEY,
                version INTEGER NOT NULL DEFAULT 1,
                key_id TEXT NOT NULL,
                ciphertext TEXT NOT NULL,
                nonce TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );
            
            -- Sync bookkeeping; a row can outlive its note while a delete is pending
            CREATE TABLE IF NOT EXISTS note_meta (
                date TEXT PRIMARY KEY,
                revision INTEGER NOT NULL DEFAULT 0,
                remote_id TEXT,
                server_updated_at TEXT,
                last_synced_at TEXT,
                pending_op TEXT CHECK (pending_op IN ('upsert', 'delete'))
            );
            CREATE INDEX IF NOT EXISTS idx_note_meta_pending ON note_meta(pending_op);
            
            CREATE TABLE IF NOT EXISTS sync_state (
                id TEXT PRIMARY KEY,
                cursor TEXT
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_state;
            DROP INDEX IF EXISTS idx_note_meta_pending;
            DROP TABLE IF EXISTS note_meta;
            DROP TABLE IF EXISTS notes;
        )SQL"
    },
    {
        .version = 2,
        .name = "images",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS images (
                id TEXT PRIMARY KEY,
                version INTEGER NOT NULL DEFAULT 1,
                key_id TEXT NOT NULL,
                ciphertext TEXT NOT NULL,
                nonce TEXT NOT NULL
            );
            
            CREATE TABLE IF NOT EXISTS image_meta (
                id TEXT PRIMARY KEY,
                note_date TEXT NOT NULL,
                type TEXT NOT NULL CHECK (type IN ('background', 'inline')),
                filename TEXT NOT NULL DEFAULT '',
                mime_type TEXT NOT NULL DEFAULT '',
                width INTEGER NOT NULL DEFAULT 0,
                height INTEGER NOT NULL DEFAULT 0,
                size INTEGER NOT NULL DEFAULT 0,
                created_at TEXT NOT NULL,
                sha256 TEXT NOT NULL,
                key_id TEXT NOT NULL,
                remote_path TEXT,
                server_updated_at TEXT,
                pending_op TEXT CHECK (pending_op IN ('upload', 'delete'))
            );
            CREATE INDEX IF NOT EXISTS idx_image_meta_note_date ON image_meta(note_date);
            CREATE INDEX IF NOT EXISTS idx_image_meta_pending ON image_meta(pending_op);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_image_meta_pending;
            DROP INDEX IF EXISTS idx_image_meta_note_date;
            DROP TABLE IF EXISTS image_meta;
            DROP TABLE IF EXISTS images;
        )SQL"
    },
    {
        .version = 3,
        .name = "remote_note_index",
        .up_sql = R"SQL(
            -- Dates known to exist remotely, used to detect offline stubs
            CREATE TABLE IF NOT EXISTS remote_note_index (
                date TEXT PRIMARY KEY,
                year INTEGER NOT NULL,
                fetched_at TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_remote_note_index_year ON remote_note_index(year);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_remote_note_index_year;
            DROP TABLE IF EXISTS remote_note_index;
        )SQL"
    },
    {
        .version = 4,
        .name = "note_meta_local_version",
        .up_sql = R"SQL(
            ALTER TABLE note_meta ADD COLUMN local_version INTEGER NOT NULL DEFAULT 0;
        )SQL",
        .down_sql = R"SQL(
            ALTER TABLE note_meta DROP COLUMN local_version;
        )SQL"
    }
};

/**
 * MigrationRunner - brings a device database to the schema this build reads.
 *
 * The applied version is kept in `PRAGMA user_version`, so it travels with
 * the database file. A file written by a newer build is refused rather than
 * read with a schema it does not know.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Apply every pending migration in one transaction.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Revert migrations newer than `target_version`, newest first.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() noexcept {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);
    [[nodiscard]] Result<void, Error> write_version(int version);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace daybook::storage
