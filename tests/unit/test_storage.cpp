#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/local_store.hpp"
#include "storage/migrations.hpp"

using namespace daybook;
using namespace daybook::storage;

namespace {

NoteRecord record_for(const std::string& date, const std::string& ciphertext = "c2VhbGVk") {
    return NoteRecord{
        .version = 1,
        .date = date,
        .key_id = "k1",
        .ciphertext = ciphertext,
        .nonce = "bm9uY2U=",
        .updated_at = "2024-03-01T10:00:00.000Z"
    };
}

ImageMeta image_meta_for(const std::string& id, const std::string& date) {
    ImageMeta meta;
    meta.id = id;
    meta.note_date = date;
    meta.type = ImageType::Inline;
    meta.filename = "photo.jpg";
    meta.mime_type = "image/jpeg";
    meta.size = 42;
    meta.created_at = "2024-03-01T10:00:00.000Z";
    meta.sha256 = "00ff";
    meta.key_id = "k1";
    meta.pending_op = ImagePendingOp::Upload;
    return meta;
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db = Database::open_memory().unwrap();

    SECTION("Prepare, bind and step") {
        REQUIRE(db.execute("CREATE TABLE t (id INTEGER, name TEXT);").is_ok());
        auto insert = db.prepare("INSERT INTO t VALUES (?, ?);").unwrap();
        REQUIRE(insert.bind_all(1, std::string("first")).is_ok());
        REQUIRE(insert.step().is_ok());

        auto stmt = db.prepare("SELECT id, name FROM t;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "first");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction rolls back on error") {
        REQUIRE(db.execute("CREATE TABLE t (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO t VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO t VALUES (2);");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"forced"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM t;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }

    SECTION("Binding a missing parameter reports its index and code") {
        REQUIRE(db.execute("CREATE TABLE t (id INTEGER);").is_ok());
        auto insert = db.prepare("INSERT INTO t VALUES (?);").unwrap();
        auto bound = insert.bind_all(1, std::string("extra"));
        REQUIRE(bound.is_err());
        REQUIRE(bound.unwrap_err().code == SQLITE_RANGE);
        REQUIRE(bound.unwrap_err().message.find("parameter 2") != std::string::npos);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());

    SECTION("Migrating twice is a no-op") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Schema carries the local version column") {
        REQUIRE(db.execute("INSERT INTO note_meta (date, local_version) VALUES ('01-01-2024', 3);")
                    .is_ok());
    }

    SECTION("Rollback removes the remote index table") {
        REQUIRE(runner.rollback_to(2).is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
        REQUIRE(db.execute("SELECT * FROM remote_note_index;").is_err());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("SELECT * FROM remote_note_index;").is_ok());
    }

    SECTION("Version is kept in the database header") {
        auto stmt = db.prepare("PRAGMA user_version;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == MigrationRunner::latest_version());
    }

    SECTION("A database from a newer build is refused") {
        const int newer = MigrationRunner::latest_version() + 1;
        REQUIRE(db.execute("PRAGMA user_version = " + std::to_string(newer) + ";").is_ok());

        auto migrated = runner.migrate();
        REQUIRE(migrated.is_err());
        REQUIRE(migrated.unwrap_err().message.find("newer than this build") != std::string::npos);
        REQUIRE(runner.current_version().unwrap() == newer);
    }
}

TEST_CASE("NoteStore keeps envelopes and meta", "[storage][notes]") {
    auto store = LocalStore::open_memory().unwrap();
    auto& notes = store->notes;

    NoteMeta meta{.date = "05-03-2024", .pending_op = PendingOp::Upsert, .local_version = 1};
    REQUIRE(notes.put(record_for("05-03-2024"), meta).is_ok());

    SECTION("Round trip") {
        REQUIRE(notes.get_record("05-03-2024").unwrap() == record_for("05-03-2024"));
        REQUIRE(notes.get_meta("05-03-2024").unwrap() == meta);
        REQUIRE_FALSE(notes.get_record("06-03-2024").unwrap().has_value());
    }

    SECTION("Pending accounting") {
        REQUIRE(notes.count_pending().unwrap() == 1);
        auto pending = notes.pending_metas().unwrap();
        REQUIRE(pending.size() == 1);
        REQUIRE(pending[0].pending_op == PendingOp::Upsert);

        meta.pending_op.reset();
        REQUIRE(notes.put_meta(meta).is_ok());
        REQUIRE(notes.count_pending().unwrap() == 0);
    }

    SECTION("A delete marker can outlive the envelope") {
        meta.pending_op = PendingOp::Delete;
        REQUIRE(notes.delete_record("05-03-2024").is_ok());
        REQUIRE(notes.put_meta(meta).is_ok());
        REQUIRE_FALSE(notes.get_record("05-03-2024").unwrap().has_value());
        REQUIRE(notes.get_meta("05-03-2024").unwrap()->pending_op == PendingOp::Delete);
        REQUIRE(notes.count_pending().unwrap() == 1);
    }

    SECTION("Remove drops record and meta") {
        REQUIRE(notes.remove("05-03-2024").is_ok());
        REQUIRE_FALSE(notes.get_record("05-03-2024").unwrap().has_value());
        REQUIRE_FALSE(notes.get_meta("05-03-2024").unwrap().has_value());
    }

    SECTION("Dates by year") {
        REQUIRE(notes.put(record_for("31-12-2023"), NoteMeta{.date = "31-12-2023"}).is_ok());
        REQUIRE(notes.put(record_for("01-01-2024"), NoteMeta{.date = "01-01-2024"}).is_ok());

        auto in_2024 = notes.dates_for_year(2024).unwrap();
        REQUIRE(in_2024.size() == 2);
        REQUIRE(notes.dates_for_year(2023).unwrap() == std::vector<std::string>{"31-12-2023"});
        REQUIRE(notes.all_dates().unwrap().size() == 3);
    }
}

TEST_CASE("SyncStateStore cursor", "[storage][sync]") {
    auto store = LocalStore::open_memory().unwrap();

    REQUIRE_FALSE(store->sync_state.cursor().unwrap().has_value());

    REQUIRE(store->sync_state.set_cursor("2024-03-01T10:00:00.000Z").is_ok());
    REQUIRE(store->sync_state.cursor().unwrap() == "2024-03-01T10:00:00.000Z");

    REQUIRE(store->sync_state.set_cursor(std::nullopt).is_ok());
    REQUIRE_FALSE(store->sync_state.cursor().unwrap().has_value());
}

TEST_CASE("RemoteNoteIndex replaces a year at a time", "[storage][sync]") {
    auto store = LocalStore::open_memory().unwrap();
    auto& index = store->remote_index;
    const std::string at = "2024-03-01T10:00:00.000Z";

    REQUIRE(index.set_dates_for_year(2024, {"01-01-2024", "02-01-2024"}, at).is_ok());
    REQUIRE(index.add("24-12-2023", at).is_ok());
    REQUIRE(index.contains("02-01-2024").unwrap());

    REQUIRE(index.set_dates_for_year(2024, {"03-01-2024"}, at).is_ok());
    REQUIRE_FALSE(index.contains("02-01-2024").unwrap());
    REQUIRE(index.contains("03-01-2024").unwrap());
    REQUIRE(index.contains("24-12-2023").unwrap());

    REQUIRE(index.remove("03-01-2024").is_ok());
    REQUIRE(index.dates_for_year(2024).unwrap().empty());
}

TEST_CASE("ImageStore blobs and metadata", "[storage][images]") {
    auto store = LocalStore::open_memory().unwrap();
    auto& images = store->images;

    ImageRecord record{.version = 1, .id = "img-1", .key_id = "k1",
                       .ciphertext = "YmxvYg==", .nonce = "bm9uY2U="};
    REQUIRE(images.put(record, image_meta_for("img-1", "05-03-2024")).is_ok());

    REQUIRE(images.get_record("img-1").unwrap() == record);
    REQUIRE(images.metas_for_note("05-03-2024").unwrap().size() == 1);
    REQUIRE(images.count_pending().unwrap() == 1);

    SECTION("Meta without a blob stays pending for deletion") {
        auto meta = images.get_meta("img-1").unwrap().value();
        meta.pending_op = ImagePendingOp::Delete;
        REQUIRE(images.delete_record("img-1").is_ok());
        REQUIRE(images.put_meta(meta).is_ok());

        REQUIRE_FALSE(images.get_record("img-1").unwrap().has_value());
        auto pending = images.pending_metas().unwrap();
        REQUIRE(pending.size() == 1);
        REQUIRE(pending[0].pending_op == ImagePendingOp::Delete);
    }

    SECTION("Remove drops both") {
        REQUIRE(images.remove("img-1").is_ok());
        REQUIRE_FALSE(images.get_meta("img-1").unwrap().has_value());
        REQUIRE(images.count_pending().unwrap() == 0);
    }
}
