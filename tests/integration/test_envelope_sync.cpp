#include <catch2/catch_test_macros.hpp>
#include "crypto/keys.hpp"
#include "notes/conflict_policy.hpp"
#include "notes/image_repository.hpp"
#include "support/test_support.hpp"

using namespace daybook;
using namespace daybook::testing;

namespace {

struct Account {
    SteppingClock clock;
    std::shared_ptr<network::InMemoryRemoteStore> remote;
    std::shared_ptr<crypto::Keyring> keyring;

    Account() {
        REQUIRE(crypto::init().is_ok());
        remote = std::make_shared<network::InMemoryRemoteStore>(clock.fn());
        keyring = make_keyring(crypto::generate_symmetric_key());
        REQUIRE(keyring);
    }

    Device device(bool with_images = false) {
        return Device::create(remote, keyring, clock.fn(), with_images);
    }
};

bool synced(Device& d) {
    auto result = d.sync();
    return result && result->is_ok() && result->unwrap() == SyncStatus::Synced;
}

} // namespace

TEST_CASE("Envelope sync: notes propagate between devices", "[integration][sync]") {
    Account account;
    auto a = account.device();
    auto b = account.device();

    REQUIRE(a.save("01-02-2026", "<p>from a</p>").is_ok());
    REQUIRE(a.meta("01-02-2026")->pending_op == PendingOp::Upsert);
    REQUIRE(synced(a));

    auto meta = a.meta("01-02-2026");
    REQUIRE(meta);
    REQUIRE_FALSE(meta->pending_op.has_value());
    REQUIRE(meta->remote_id.has_value());
    REQUIRE(meta->revision == 1);
    REQUIRE(account.remote->note_count() == 1);

    REQUIRE(synced(b));
    auto note = b.get("01-02-2026");
    REQUIRE(note);
    REQUIRE(note->content == "<p>from a</p>");
    REQUIRE_FALSE(b.meta("01-02-2026")->pending_op.has_value());

    SECTION("the server only ever sees ciphertext") {
        auto row = account.remote->note_by_date("01-02-2026");
        REQUIRE(row);
        REQUIRE(row->ciphertext.find("from a") == std::string::npos);
        REQUIRE(row->key_id == "k1");
    }

    SECTION("an edit on the second device flows back") {
        REQUIRE(b.save("01-02-2026", "<p>from b</p>").is_ok());
        REQUIRE(synced(b));
        REQUIRE(b.meta("01-02-2026")->revision == 2);

        REQUIRE(synced(a));
        REQUIRE(a.get("01-02-2026")->content == "<p>from b</p>");
    }

    SECTION("deletions propagate as tombstones") {
        REQUIRE(a.remove("01-02-2026").is_ok());
        REQUIRE(a.meta("01-02-2026")->pending_op == PendingOp::Delete);
        REQUIRE_FALSE(a.get("01-02-2026"));
        REQUIRE(synced(a));
        REQUIRE_FALSE(a.meta("01-02-2026"));
        REQUIRE(a.gateway->delete_count() == 1);

        auto row = account.remote->note_by_date("01-02-2026");
        REQUIRE(row);
        REQUIRE(row->deleted);

        REQUIRE(synced(b));
        REQUIRE_FALSE(b.get("01-02-2026"));
        REQUIRE_FALSE(b.meta("01-02-2026"));

        SECTION("and the date can be written again") {
            REQUIRE(b.save("01-02-2026", "<p>again</p>").is_ok());
            REQUIRE(synced(b));
            REQUIRE_FALSE(account.remote->note_by_date("01-02-2026")->deleted);
            REQUIRE(synced(a));
            REQUIRE(a.get("01-02-2026")->content == "<p>again</p>");
        }
    }
}

TEST_CASE("Envelope sync: the pull cursor advances", "[integration][sync]") {
    Account account;
    auto a = account.device();
    auto b = account.device();

    REQUIRE(a.save("01-02-2026", "<p>one</p>").is_ok());
    REQUIRE(a.save("02-02-2026", "<p>two</p>").is_ok());
    REQUIRE(synced(a));
    REQUIRE(a.gateway->push_count() == 2);

    REQUIRE(synced(b));
    auto cursor = b.store->sync_state.cursor();
    REQUIRE(cursor.is_ok());
    REQUIRE(cursor.unwrap() == account.remote->note_by_date("02-02-2026")->server_updated_at);

    // Nothing changed, so nothing is pushed or adopted.
    REQUIRE(synced(b));
    REQUIRE(b.gateway->push_count() == 0);
    REQUIRE(b.gateway->fetch_since_count() == 2);
    REQUIRE(b.store->sync_state.cursor().unwrap() == cursor.unwrap());
}

TEST_CASE("Envelope sync: deleting a note the server never saw", "[integration][sync]") {
    Account account;
    auto a = account.device();

    REQUIRE(a.save("03-02-2026", "<p>draft</p>").is_ok());
    REQUIRE(a.remove("03-02-2026").is_ok());
    REQUIRE_FALSE(a.meta("03-02-2026"));

    REQUIRE(synced(a));
    REQUIRE(a.gateway->push_count() == 0);
    REQUIRE(a.gateway->delete_count() == 0);
    REQUIRE(account.remote->note_count() == 0);
}

TEST_CASE("Envelope sync: conflicts", "[integration][sync][conflict]") {
    Account account;
    auto a = account.device();
    auto b = account.device();

    REQUIRE(a.save("05-02-2026", "<p>base</p>").is_ok());
    REQUIRE(synced(a));
    REQUIRE(synced(b));

    SECTION("without a policy the conflict is surfaced") {
        REQUIRE(a.save("05-02-2026", "<p>a wins the race</p>").is_ok());
        REQUIRE(synced(a));
        REQUIRE(b.save("05-02-2026", "<p>b is late</p>").is_ok());

        auto result = b.sync();
        REQUIRE(result);
        REQUIRE(result->is_err());
        REQUIRE(result->unwrap_err().kind == SyncErrorKind::Conflict);
        REQUIRE(b.notes->sync_status() == SyncStatus::Error);
        REQUIRE(b.meta("05-02-2026")->pending_op == PendingOp::Upsert);
        REQUIRE(b.get("05-02-2026")->content == "<p>b is late</p>");
    }

    SECTION("last write wins keeps the newer local edit") {
        b.envelopes->set_conflict_policy(std::make_shared<notes::LastWriteWinsPolicy>());
        REQUIRE(a.save("05-02-2026", "<p>older</p>").is_ok());
        REQUIRE(synced(a));
        REQUIRE(b.save("05-02-2026", "<p>newer</p>").is_ok());

        REQUIRE(synced(b));
        REQUIRE(b.meta("05-02-2026")->revision == 3);
        REQUIRE_FALSE(b.meta("05-02-2026")->pending_op.has_value());

        REQUIRE(synced(a));
        REQUIRE(a.get("05-02-2026")->content == "<p>newer</p>");
    }

    SECTION("last write wins adopts a newer remote row") {
        b.envelopes->set_conflict_policy(std::make_shared<notes::LastWriteWinsPolicy>());
        REQUIRE(b.save("05-02-2026", "<p>older</p>").is_ok());
        REQUIRE(a.save("05-02-2026", "<p>newer</p>").is_ok());
        REQUIRE(synced(a));

        REQUIRE(synced(b));
        REQUIRE(b.get("05-02-2026")->content == "<p>newer</p>");
        REQUIRE_FALSE(b.meta("05-02-2026")->pending_op.has_value());
        REQUIRE(account.remote->note_by_date("05-02-2026")->revision == 2);
    }
}

TEST_CASE("Envelope sync: an edit during a push stays pending", "[integration][sync]") {
    Account account;
    auto a = account.device();
    a.gateway->set_deferred(true);

    REQUIRE(a.save("07-02-2026", "<p>first</p>").is_ok());
    std::optional<Result<SyncStatus, SyncError>> outcome;
    a.notes->sync([&](Result<SyncStatus, SyncError> r) { outcome = std::move(r); });
    REQUIRE_FALSE(outcome);
    REQUIRE(a.notes->sync_status() == SyncStatus::Syncing);

    REQUIRE(a.save("07-02-2026", "<p>second</p>").is_ok());
    a.gateway->release_all();

    REQUIRE(outcome);
    REQUIRE(outcome->is_ok());
    auto meta = a.meta("07-02-2026");
    REQUIRE(meta->pending_op == PendingOp::Upsert);
    REQUIRE(meta->revision == 1);
    REQUIRE(a.get("07-02-2026")->content == "<p>second</p>");

    a.gateway->set_deferred(false);
    REQUIRE(synced(a));
    REQUIRE_FALSE(a.meta("07-02-2026")->pending_op.has_value());
    REQUIRE(account.remote->note_by_date("07-02-2026")->revision == 2);
}

TEST_CASE("Envelope sync: concurrent calls share one run", "[integration][sync]") {
    Account account;
    auto a = account.device();
    a.gateway->set_deferred(true);
    REQUIRE(a.save("08-02-2026", "<p>x</p>").is_ok());

    int completions = 0;
    a.notes->sync([&](Result<SyncStatus, SyncError> r) { completions += r.is_ok() ? 1 : 0; });
    a.notes->sync([&](Result<SyncStatus, SyncError> r) { completions += r.is_ok() ? 1 : 0; });
    a.gateway->release_all();

    REQUIRE(completions == 2);
    REQUIRE(a.gateway->push_count() == 1);
    REQUIRE(a.gateway->fetch_since_count() == 1);
}

TEST_CASE("Envelope sync: offline and failures", "[integration][sync]") {
    Account account;
    auto a = account.device();
    REQUIRE(a.save("09-02-2026", "<p>x</p>").is_ok());

    SECTION("offline connectivity short-circuits") {
        a.connectivity->set_online(false);
        auto result = a.sync();
        REQUIRE(result);
        REQUIRE(result->is_ok());
        REQUIRE(result->unwrap() == SyncStatus::Offline);
        REQUIRE(a.notes->sync_status() == SyncStatus::Offline);
        REQUIRE(a.gateway->push_count() == 0);
    }

    SECTION("a network failure reports offline") {
        a.gateway->set_offline(true);
        auto result = a.sync();
        REQUIRE(result->is_err());
        REQUIRE(result->unwrap_err().kind == SyncErrorKind::Offline);
        REQUIRE(a.notes->sync_status() == SyncStatus::Offline);
        REQUIRE(a.meta("09-02-2026")->pending_op == PendingOp::Upsert);
    }

    SECTION("a rejection reports an error and keeps the op") {
        a.gateway->fail_next(SyncErrorKind::RemoteRejected, "quota");
        auto result = a.sync();
        REQUIRE(result->is_err());
        REQUIRE(result->unwrap_err().message == "quota");
        REQUIRE(a.notes->sync_status() == SyncStatus::Error);
        REQUIRE(a.meta("09-02-2026")->pending_op == PendingOp::Upsert);

        REQUIRE(synced(a));
        REQUIRE(a.notes->sync_status() == SyncStatus::Synced);
    }

    SECTION("status observers see each transition") {
        std::vector<SyncStatus> seen;
        auto sub = a.notes->on_sync_status_change([&](SyncStatus s) { seen.push_back(s); });
        REQUIRE(synced(a));
        REQUIRE(seen == std::vector<SyncStatus>{SyncStatus::Syncing, SyncStatus::Synced});
    }
}

TEST_CASE("Envelope sync: refresh a single date", "[integration][sync]") {
    Account account;
    auto a = account.device();
    auto b = account.device();
    REQUIRE(a.save("10-02-2026", "<p>remote</p>").is_ok());
    REQUIRE(synced(a));

    auto refresh = [](Device& d, const std::string& date) {
        std::optional<Result<std::optional<Note>, RepositoryError>> out;
        d.notes->refresh_note(date, [&](auto r) { out = std::move(r); });
        REQUIRE(out);
        REQUIRE(out->is_ok());
        return out->unwrap();
    };

    auto note = refresh(b, "10-02-2026");
    REQUIRE(note);
    REQUIRE(note->content == "<p>remote</p>");
    REQUIRE(b.gateway->push_count() == 0);

    SECTION("pending local edits are kept") {
        REQUIRE(b.save("10-02-2026", "<p>local</p>").is_ok());
        REQUIRE(refresh(b, "10-02-2026")->content == "<p>local</p>");
    }

    SECTION("a remote deletion is applied") {
        REQUIRE(a.remove("10-02-2026").is_ok());
        REQUIRE(synced(a));
        REQUIRE_FALSE(refresh(b, "10-02-2026"));
        REQUIRE_FALSE(b.get("10-02-2026"));
    }

    SECTION("offline yields nothing and keeps the local note") {
        b.connectivity->set_online(false);
        REQUIRE_FALSE(refresh(b, "10-02-2026"));
        REQUIRE(b.get("10-02-2026"));
    }

    SECTION("a remote failure falls back to the local note") {
        b.gateway->fail_next(SyncErrorKind::Unknown);
        REQUIRE(refresh(b, "10-02-2026")->content == "<p>remote</p>");
    }
}

TEST_CASE("Envelope sync: remote date index", "[integration][sync]") {
    Account account;
    auto a = account.device();
    auto b = account.device();
    REQUIRE(a.save("11-02-2026", "<p>a</p>").is_ok());
    REQUIRE(a.save("01-01-2025", "<p>old</p>").is_ok());
    REQUIRE(synced(a));
    REQUIRE(b.save("03-01-2026", "<p>b</p>").is_ok());

    auto dates = [](Device& d, int year) {
        std::vector<std::string> out;
        d.notes->get_all_dates_for_year(year, [&](auto r) {
            if (r.is_ok()) out = r.unwrap();
        });
        return out;
    };
    auto cached = [](Device& d, const std::string& date) {
        bool out = false;
        d.notes->has_remote_date_cached(date, [&](bool v) { out = v; });
        return out;
    };

    REQUIRE(dates(b, 2026) == std::vector<std::string>{"03-01-2026"});
    REQUIRE_FALSE(cached(b, "11-02-2026"));

    bool refreshed = false;
    b.notes->refresh_dates(2026, [&] { refreshed = true; });
    REQUIRE(refreshed);
    REQUIRE(dates(b, 2026) == std::vector<std::string>{"03-01-2026", "11-02-2026"});
    REQUIRE(cached(b, "11-02-2026"));
    REQUIRE_FALSE(cached(b, "01-01-2025"));
    REQUIRE(b.get("11-02-2026") == std::nullopt);

    SECTION("a second refresh inside the cooldown is skipped") {
        b.notes->refresh_dates(2026, [] {});
        REQUIRE(b.gateway->fetch_dates_count() == 1);

        account.clock.advance(std::chrono::seconds(5));
        b.notes->refresh_dates(2026, [] {});
        REQUIRE(b.gateway->fetch_dates_count() == 2);
    }
}

TEST_CASE("Envelope sync: concurrent date refreshes share a request", "[integration][sync]") {
    Account account;
    auto a = account.device();
    a.gateway->set_deferred(true);

    int done = 0;
    a.notes->refresh_dates(2026, [&] { ++done; });
    a.notes->refresh_dates(2026, [&] { ++done; });
    REQUIRE(a.gateway->fetch_dates_count() == 1);
    REQUIRE(done == 0);

    a.gateway->release_all();
    REQUIRE(done == 2);

    SECTION("offline completes without a request") {
        a.connectivity->set_online(false);
        a.notes->refresh_dates(2025, [&] { ++done; });
        REQUIRE(done == 3);
        REQUIRE(a.gateway->fetch_dates_count() == 1);
    }
}

TEST_CASE("Envelope sync: images upload with the note", "[integration][sync][images]") {
    Account account;
    auto a = account.device(true);
    notes::ImageRepository images(a.store, a.e2ee, account.clock.fn());

    notes::NewImage image;
    image.note_date = "12-02-2026";
    image.filename = "cat.png";
    image.mime_type = "image/png";
    image.bytes = {1, 2, 3, 4, 5};
    auto stored = images.store(image);
    REQUIRE(stored.is_ok());
    const auto id = stored.unwrap().id;
    REQUIRE(a.store->images.count_pending().unwrap() == 1);

    REQUIRE(synced(a));
    REQUIRE(a.gateway->upload_count() == 1);
    REQUIRE(account.remote->has_image(id));
    auto meta = a.store->images.get_meta(id).unwrap();
    REQUIRE(meta);
    REQUIRE(meta->remote_path);
    REQUIRE_FALSE(meta->pending_op.has_value());

    SECTION("removal is propagated") {
        REQUIRE(images.remove(id).is_ok());
        REQUIRE(a.store->images.get_meta(id).unwrap()->pending_op == ImagePendingOp::Delete);
        REQUIRE(synced(a));
        REQUIRE_FALSE(account.remote->has_image(id));
        REQUIRE_FALSE(a.store->images.get_meta(id).unwrap());
    }

    SECTION("a failed upload fails the run") {
        auto second = images.store(image);
        REQUIRE(second.is_ok());
        a.gateway->fail_next(SyncErrorKind::RemoteRejected, "too large");
        auto result = a.sync();
        REQUIRE(result->is_err());
        REQUIRE(a.store->images.get_meta(second.unwrap().id).unwrap()->pending_op ==
                ImagePendingOp::Upload);
    }
}
