#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "crypto/keys.hpp"
#include "support/test_support.hpp"
#include "sync/sync_controller.hpp"

using namespace daybook;
using namespace daybook::sync;
using namespace std::chrono_literals;

namespace {

config::SyncSettings fast_settings() {
    config::SyncSettings s;
    s.save_debounce = 20ms;
    s.sync_debounce = 30ms;
    s.idle_sync_delay = 30ms;
    s.pending_ops_poll = 50ms;
    s.operation_timeout = 1000ms;
    s.remote_change_debounce = 20ms;
    return s;
}

struct Fixture {
    std::shared_ptr<network::InMemoryRemoteStore> remote;
    testing::Device device;

    Fixture() {
        REQUIRE(crypto::init().is_ok());
        remote = std::make_shared<network::InMemoryRemoteStore>();
        device = testing::Device::create(remote,
                                         testing::make_keyring(crypto::generate_symmetric_key()));
    }

    std::unique_ptr<SyncController> controller(config::SyncSettings settings = fast_settings()) {
        return std::make_unique<SyncController>(
            device.notes, device.connectivity,
            std::make_shared<LocalPendingOpsSource>(device.store), settings);
    }
};

} // namespace

TEST_CASE("SyncController: syncs on start when online", "[qt][sync][controller]") {
    Fixture f;
    REQUIRE(f.device.save("01-04-2026", "<p>hi</p>").is_ok());
    auto controller = f.controller();
    QSignalSpy synced(controller.get(), &SyncController::lastSyncedChanged);

    REQUIRE(controller->phase() == QStringLiteral("disabled"));
    controller->start();

    REQUIRE(controller->phase() == QStringLiteral("ready"));
    REQUIRE(controller->status() == QStringLiteral("synced"));
    REQUIRE(synced.count() == 1);
    REQUIRE(controller->lastSynced().isValid());
    REQUIRE(controller->lastError().isEmpty());
    REQUIRE(controller->pendingTotal() == 0);
    REQUIRE(f.remote->note_count() == 1);
    REQUIRE_FALSE(controller->state().intent.has_value());
}

TEST_CASE("SyncController: follows connectivity", "[qt][sync][controller]") {
    Fixture f;
    f.device.connectivity->set_online(false);
    REQUIRE(f.device.save("02-04-2026", "<p>queued</p>").is_ok());
    auto controller = f.controller();
    controller->start();

    REQUIRE(controller->phase() == QStringLiteral("offline"));
    REQUIRE(controller->status() == QStringLiteral("offline"));
    REQUIRE(controller->pendingNotes() == 1);

    SECTION("requests while offline do nothing") {
        controller->requestSync(true);
        REQUIRE(f.device.gateway->push_count() == 0);
    }

    SECTION("coming back online syncs right away") {
        QSignalSpy status(controller.get(), &SyncController::statusChanged);
        f.device.connectivity->set_online(true);
        REQUIRE(controller->status() == QStringLiteral("synced"));
        REQUIRE(status.count() >= 1);
        REQUIRE(f.device.gateway->push_count() == 1);
        REQUIRE(controller->pendingTotal() == 0);
    }

    SECTION("a network failure mid-run goes offline") {
        f.device.connectivity->set_online(true);
        REQUIRE(f.device.save("02-04-2026", "<p>again</p>").is_ok());
        f.device.gateway->set_offline(true);
        QSignalSpy failed(controller.get(), &SyncController::syncFailed);
        controller->requestSync(true);
        REQUIRE(controller->phase() == QStringLiteral("offline"));
        REQUIRE(failed.count() == 1);
        REQUIRE(controller->lastError() == QStringLiteral("Offline"));
    }
}

TEST_CASE("SyncController: enabled flag", "[qt][sync][controller]") {
    Fixture f;
    auto settings = fast_settings();
    settings.enabled = false;
    REQUIRE(f.device.save("03-04-2026", "<p>x</p>").is_ok());
    auto controller = f.controller(settings);
    controller->start();

    REQUIRE(controller->phase() == QStringLiteral("disabled"));
    controller->requestSync(true);
    controller->notifyRemoteChange();
    QTest::qWait(60);
    REQUIRE(f.device.gateway->push_count() == 0);

    QSignalSpy enabled(controller.get(), &SyncController::enabledChanged);
    controller->setEnabled(true);
    REQUIRE(enabled.count() == 1);
    REQUIRE(controller->isEnabled());
    REQUIRE(controller->status() == QStringLiteral("synced"));
    REQUIRE(f.device.gateway->push_count() == 1);

    controller->setEnabled(false);
    REQUIRE(controller->phase() == QStringLiteral("disabled"));
}

TEST_CASE("SyncController: errors and retry", "[qt][sync][controller]") {
    Fixture f;
    REQUIRE(f.device.save("04-04-2026", "<p>x</p>").is_ok());
    f.device.gateway->fail_next(SyncErrorKind::RemoteRejected, "quota exceeded");
    auto controller = f.controller();
    QSignalSpy failed(controller.get(), &SyncController::syncFailed);
    controller->start();

    REQUIRE(controller->phase() == QStringLiteral("error"));
    REQUIRE(controller->status() == QStringLiteral("error"));
    REQUIRE(failed.count() == 1);
    REQUIRE(controller->lastError() == QStringLiteral("Remote rejected changes"));
    REQUIRE(controller->pendingNotes() == 1);

    controller->syncNow();
    REQUIRE(controller->phase() == QStringLiteral("ready"));
    REQUIRE(controller->status() == QStringLiteral("synced"));
    REQUIRE(controller->lastError().isEmpty());
    REQUIRE(controller->pendingNotes() == 0);
}

TEST_CASE("SyncController: debounced and idle requests", "[qt][sync][controller]") {
    Fixture f;
    auto controller = f.controller();
    controller->start();
    const int pulls = f.device.gateway->fetch_since_count();
    REQUIRE(pulls == 1);

    SECTION("a burst of edits syncs once") {
        REQUIRE(f.device.save("05-04-2026", "<p>a</p>").is_ok());
        controller->requestSync();
        controller->requestSync();
        controller->requestSync();
        REQUIRE(f.device.gateway->push_count() == 0);
        REQUIRE(QTest::qWaitFor([&] { return f.device.gateway->push_count() == 1; }, 1000));
        QTest::qWait(60);
        REQUIRE(f.device.gateway->fetch_since_count() == pulls + 1);
    }

    SECTION("idle sync runs only when something is pending") {
        controller->requestIdleSync(20);
        QTest::qWait(80);
        REQUIRE(f.device.gateway->fetch_since_count() == pulls);

        REQUIRE(f.device.save("06-04-2026", "<p>b</p>").is_ok());
        controller->requestIdleSync(20);
        REQUIRE(QTest::qWaitFor([&] { return f.device.gateway->push_count() == 1; }, 1000));
    }

    SECTION("remote change notifications collapse") {
        controller->notifyRemoteChange();
        controller->notifyRemoteChange();
        controller->notifyRemoteChange();
        REQUIRE(QTest::qWaitFor(
            [&] { return f.device.gateway->fetch_since_count() == pulls + 1; }, 1000));
        QTest::qWait(60);
        REQUIRE(f.device.gateway->fetch_since_count() == pulls + 1);
    }
}

TEST_CASE("SyncController: a hung run times out", "[qt][sync][controller]") {
    Fixture f;
    f.device.gateway->set_deferred(true);
    auto settings = fast_settings();
    settings.operation_timeout = 40ms;
    auto controller = f.controller(settings);
    QSignalSpy failed(controller.get(), &SyncController::syncFailed);
    controller->start();

    REQUIRE(controller->phase() == QStringLiteral("syncing"));
    REQUIRE(failed.wait(1000));
    REQUIRE(controller->phase() == QStringLiteral("error"));
    REQUIRE(controller->lastError() == QStringLiteral("Sync failed"));

    SECTION("the late result of the abandoned run is ignored") {
        f.device.gateway->release_all();
        REQUIRE(controller->phase() == QStringLiteral("error"));
        REQUIRE_FALSE(controller->lastSynced().isValid());
    }

    SECTION("a retry starts a fresh run") {
        f.device.gateway->set_deferred(false);
        const int pulls = f.device.gateway->fetch_since_count();
        controller->requestSync(true);

        REQUIRE(QTest::qWaitFor(
            [&] { return controller->status() == QStringLiteral("synced"); }, 1000));
        REQUIRE(controller->phase() == QStringLiteral("ready"));
        REQUIRE(f.device.gateway->fetch_since_count() == pulls + 1);
        REQUIRE(controller->lastError().isEmpty());

        // The hung call finally answers; the newer outcome stands.
        f.device.gateway->release_all();
        REQUIRE(controller->status() == QStringLiteral("synced"));
        REQUIRE(controller->phase() == QStringLiteral("ready"));
        REQUIRE(failed.count() == 1);
    }
}

TEST_CASE("SyncController: dispose stops everything", "[qt][sync][controller]") {
    Fixture f;
    auto controller = f.controller();
    controller->start();
    controller->dispose();
    controller->dispose();

    REQUIRE(f.device.save("07-04-2026", "<p>x</p>").is_ok());
    controller->requestSync(true);
    controller->notifyRemoteChange();
    f.device.connectivity->set_online(false);
    f.device.connectivity->set_online(true);
    QTest::qWait(60);
    REQUIRE(f.device.gateway->push_count() == 0);
}
