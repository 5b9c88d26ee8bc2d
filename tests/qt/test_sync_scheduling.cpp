#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "crypto/keys.hpp"
#include "support/test_support.hpp"
#include "sync/cancellable_operation.hpp"
#include "sync/intent_scheduler.hpp"
#include "sync/pending_ops.hpp"
#include "sync/sync_service.hpp"

using namespace daybook;
using namespace daybook::sync;
using namespace std::chrono_literals;

namespace {

class FakePendingOps : public PendingOpsSource {
public:
    void get_summary(Completion<Result<PendingOpsSummary, Error>> done) override {
        ++calls;
        if (failure) {
            done(Result<PendingOpsSummary, Error>::err(Error{*failure}));
            return;
        }
        done(Result<PendingOpsSummary, Error>::ok(summary));
    }

    PendingOpsSummary summary;
    std::optional<std::string> failure;
    int calls = 0;
};

} // namespace

TEST_CASE("IntentScheduler: immediate and debounced requests", "[qt][sync][scheduler]") {
    auto pending = std::make_shared<FakePendingOps>();
    IntentScheduler scheduler(pending, IntentScheduler::Options{40ms, 40ms});
    QSignalSpy spy(&scheduler, &IntentScheduler::syncRequested);

    SECTION("immediate requests go out at once") {
        scheduler.request_sync(SyncIntent{true});
        REQUIRE(spy.count() == 1);
        REQUIRE(spy.at(0).at(0).toBool());
    }

    SECTION("a burst of requests collapses into one") {
        scheduler.request_sync(SyncIntent{false});
        scheduler.request_sync(SyncIntent{false});
        scheduler.request_sync(SyncIntent{false});
        REQUIRE(spy.count() == 0);
        REQUIRE(scheduler.has_pending_debounce());

        REQUIRE(spy.wait(1000));
        QTest::qWait(80);
        REQUIRE(spy.count() == 1);
        REQUIRE_FALSE(spy.at(0).at(0).toBool());
    }

    SECTION("an immediate request supersedes the debounce") {
        scheduler.request_sync(SyncIntent{false});
        scheduler.request_sync(SyncIntent{true});
        REQUIRE_FALSE(scheduler.has_pending_debounce());
        QTest::qWait(80);
        REQUIRE(spy.count() == 1);
    }

    SECTION("dispose cancels the debounce") {
        scheduler.request_sync(SyncIntent{false});
        scheduler.dispose();
        QTest::qWait(80);
        REQUIRE(spy.count() == 0);
    }
}

TEST_CASE("IntentScheduler: idle requests check pending ops", "[qt][sync][scheduler]") {
    auto pending = std::make_shared<FakePendingOps>();
    IntentScheduler scheduler(pending, IntentScheduler::Options{40ms, 40ms});
    QSignalSpy spy(&scheduler, &IntentScheduler::syncRequested);

    SECTION("nothing pending, nothing requested") {
        scheduler.request_idle_sync();
        QTest::qWait(100);
        REQUIRE(pending->calls == 1);
        REQUIRE(spy.count() == 0);
    }

    SECTION("pending changes ask for an immediate sync") {
        pending->summary = PendingOpsSummary{1, 0, 1};
        scheduler.request_idle_sync(20ms);
        REQUIRE(spy.wait(1000));
        REQUIRE(spy.at(0).at(0).toBool());
    }

    SECTION("only one idle wait at a time") {
        pending->summary = PendingOpsSummary{2, 1, 3};
        scheduler.request_idle_sync();
        scheduler.request_idle_sync();
        REQUIRE(scheduler.has_pending_idle());
        QTest::qWait(120);
        REQUIRE(pending->calls == 1);
        REQUIRE(spy.count() == 1);
    }

    SECTION("a failed count is treated as nothing pending") {
        pending->failure = "database is locked";
        scheduler.request_idle_sync();
        QTest::qWait(100);
        REQUIRE(spy.count() == 0);
    }
}

TEST_CASE("CancellableOperation: timeout ceiling", "[qt][sync][operation]") {
    SECTION("a body that never finishes times out") {
        bool timed_out = false;
        CancellationToken seen;
        auto op = CancellableOperation::start(
            [&](const CancellationToken& token, std::function<void()>) { seen = token; },
            30ms, [&] { timed_out = true; });
        REQUIRE(op->is_active());

        REQUIRE(QTest::qWaitFor([&] { return timed_out; }, 1000));
        REQUIRE(seen.is_cancelled());
        REQUIRE_FALSE(op->is_active());
    }

    SECTION("an inline finish disarms the timer") {
        bool timed_out = false;
        auto op = CancellableOperation::start(
            [](const CancellationToken&, std::function<void()> finished) { finished(); },
            30ms, [&] { timed_out = true; });
        REQUIRE(op->is_finished());
        QTest::qWait(80);
        REQUIRE_FALSE(timed_out);
    }

    SECTION("cancel suppresses the timeout") {
        bool timed_out = false;
        auto op = CancellableOperation::start(
            [](const CancellationToken&, std::function<void()>) {}, 30ms,
            [&] { timed_out = true; });
        op->cancel();
        REQUIRE(op->is_cancelled());
        QTest::qWait(80);
        REQUIRE_FALSE(timed_out);
    }

    SECTION("destroying the operation cancels its token") {
        CancellationToken seen;
        {
            auto op = CancellableOperation::start(
                [&](const CancellationToken& token, std::function<void()>) { seen = token; },
                1s);
        }
        REQUIRE(seen.is_cancelled());
    }
}

TEST_CASE("SyncService: requests collapse into one follow-up run", "[qt][sync][service]") {
    REQUIRE(crypto::init().is_ok());
    auto remote = std::make_shared<network::InMemoryRemoteStore>();
    auto device = testing::Device::create(remote,
                                          testing::make_keyring(crypto::generate_symmetric_key()));
    REQUIRE(device.save("01-03-2026", "<p>x</p>").is_ok());
    device.gateway->set_deferred(true);

    int starts = 0;
    std::vector<SyncStatus> completed;
    std::vector<SyncError> errors;
    auto service = std::make_shared<SyncService>(device.notes, SyncService::Callbacks{
        [&] { ++starts; },
        [&](SyncStatus s) { completed.push_back(s); },
        [&](const SyncError& e) { errors.push_back(e); },
    });

    int done = 0;
    service->sync_now([&] { ++done; });
    service->sync_now([&] { ++done; });
    service->sync_now();
    REQUIRE(service->is_running());
    REQUIRE(service->is_queued());
    REQUIRE(starts == 1);

    device.gateway->release_all();

    REQUIRE(starts == 2);
    REQUIRE(completed == std::vector<SyncStatus>{SyncStatus::Synced, SyncStatus::Synced});
    REQUIRE(errors.empty());
    REQUIRE(done == 2);
    REQUIRE_FALSE(service->is_running());
    REQUIRE(device.gateway->push_count() == 1);

    SECTION("an error drops the queued run") {
        REQUIRE(device.save("01-03-2026", "<p>y</p>").is_ok());
        device.gateway->fail_next(SyncErrorKind::RemoteRejected, "nope");
        service->sync_now();
        service->sync_now();
        device.gateway->release_all();

        REQUIRE(starts == 3);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors.front().kind == SyncErrorKind::RemoteRejected);
        REQUIRE_FALSE(service->is_queued());
    }

    SECTION("cancel abandons the in-flight run") {
        service->sync_now([&] { ++done; });
        service->sync_now();
        REQUIRE(starts == 3);
        service->cancel();

        REQUIRE_FALSE(service->is_running());
        REQUIRE_FALSE(service->is_queued());
        REQUIRE(device.notes->sync_status() == SyncStatus::Error);

        device.gateway->set_deferred(false);
        service->sync_now();
        REQUIRE(starts == 4);
        REQUIRE(completed.size() == 3);
        REQUIRE_FALSE(service->is_running());

        device.gateway->release_all();
        REQUIRE(completed.size() == 3);
        REQUIRE(errors.empty());
        REQUIRE(done == 2);
        REQUIRE(device.notes->sync_status() == SyncStatus::Synced);
    }

    SECTION("dispose silences the in-flight run") {
        service->sync_now();
        service->dispose();
        device.gateway->release_all();
        REQUIRE(completed.size() == 2);
        REQUIRE_FALSE(service->is_running());
    }
}

TEST_CASE("PendingOpsPoller: tracks the local stores", "[qt][sync][pending]") {
    REQUIRE(crypto::init().is_ok());
    auto remote = std::make_shared<network::InMemoryRemoteStore>();
    auto device = testing::Device::create(remote,
                                          testing::make_keyring(crypto::generate_symmetric_key()));
    auto source = std::make_shared<LocalPendingOpsSource>(device.store);
    PendingOpsPoller poller(source, 30ms);
    QSignalSpy changed(&poller, &PendingOpsPoller::summaryChanged);

    poller.start();
    REQUIRE(poller.summary() == PendingOpsSummary{});
    REQUIRE(changed.count() == 0);

    REQUIRE(device.save("02-03-2026", "<p>a</p>").is_ok());
    REQUIRE(device.save("03-03-2026", "<p>b</p>").is_ok());
    REQUIRE(changed.wait(1000));
    REQUIRE(poller.summary() == PendingOpsSummary{2, 0, 2});

    SECTION("a sync drains it") {
        REQUIRE(device.sync()->is_ok());
        poller.refresh();
        REQUIRE(poller.summary().total == 0);
    }

    SECTION("a failing source reports zero") {
        auto failing = std::make_shared<FakePendingOps>();
        failing->failure = "disk I/O error";
        PendingOpsPoller broken(failing, 1s);
        QSignalSpy failed(&broken, &PendingOpsPoller::refreshFailed);
        broken.refresh();
        REQUIRE(failed.count() == 1);
        REQUIRE(failed.at(0).at(0).toString() == QStringLiteral("disk I/O error"));
        REQUIRE(broken.summary().total == 0);
    }
}
