#include <QTest>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QJsonArray>
#include <memory>
#include "fake_server_config.h"
#include "session/bridge_session.h"
#include "session/diagnostics_cache.h"
#include "rpc/notification_router.h"
#include "rpc/request_correlator.h"
#include "transport/process_supervisor.h"

namespace {

QJsonObject hoverParams(int line, int character) {
    return QJsonObject{{"textDocument", QJsonObject{{"uri", "file:///ws/src/main.rs"}}},
                       {"position", QJsonObject{{"line", line}, {"character", character}}}};
}

} // namespace

class TestBridgeSession : public QObject {
    Q_OBJECT

private slots:
    void testStartReachesReady() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        QSignalSpy states(&session, &BridgeSession::stateChanged);
        QCOMPARE(session.state(), SessionState::Uninitialized);

        std::unique_ptr<PendingCall> start(session.start());
        QCOMPARE(session.state(), SessionState::Initializing);
        auto result = start->wait(10000);
        QVERIFY2(result.has_value(), qPrintable(result ? QString() : result.error().message));

        QCOMPARE(session.state(), SessionState::Ready);
        QVERIFY(result->toObject().contains(QStringLiteral("hoverProvider")));
        QCOMPARE(session.serverInfo()["name"].toString(), QStringLiteral("fake-lsp"));
        QVERIFY(session.serverSupports(QStringLiteral("workspace.workspaceFolders.changeNotifications")));
        QVERIFY(!session.serverSupports(QStringLiteral("callHierarchyProvider")));
        QCOMPARE(states.count(), 2);

        // start() while Ready is a no-op success.
        std::unique_ptr<PendingCall> again(session.start());
        QVERIFY(again->isFinished());
        QVERIFY(again->result().has_value());
    }

    void testRequestsAreGatedBeforeReady() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        std::unique_ptr<PendingCall> early(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QVERIFY(early->isFinished());
        QCOMPARE(early->result().error().kind, ErrorKind::SessionNotReady);

        std::unique_ptr<PendingCall> start(session.start());
        std::unique_ptr<PendingCall> during(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QCOMPARE(during->result().error().kind, ErrorKind::SessionNotReady);
        QVERIFY(during->result().error().retryable);
        QVERIFY(!session.notify(QStringLiteral("textDocument/didSave"), QJsonObject()).has_value());
        QVERIFY(start->wait(10000).has_value());
    }

    void testReadinessSignalBeforeHandshakeResponse() {
        // serverStatus arrives before the initialize response.
        BridgeSession session(fakeServerConfig(QStringLiteral("ready-first"), {QStringLiteral("--delay"), QStringLiteral("800")}));
        QSignalSpy ready(&session, &BridgeSession::ready);
        std::unique_ptr<PendingCall> start(session.start());

        // The readiness signal alone must leave the session initializing.
        QTRY_VERIFY_WITH_TIMEOUT(session.router()->dispatchedCount() >= 1, 5000);
        QCOMPARE(session.state(), SessionState::Initializing);
        QVERIFY(!start->isFinished());
        QCOMPARE(ready.count(), 0);
        QVERIFY(!session.requireReady().has_value());

        auto result = start->wait(10000);
        QVERIFY2(result.has_value(), qPrintable(result ? QString() : result.error().message));
        QCOMPARE(session.state(), SessionState::Ready);
    }

    void testMissingReadinessSignalTimesOut() {
        BridgeConfig config = fakeServerConfig(QStringLiteral("no-ready"));
        config.readiness.timeoutMs = 400;
        BridgeSession session(config);
        QSignalSpy terminated(&session, &BridgeSession::terminated);

        QElapsedTimer clock;
        clock.start();
        std::unique_ptr<PendingCall> start(session.start());
        auto result = start->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Timeout);
        QVERIFY(clock.elapsed() >= 400);
        QCOMPARE(session.state(), SessionState::Terminated);
        QCOMPARE(terminated.count(), 1);
    }

    void testHandshakeOnlyProbe() {
        BridgeConfig config = fakeServerConfig(QStringLiteral("no-ready"));
        config.readiness.method.clear();
        BridgeSession session(config);
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        QCOMPARE(session.state(), SessionState::Ready);
    }

    void testCrashDuringInitialize() {
        BridgeSession session(fakeServerConfig(QStringLiteral("crash-on-initialize")));
        std::unique_ptr<PendingCall> start(session.start());
        auto result = start->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::BackendCrashed);
        QCOMPARE(session.state(), SessionState::Terminated);
        QVERIFY(session.terminationReason().has_value());

        // Later calls report the crash.
        std::unique_ptr<PendingCall> later(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QCOMPARE(later->result().error().kind, ErrorKind::BackendCrashed);
    }

    void testMissingExecutableIsSpawnError() {
        BridgeConfig config = fakeServerConfig(QStringLiteral("normal"));
        config.server.command = QStringLiteral("/nonexistent/dir/language-server");
        BridgeSession session(config);
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->isFinished());
        QCOMPARE(start->result().error().kind, ErrorKind::Spawn);
        QCOMPARE(session.state(), SessionState::Terminated);
    }

    void testImmediateExitIsSpawnError() {
        BridgeConfig config = fakeServerConfig(QStringLiteral("exit-immediately"));
        config.server.spawnProbeMs = 1000;
        BridgeSession session(config);
        std::unique_ptr<PendingCall> start(session.start());
        auto result = start->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Spawn);
    }

    void testConcurrentRequestsAnsweredOutOfOrder() {
        const int count = 50;
        BridgeSession session(fakeServerConfig(QStringLiteral("reverse"),
                                               {QStringLiteral("--batch"), QString::number(count)}));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());

        std::vector<std::unique_ptr<PendingCall>> calls;
        for (int i = 0; i < count; ++i)
            calls.emplace_back(session.request(QStringLiteral("textDocument/hover"), hoverParams(i, i % 7)));
        QCOMPARE(session.correlator()->pendingCount(), count);

        for (int i = 0; i < count; ++i) {
            auto result = calls[i]->wait(10000);
            QVERIFY2(result.has_value(), qPrintable(result ? QString() : result.error().message));
            QCOMPARE(result->toObject()["contents"].toObject()["value"].toString(),
                     QStringLiteral("hover %1:%2").arg(i).arg(i % 7));
        }
        QCOMPARE(session.correlator()->pendingCount(), 0);
    }

    void testBackendErrorResponse() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());

        std::unique_ptr<PendingCall> call(session.request(QStringLiteral("fake/error"), QJsonObject()));
        auto result = call->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::BackendError);
        QCOMPARE(result.error().backendCode, -32001);
        QCOMPARE(session.state(), SessionState::Ready);
    }

    void testSilentBackendTimesOutAndLateResponseIsDropped() {
        BridgeSession session(fakeServerConfig(QStringLiteral("silent-hover")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        QSignalSpy unmatched(session.correlator(), &RequestCorrelator::unmatchedResponse);

        QElapsedTimer clock;
        clock.start();
        std::unique_ptr<PendingCall> call(session.request(QStringLiteral("textDocument/hover"), hoverParams(1, 1), 300));
        auto result = call->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Timeout);
        QVERIFY(clock.elapsed() >= 300);

        // The fake answers the $/cancelRequest with a late response.
        QTRY_COMPARE_WITH_TIMEOUT(unmatched.count(), 1, 5000);
        QCOMPARE(session.state(), SessionState::Ready);
        QCOMPARE(session.correlator()->pendingCount(), 0);
    }

    void testCallerCancellation() {
        BridgeSession session(fakeServerConfig(QStringLiteral("silent-hover")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());

        std::unique_ptr<PendingCall> call(session.request(QStringLiteral("textDocument/hover"), hoverParams(2, 2)));
        QTest::qWait(50);
        call->cancel();
        QCOMPARE(call->result().error().kind, ErrorKind::Cancelled);
        QTest::qWait(200);
        QCOMPARE(call->result().error().kind, ErrorKind::Cancelled);
        QCOMPARE(session.state(), SessionState::Ready);
    }

    void testMalformedFrameTerminatesSession() {
        BridgeSession session(fakeServerConfig(QStringLiteral("garbage")));
        QSignalSpy terminated(&session, &BridgeSession::terminated);
        std::unique_ptr<PendingCall> start(session.start());
        auto result = start->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Framing);
        QCOMPARE(session.state(), SessionState::Terminated);
        QCOMPARE(terminated.count(), 1);

        std::unique_ptr<PendingCall> later(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QCOMPARE(later->result().error().kind, ErrorKind::SessionTerminated);
    }

    void testCrashAfterReadyFailsInFlightAndLaterCalls() {
        BridgeSession session(fakeServerConfig(QStringLiteral("crash-after-ready")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        QSignalSpy reset(&session, &BridgeSession::sessionReset);

        std::unique_ptr<PendingCall> hover(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        auto result = hover->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::BackendCrashed);
        QCOMPARE(session.state(), SessionState::Terminated);
        QVERIFY(reset.count() >= 1);

        std::unique_ptr<PendingCall> later(session.request(QStringLiteral("textDocument/definition"), hoverParams(0, 0)));
        QCOMPARE(later->result().error().kind, ErrorKind::BackendCrashed);
        QVERIFY(!session.supervisor()->isAlive());
    }

    void testClosedStdoutTerminatesSession() {
        BridgeSession session(fakeServerConfig(QStringLiteral("close-stdout")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        QSignalSpy terminated(&session, &BridgeSession::terminated);

        std::unique_ptr<PendingCall> hover(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        auto result = hover->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Framing);
        QCOMPARE(session.state(), SessionState::Terminated);
        QCOMPARE(terminated.count(), 1);
        QVERIFY(!session.supervisor()->isAlive());
    }

    void testStdoutClosedMidFrameReportsTruncation() {
        BridgeSession session(fakeServerConfig(QStringLiteral("truncate-stdout")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());

        std::unique_ptr<PendingCall> hover(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        auto result = hover->wait(10000);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Framing);
        QVERIFY2(result.error().message.contains(QStringLiteral("body bytes")), qPrintable(result.error().message));
        QVERIFY(session.terminationReason().has_value());
        QCOMPARE(session.terminationReason()->kind, ErrorKind::Framing);
    }

    void testPushedDiagnosticsReachCache() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        QSignalSpy updated(session.diagnostics(), &DiagnosticsCache::updated);

        const QString uri = QStringLiteral("file:///ws/src/main.rs");
        QVERIFY(session.notify(QStringLiteral("textDocument/didChange"), QJsonObject{
            {"textDocument", QJsonObject{{"uri", uri}, {"version", 2}}},
            {"contentChanges", QJsonArray{QJsonObject{{"text", "fn main() {}"}}}}}).has_value());

        QTRY_COMPARE_WITH_TIMEOUT(updated.count(), 1, 5000);
        auto entry = session.diagnostics()->entry(uri);
        QVERIFY(entry.has_value());
        QCOMPARE(entry->items[0].toObject()["message"].toString(), QStringLiteral("pushed v2"));
    }

    void testShutdownDrainsAndTerminates() {
        BridgeSession session(fakeServerConfig(QStringLiteral("silent-hover")));
        std::unique_ptr<PendingCall> start(session.start());
        QVERIFY(start->wait(10000).has_value());
        session.diagnostics()->recordPush(QStringLiteral("file:///ws/a.rs"), QJsonArray{QJsonObject{{"message", "x"}}});

        std::unique_ptr<PendingCall> pending(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        std::unique_ptr<PendingCall> done(session.shutdown());
        QCOMPARE(session.state(), SessionState::ShuttingDown);
        QCOMPARE(pending->result().error().kind, ErrorKind::SessionTerminated);

        std::unique_ptr<PendingCall> rejected(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QCOMPARE(rejected->result().error().kind, ErrorKind::SessionNotReady);

        QVERIFY(done->wait(10000).has_value());
        QCOMPARE(session.state(), SessionState::Terminated);
        QVERIFY(session.diagnostics()->isEmpty());
        QTRY_VERIFY_WITH_TIMEOUT(!session.supervisor()->isAlive(), 5000);

        std::unique_ptr<PendingCall> after(session.request(QStringLiteral("textDocument/hover"), hoverParams(0, 0)));
        QCOMPARE(after->result().error().kind, ErrorKind::SessionTerminated);

        // Shutting down twice is harmless.
        std::unique_ptr<PendingCall> twice(session.shutdown());
        QVERIFY(twice->isFinished());
    }

    void testShutdownBeforeStart() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        std::unique_ptr<PendingCall> done(session.shutdown());
        QVERIFY(done->wait(1000).has_value());
        QCOMPARE(session.state(), SessionState::Terminated);
        std::unique_ptr<PendingCall> start(session.start());
        QCOMPARE(start->result().error().kind, ErrorKind::SessionTerminated);
    }

    void testInitializeParamsCarryWorkspace() {
        BridgeSession session(fakeServerConfig(QStringLiteral("normal")));
        QVERIFY(session.initializeParams()["rootUri"].isNull());

        session.setRootPath(QStringLiteral("/ws/my crate"));
        const QJsonObject params = session.initializeParams();
        QCOMPARE(params["rootUri"].toString(), QStringLiteral("file:///ws/my%20crate"));
        QCOMPARE(params["workspaceFolders"].toArray().size(), qsizetype(1));
        QCOMPARE(params["clientInfo"].toObject()["name"].toString(), QStringLiteral("lspbridge"));
        QVERIFY(params["capabilities"].toObject()["experimental"].toObject()["serverStatusNotification"].toBool());
        QVERIFY(params["initializationOptions"].toObject().contains(QStringLiteral("checkOnSave")));
    }
};

QTEST_MAIN(TestBridgeSession)
#include "tst_bridge_session.moc"
