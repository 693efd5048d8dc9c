#include <QTest>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QJsonArray>
#include <memory>
#include "rpc/request_correlator.h"
#include "rpc/pending_call.h"

// ============================================================================
// Mock writer: records outgoing messages, can be told to fail
// ============================================================================

class RecordingWriter : public IMessageWriter {
public:
    QList<RpcMessage> written;
    bool failWrites = false;

    VoidResult write(const RpcMessage& message) override {
        if (failWrites)
            return std::unexpected(BridgeFailure::backendCrashed(QStringLiteral("pipe closed")));
        written.append(message);
        return {};
    }

    QList<RpcNotification> notifications(const QString& method) const {
        QList<RpcNotification> out;
        for (const RpcMessage& m : written) {
            if (const auto* note = std::get_if<RpcNotification>(&m); note && note->method == method)
                out.append(*note);
        }
        return out;
    }

    QList<RpcRequest> requests() const {
        QList<RpcRequest> out;
        for (const RpcMessage& m : written) {
            if (const auto* req = std::get_if<RpcRequest>(&m))
                out.append(*req);
        }
        return out;
    }
};

namespace {

RpcResponse okResponse(qint64 id, const QJsonValue& result) {
    RpcResponse response;
    response.id = id;
    response.result = result;
    return response;
}

} // namespace

class TestRequestCorrelator : public QObject {
    Q_OBJECT

private slots:
    void testIdsAreUniqueAndIncreasing() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);

        std::unique_ptr<PendingCall> a(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        std::unique_ptr<PendingCall> b(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        std::unique_ptr<PendingCall> c(correlator.send(QStringLiteral("textDocument/definition"), QJsonObject()));

        QCOMPARE(a->id(), qint64(1));
        QCOMPARE(b->id(), qint64(2));
        QCOMPARE(c->id(), qint64(3));
        QCOMPARE(correlator.pendingCount(), 3);
        QCOMPARE(correlator.lastIssuedId(), qint64(3));

        const QList<RpcRequest> sent = writer.requests();
        QCOMPARE(sent.size(), qsizetype(3));
        QCOMPARE(sent[2].method, QStringLiteral("textDocument/definition"));
        QCOMPARE(sent[2].id.toInteger(), qint64(3));
    }

    void testOutOfOrderResponsesMatchById() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);

        QList<PendingCall*> calls;
        for (int i = 0; i < 5; ++i)
            calls.append(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject{{"n", i}}));

        for (int i = 4; i >= 0; --i)
            QVERIFY(correlator.complete(okResponse(calls[i]->id(), QStringLiteral("answer %1").arg(i))));

        for (int i = 0; i < 5; ++i) {
            QVERIFY(calls[i]->isFinished());
            QVERIFY(calls[i]->result().has_value());
            QCOMPARE(calls[i]->result()->toString(), QStringLiteral("answer %1").arg(i));
        }
        QCOMPARE(correlator.pendingCount(), 0);
        qDeleteAll(calls);
    }

    void testUnknownIdIsDiscarded() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        QSignalSpy spy(&correlator, &RequestCorrelator::unmatchedResponse);

        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        QVERIFY(!correlator.complete(okResponse(99, 1)));

        RpcResponse stringId;
        stringId.id = QStringLiteral("abc");
        stringId.result = 1;
        QVERIFY(!correlator.complete(stringId));

        QCOMPARE(spy.count(), 2);
        QVERIFY(!call->isFinished());
        QCOMPARE(correlator.pendingCount(), 1);
    }

    void testErrorResponseBecomesBackendError() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));

        RpcResponse response;
        response.id = call->id();
        response.error = RpcError{-32602, QStringLiteral("bad position"), QJsonValue()};
        QVERIFY(correlator.complete(response));

        QVERIFY(call->isFinished());
        QVERIFY(!call->result().has_value());
        QCOMPARE(call->result().error().kind, ErrorKind::BackendError);
        QCOMPARE(call->result().error().backendCode, -32602);
        QVERIFY(call->result().error().message.contains(QStringLiteral("bad position")));
    }

    void testTimeoutFiresOnceAfterDeadline() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        QSignalSpy timedOut(&correlator, &RequestCorrelator::requestTimedOut);

        QElapsedTimer clock;
        clock.start();
        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject(), 100));
        QSignalSpy finished(call.get(), &PendingCall::finished);

        auto result = call->wait(5000);
        const qint64 elapsed = clock.elapsed();
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Timeout);
        QVERIFY2(elapsed >= 100, qPrintable(QStringLiteral("resolved after %1 ms").arg(elapsed)));

        // A late response for the timed-out id is dropped.
        QVERIFY(!correlator.complete(okResponse(call->id(), 1)));
        QTest::qWait(150);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(timedOut.count(), 1);
        QCOMPARE(correlator.pendingCount(), 0);

        // The backend is told to stop working on it.
        const QList<RpcNotification> cancels = writer.notifications(QStringLiteral("$/cancelRequest"));
        QCOMPARE(cancels.size(), qsizetype(1));
        QCOMPARE(cancels[0].params.toObject()["id"].toInteger(), call->id());
    }

    void testPolicyPicksDeadlinePerMethodClass() {
        TimeoutPolicy policy;
        policy.queryMs = 10;
        policy.workspaceScanMs = 20;
        policy.lifecycleMs = 30;
        policy.perMethod.insert(QStringLiteral("textDocument/formatting"), 40);

        QCOMPARE(policy.timeoutFor(QStringLiteral("textDocument/hover")), 10);
        QCOMPARE(policy.timeoutFor(QStringLiteral("workspace/symbol")), 20);
        QCOMPARE(policy.timeoutFor(QStringLiteral("rust-analyzer/getFailedObligations")), 20);
        QCOMPARE(policy.timeoutFor(QStringLiteral("initialize")), 30);
        QCOMPARE(policy.timeoutFor(QStringLiteral("textDocument/formatting")), 40);
        QCOMPARE(TimeoutPolicy::classify(QStringLiteral("shutdown")), MethodClass::Lifecycle);
        QCOMPARE(TimeoutPolicy::classify(QStringLiteral("workspace/diagnostic")), MethodClass::WorkspaceScan);
        QCOMPARE(TimeoutPolicy::classify(QStringLiteral("textDocument/completion")), MethodClass::Query);
    }

    void testZeroTimeoutMeansNoDeadline() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("workspace/symbol"), QJsonObject(), 0));
        QTest::qWait(50);
        QVERIFY(!call->isFinished());
        QVERIFY(correlator.complete(okResponse(call->id(), QJsonArray())));
        QVERIFY(call->result().has_value());
    }

    void testCancelDiscardsLateResponse() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        QSignalSpy finished(call.get(), &PendingCall::finished);

        call->cancel();
        QVERIFY(call->isFinished());
        QCOMPARE(call->result().error().kind, ErrorKind::Cancelled);
        QVERIFY(!correlator.isPending(call->id()));
        QCOMPARE(writer.notifications(QStringLiteral("$/cancelRequest")).size(), qsizetype(1));

        QVERIFY(!correlator.complete(okResponse(call->id(), QStringLiteral("late"))));
        QCOMPARE(finished.count(), 1);
        QCOMPARE(call->result().error().kind, ErrorKind::Cancelled);
    }

    void testCancelOfSettledRequestIsNoop() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        QVERIFY(correlator.complete(okResponse(call->id(), 5)));

        call->cancel();
        QVERIFY(call->result().has_value());
        QCOMPARE(call->result()->toInt(), 5);
        QVERIFY(writer.notifications(QStringLiteral("$/cancelRequest")).isEmpty());
    }

    void testFailAllResolvesEveryPendingCall() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        QList<PendingCall*> calls;
        for (int i = 0; i < 4; ++i)
            calls.append(correlator.send(QStringLiteral("textDocument/references"), QJsonObject()));

        correlator.failAll(BridgeFailure::backendCrashed(QStringLiteral("gone")));
        QCOMPARE(correlator.pendingCount(), 0);
        for (PendingCall* call : calls) {
            QVERIFY(call->isFinished());
            QCOMPARE(call->result().error().kind, ErrorKind::BackendCrashed);
        }
        qDeleteAll(calls);
    }

    void testWriteFailureResolvesImmediately() {
        RecordingWriter writer;
        writer.failWrites = true;
        RequestCorrelator correlator(&writer);

        std::unique_ptr<PendingCall> call(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        QVERIFY(call->isFinished());
        QCOMPARE(call->result().error().kind, ErrorKind::BackendCrashed);
        QCOMPARE(correlator.pendingCount(), 0);
    }

    void testDestructionFailsPendingCalls() {
        RecordingWriter writer;
        std::unique_ptr<PendingCall> call;
        {
            RequestCorrelator correlator(&writer);
            call.reset(correlator.send(QStringLiteral("textDocument/hover"), QJsonObject()));
        }
        QVERIFY(call->isFinished());
        QCOMPARE(call->result().error().kind, ErrorKind::SessionTerminated);
        // Cancelling after the table is gone must not crash.
        call->cancel();
    }

    void testMappedCallShapesAndForwardsCancel() {
        RecordingWriter writer;
        RequestCorrelator correlator(&writer);
        PendingCall* raw = correlator.send(QStringLiteral("textDocument/hover"), QJsonObject());
        const qint64 id = raw->id();
        std::unique_ptr<PendingCall> mapped(raw->map([](const QJsonValue& v) -> Result<QJsonValue> {
            return QJsonValue(v.toInt() * 2);
        }));

        QVERIFY(correlator.complete(okResponse(id, 21)));
        QVERIFY(mapped->isFinished());
        QCOMPARE(mapped->result()->toInt(), 42);

        PendingCall* second = correlator.send(QStringLiteral("textDocument/hover"), QJsonObject());
        std::unique_ptr<PendingCall> secondMapped(second->map([](const QJsonValue& v) -> Result<QJsonValue> {
            return v;
        }));
        secondMapped->cancel();
        QCOMPARE(secondMapped->result().error().kind, ErrorKind::Cancelled);
        QCOMPARE(correlator.pendingCount(), 0);
    }
};

QTEST_MAIN(TestRequestCorrelator)
#include "tst_request_correlator.moc"
