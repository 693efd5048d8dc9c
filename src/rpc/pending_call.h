#pragma once
#include "protocol/ports.h"
#include <QObject>
#include <QJsonValue>
#include <functional>

// Completion handle for one asynchronous call. It resolves exactly once,
// with a value or a BridgeFailure, and then emits finished().
//
// The caller owns the handle (delete it or call deleteLater() once done).
// Deleting an unresolved handle does not cancel the backend request.
class PendingCall : public QObject {
    Q_OBJECT
public:
    using Shaper = std::function<Result<QJsonValue>(const QJsonValue&)>;
    using Callback = std::function<void(const Result<QJsonValue>&)>;

    explicit PendingCall(qint64 id, const QString& method, QObject* parent = nullptr);

    // An already-resolved failed call.
    static PendingCall* failed(const BridgeFailure& failure, const QString& method = {});
    // An already-resolved successful call.
    static PendingCall* succeeded(const QJsonValue& value, const QString& method = {});

    qint64 id() const { return m_id; }
    QString method() const { return m_method; }
    bool isFinished() const { return m_finished; }
    const Result<QJsonValue>& result() const { return m_result; }

    // Best-effort cancellation; resolves with Cancelled if still pending.
    void cancel();

    // Spins a local event loop until resolved. A timeout leaves the call pending.
    Result<QJsonValue> wait(int timeoutMs = -1);

    // Derived call resolved with shaper(value) once this one succeeds. The
    // derived call takes ownership of this one; cancelling it cancels this one.
    PendingCall* map(Shaper shaper);

    // Runs fn on completion in context's thread. If already resolved, fn is
    // queued instead of being called synchronously.
    void then(QObject* context, Callback fn);

    // Owner side. Returns false when the call was already resolved.
    bool resolve(Result<QJsonValue> result);
    void setCanceller(std::function<void()> canceller) { m_canceller = std::move(canceller); }

signals:
    void finished();

private:
    qint64 m_id;
    QString m_method;
    bool m_finished = false;
    Result<QJsonValue> m_result;
    std::function<void()> m_canceller;
};
