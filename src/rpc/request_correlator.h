#pragma once
#include "pending_call.h"
#include "protocol/ports.h"
#include "protocol/timeout_policy.h"
#include <QObject>
#include <QElapsedTimer>
#include <QHash>
#include <QPointer>
#include <QTimer>
#include <optional>

struct PendingRequest {
    qint64 id = 0;
    QString method;
    QElapsedTimer issuedAt;
    int timeoutMs = 0;
    QPointer<PendingCall> completion;
    QTimer* deadline = nullptr;
};

// Assigns request ids, keeps the table of outstanding requests and matches
// responses to them by id alone. Every entry leaves the table exactly once:
// on response, on deadline expiry, on cancel(), or through failAll().
class RequestCorrelator : public QObject {
    Q_OBJECT
public:
    explicit RequestCorrelator(IMessageWriter* writer, QObject* parent = nullptr);
    ~RequestCorrelator() override;

    void setTimeoutPolicy(const TimeoutPolicy& policy) { m_policy = policy; }
    const TimeoutPolicy& timeoutPolicy() const { return m_policy; }

    // timeoutMs < 0 selects the policy's timeout for the method.
    PendingCall* send(const QString& method, const QJsonValue& params, int timeoutMs = -1);
    VoidResult notify(const QString& method, const QJsonValue& params);

    // Returns false when no pending request matched (logged and discarded).
    bool complete(const RpcResponse& response);
    bool complete(qint64 id, Result<QJsonValue> result);

    void cancel(qint64 id);
    void failAll(const BridgeFailure& failure);

    int pendingCount() const { return m_pending.size(); }
    bool isPending(qint64 id) const { return m_pending.contains(id); }
    QList<qint64> pendingIds() const { return m_pending.keys(); }
    qint64 lastIssuedId() const { return m_nextId - 1; }

signals:
    void requestTimedOut(qint64 id, const QString& method);
    void unmatchedResponse(const QJsonValue& id);

private:
    IMessageWriter* m_writer;
    qint64 m_nextId = 1;
    QHash<qint64, PendingRequest> m_pending;
    TimeoutPolicy m_policy;

    std::optional<PendingRequest> take(qint64 id);
    void onDeadline(qint64 id);
    void sendCancelNotification(qint64 id, const QString& method);
};
